#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <mutex>
#include <vector>

namespace chunkvault::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
    std::mutex logger_mutex;

    std::shared_ptr<spdlog::logger> fallback_logger() {
        static auto fallback = [] {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            auto logger = std::make_shared<spdlog::logger>("chunkvault-fallback", sink);
            logger->set_level(spdlog::level::info);
            return logger;
        }();
        return fallback;
    }
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1048576 * 5, 3);
    file_sink->set_level(spdlog::level::trace);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    if (logger_) {
        spdlog::drop(logger_->name());
    }
    logger_ = std::make_shared<spdlog::logger>("chunkvault", sinks.begin(), sinks.end());
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    logger_->info("Logger initialized with level: {}",
                  spdlog::level::to_string_view(static_cast<spdlog::level::level_enum>(level)));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (logger_) {
        logger_->info("Shutting down logger");
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    return logger_ ? logger_ : fallback_logger();
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(name);

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

}
