#include "chunkvault/core/cli.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/network/upload_client.hpp"
#include "chunkvault/transfer/file_uploader.hpp"
#include "chunkvault/transfer/upload_settings.hpp"
#include <iostream>
#include <string>

using namespace chunkvault;

namespace {

int report_failure(const core::UploadResult& result) {
    std::cerr << "Error (" << core::to_string(result.error) << "): " << result.message << "\n";
    return 2;
}

int run_upload(network::UploadClient& client, const std::string& file,
               const core::CommandLineParser& parser) {
    transfer::UploadOptions options;
    options.file_id = parser.get_option("file-id");
    options.chunk_size = core::Config::instance().get_uint64("upload.default_chunk_size", options.chunk_size);
    if (parser.has_option("chunk-size")) {
        auto chunk_size = parser.get_int_option("chunk-size", 0);
        if (chunk_size <= 0) {
            std::cerr << "Error: --chunk-size must be positive\n";
            return 1;
        }
        options.chunk_size = static_cast<uint64_t>(chunk_size);
    }
    options.max_attempts = static_cast<uint32_t>(core::Config::instance().get_int("upload.max_retries", 3));

    transfer::FileUploader uploader(client);
    uploader.set_progress_callback([](const transfer::ChunkReceipt& receipt) {
        std::cout << "\rchunk " << receipt.chunk_number << "  "
                  << receipt.uploaded_count << "/" << receipt.total_chunks
                  << " (" << static_cast<int>(receipt.progress_percent) << "%)" << std::flush;
    });

    transfer::UploadReport report;
    auto result = uploader.upload(file, options, report);
    std::cout << "\n";
    if (!result) {
        return report_failure(result);
    }

    std::cout << "file_id:   " << report.file_id << "\n"
              << "size:      " << core::utils::StringUtils::format_bytes(report.location.final_size) << "\n"
              << "sha256:    " << report.location.final_hash << "\n"
              << "stored at: " << report.location.path.string() << "\n"
              << "chunks:    " << report.chunks_sent << " sent, " << report.retries << " retried"
              << (report.resumed ? " (resumed)" : "") << "\n";
    if (report.suggested_chunk_size != 0 && report.suggested_chunk_size != options.chunk_size) {
        std::cout << "hint:      server suggests "
                  << core::utils::StringUtils::format_bytes(report.suggested_chunk_size) << " chunks\n";
    }
    return 0;
}

int run_status(network::UploadClient& client, const std::string& file_id) {
    transfer::SessionStatusReport report;
    auto result = client.get_status(file_id, report);
    if (!result) {
        return report_failure(result);
    }

    std::cout << "file_id:   " << report.file_id << "\n"
              << "filename:  " << report.filename << "\n"
              << "status:    " << storage::to_string(report.status) << "\n"
              << "progress:  " << report.uploaded_count << "/" << report.total_chunks
              << " (" << report.progress_percent << "%)\n";

    if (!report.missing_indices.empty()) {
        std::vector<std::string> missing;
        for (auto index : report.missing_indices) {
            missing.push_back(std::to_string(index));
        }
        std::cout << "missing:   " << core::utils::StringUtils::join(missing, ",")
                  << (report.missing_truncated ? ",..." : "") << "\n";
    }
    if (!report.detail.empty()) {
        std::cout << "detail:    " << report.detail << "\n";
    }
    if (!report.final_path.empty()) {
        std::cout << "stored at: " << report.final_path << "\n";
    }
    std::cout << "chunk size hint: " << core::utils::StringUtils::format_bytes(report.suggested_chunk_size)
              << ", concurrency hint: " << report.recommended_concurrency << "\n";
    return 0;
}

int run_cancel(network::UploadClient& client, const std::string& file_id) {
    auto result = client.cancel(file_id);
    if (!result) {
        return report_failure(result);
    }
    std::cout << "cancelled " << file_id << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    core::CommandLineParser parser("chunkvault-upload");
    parser.set_usage("chunkvault-upload [options] upload <file> | status <file_id> | cancel <file_id>");
    parser.add_option("H", "host", "Server host", true, "127.0.0.1");
    parser.add_option("p", "port", "Server port", true);
    parser.add_option("t", "token", "Auth token (or CHUNKVAULT_TOKEN)", true);
    parser.add_option("", "file-id", "Upload identifier; defaults to a prefix of the file hash", true);
    parser.add_option("s", "chunk-size", "Chunk size in bytes", true);

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = core::Config::instance();
    config.set_defaults();
    if (parser.has_option("config")) {
        if (!config.load_from_file(core::utils::FileUtils::expand_home(parser.get_option("config")).string())) {
            std::cerr << "Error: cannot read config file " << parser.get_option("config") << "\n";
            return 1;
        }
    }
    config.load_from_environment();

    core::Logger::initialize("chunkvault-upload.log",
                             parser.has_option("verbose") ? core::LogLevel::Debug : core::LogLevel::Warn);

    auto& args = parser.get_positional_args();
    if (args.size() != 2) {
        parser.print_help();
        return 1;
    }

    if (!crypto::initialize()) {
        std::cerr << "Error: failed to initialize crypto library\n";
        return 1;
    }

    network::ClientOptions options;
    options.host = parser.get_option("host", "127.0.0.1");
    options.port = static_cast<std::uint16_t>(
        parser.has_option("port") ? parser.get_int_option("port", 9400) : config.get_int("server.port", 9400));
    options.auth_token = parser.get_option("token", config.get_string("client.token"));
    options.timeout = transfer::UploadSettings::from_config(config).chunk_timeout;
    options.max_message_size = config.get_uint64("server.max_message_size", options.max_message_size);

    network::UploadClient client(options);

    const auto& command = args[0];
    int exit_code = 1;
    if (command == "upload") {
        exit_code = run_upload(client, args[1], parser);
    } else if (command == "status") {
        exit_code = run_status(client, args[1]);
    } else if (command == "cancel") {
        exit_code = run_cancel(client, args[1]);
    } else {
        std::cerr << "Error: unknown command " << command << "\n\n";
        parser.print_help();
    }

    core::Logger::shutdown();
    return exit_code;
}
