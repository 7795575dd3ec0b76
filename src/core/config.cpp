#include "chunkvault/core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>
#include <vector>

namespace chunkvault::core {

namespace {
    const std::vector<std::pair<const char*, const char*>> environment_keys = {
        {"CHUNKVAULT_MIN_CHUNK_SIZE", "upload.min_chunk_size"},
        {"CHUNKVAULT_DEFAULT_CHUNK_SIZE", "upload.default_chunk_size"},
        {"CHUNKVAULT_MAX_CHUNK_SIZE", "upload.max_chunk_size"},
        {"CHUNKVAULT_MAX_RETRIES", "upload.max_retries"},
        {"CHUNKVAULT_RETRY_BASE_DELAY_MS", "upload.retry_base_delay_ms"},
        {"CHUNKVAULT_RETRY_MAX_DELAY_MS", "upload.retry_max_delay_ms"},
        {"CHUNKVAULT_CHUNK_TIMEOUT", "upload.chunk_timeout_seconds"},
        {"CHUNKVAULT_CONCURRENT_UPLOADS", "upload.concurrent_uploads"},
        {"CHUNKVAULT_SESSION_TTL_HOURS", "upload.session_ttl_hours"},
        {"CHUNKVAULT_REAPER_INTERVAL_MINUTES", "upload.reaper_interval_minutes"},
        {"CHUNKVAULT_STATUS_PREVIEW_LIMIT", "upload.status_preview_limit"},
        {"CHUNKVAULT_DATA_DIR", "storage.data_dir"},
        {"CHUNKVAULT_PORT", "server.port"},
        {"CHUNKVAULT_WORKERS", "server.workers"},
        {"CHUNKVAULT_LOG_LEVEL", "log.level"},
        {"CHUNKVAULT_LOG_FILE", "log.file"},
        {"CHUNKVAULT_AUTH_TOKENS", "auth.tokens"},
        {"CHUNKVAULT_TOKEN", "client.token"},
    };
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# ChunkVault Configuration\n\n";

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return file.good();
}

size_t Config::load_from_environment() {
    size_t applied = 0;
    for (const auto& [variable, key] : environment_keys) {
        const char* value = std::getenv(variable);
        if (value != nullptr) {
            set(key, trim(value));
            ++applied;
        }
    }
    return applied;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

uint64_t Config::get_uint64(const std::string& key, uint64_t default_value) const {
    auto raw = get(key);
    if (!raw || raw->empty() || raw->front() == '-') return default_value;
    auto value = get_as<uint64_t>(key);
    return value ? *value : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_["upload.min_chunk_size"] = "262144";
    values_["upload.default_chunk_size"] = "1048576";
    values_["upload.max_chunk_size"] = "2097152";
    values_["upload.max_retries"] = "3";
    values_["upload.retry_base_delay_ms"] = "1000";
    values_["upload.retry_max_delay_ms"] = "30000";
    values_["upload.chunk_timeout_seconds"] = "30";
    values_["upload.concurrent_uploads"] = "3";
    values_["upload.session_ttl_hours"] = "24";
    values_["upload.reaper_interval_minutes"] = "60";
    values_["upload.status_preview_limit"] = "100";
    values_["upload.sample_window"] = "20";
    values_["upload.success_threshold"] = "0.8";
    values_["upload.fast_throughput_bps"] = "500000";
    values_["server.port"] = "9400";
    values_["server.workers"] = "4";
    values_["server.max_message_size"] = "16777216";
    values_["storage.data_dir"] = "./chunkvault-data";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkvault.log";
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }

    return std::string(start, end);
}

}
