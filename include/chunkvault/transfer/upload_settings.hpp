#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkvault::core {
class Config;
}

namespace chunkvault::transfer {

// Tunables of the upload engine, read once from Config.
struct UploadSettings {
    uint64_t min_chunk_size = 262144;        // 256KB
    uint64_t default_chunk_size = 1048576;   // 1MB
    uint64_t max_chunk_size = 2097152;       // 2MB

    uint32_t max_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_max_delay{30000};
    std::chrono::seconds chunk_timeout{30};

    uint32_t concurrent_uploads = 3;
    std::chrono::hours session_ttl{24};
    std::chrono::minutes reaper_interval{60};
    size_t status_preview_limit = 100;

    size_t sample_window = 20;
    double success_threshold = 0.8;
    uint64_t fast_throughput_bps = 500000;

    static UploadSettings from_config(const core::Config& config);

    bool validate(std::string& error) const;
};

}
