#pragma once

#include "chunkvault/transfer/upload_settings.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkvault::transfer {

struct PerformanceSample {
    uint64_t chunk_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    bool success = false;

    // Bytes per second; elapsed below 1ms counts as 1ms.
    double throughput_bps() const;
};

// Per-session rolling statistics. Suggestions are advisory and recomputed
// once per recorded sample, so reads have no side effects.
class NetworkMonitor {
public:
    static constexpr size_t MIN_SAMPLES = 3;
    static constexpr size_t RECENT_WINDOW = 10;
    static constexpr double GROWTH_RATIO = 0.9;
    static constexpr double GROWTH_FACTOR = 1.25;
    static constexpr size_t CONCURRENCY_WINDOW = 5;
    static constexpr double CONCURRENCY_SUCCESS_RATIO = 0.8;
    static constexpr double CONCURRENCY_THROUGHPUT_BPS = 1024.0 * 1024.0;

    explicit NetworkMonitor(const UploadSettings& settings);

    void record(const std::string& file_id, const PerformanceSample& sample);

    uint64_t suggest_chunk_size(const std::string& file_id) const;

    // Parallel chunk streams the client may use for this session.
    uint32_t recommended_concurrency(const std::string& file_id) const;

    size_t sample_count(const std::string& file_id) const;
    size_t session_count() const;

    void end_session(const std::string& file_id);

private:
    struct SessionData {
        std::deque<PerformanceSample> samples;
        uint64_t suggestion;
    };

    uint64_t recompute(const SessionData& session) const;

    UploadSettings settings_;
    std::unordered_map<std::string, SessionData> sessions_;
    mutable std::mutex mutex_;
};

}
