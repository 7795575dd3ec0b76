#include "chunkvault/transfer/network_monitor.hpp"
#include "chunkvault/core/logger.hpp"
#include <algorithm>

namespace chunkvault::transfer {

double PerformanceSample::throughput_bps() const {
    auto ms = std::max<int64_t>(elapsed.count(), 1);
    return static_cast<double>(chunk_bytes) * 1000.0 / static_cast<double>(ms);
}

NetworkMonitor::NetworkMonitor(const UploadSettings& settings)
    : settings_(settings) {
}

void NetworkMonitor::record(const std::string& file_id, const PerformanceSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = sessions_.try_emplace(file_id);
    auto& session = it->second;
    if (inserted) {
        session.suggestion = settings_.default_chunk_size;
    }

    session.samples.push_back(sample);
    while (session.samples.size() > settings_.sample_window) {
        session.samples.pop_front();
    }

    auto previous = session.suggestion;
    session.suggestion = recompute(session);
    if (session.suggestion != previous) {
        LOG_DEBUG("Chunk size suggestion for {} changed {} -> {}", file_id, previous, session.suggestion);
    }
}

uint64_t NetworkMonitor::suggest_chunk_size(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(file_id);
    if (it == sessions_.end()) {
        return settings_.default_chunk_size;
    }
    return it->second.suggestion;
}

uint32_t NetworkMonitor::recommended_concurrency(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(file_id);
    if (it == sessions_.end() || it->second.samples.size() < CONCURRENCY_WINDOW) {
        return 1;
    }

    const auto& samples = it->second.samples;
    size_t successes = 0;
    double throughput = 0.0;
    for (auto sample = samples.end() - static_cast<std::ptrdiff_t>(CONCURRENCY_WINDOW); sample != samples.end(); ++sample) {
        if (sample->success) {
            ++successes;
            throughput += sample->throughput_bps();
        }
    }

    double success_ratio = static_cast<double>(successes) / CONCURRENCY_WINDOW;
    double average = successes > 0 ? throughput / static_cast<double>(successes) : 0.0;

    if (success_ratio > CONCURRENCY_SUCCESS_RATIO && average > CONCURRENCY_THROUGHPUT_BPS) {
        return settings_.concurrent_uploads;
    }
    return 1;
}

size_t NetworkMonitor::sample_count(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(file_id);
    return it == sessions_.end() ? 0 : it->second.samples.size();
}

size_t NetworkMonitor::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void NetworkMonitor::end_session(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(file_id);
}

uint64_t NetworkMonitor::recompute(const SessionData& session) const {
    const auto& samples = session.samples;
    if (samples.size() < MIN_SAMPLES) {
        return session.suggestion;
    }

    size_t window = std::min(samples.size(), RECENT_WINDOW);
    size_t successes = 0;
    double throughput = 0.0;
    for (auto sample = samples.end() - static_cast<std::ptrdiff_t>(window); sample != samples.end(); ++sample) {
        if (sample->success) {
            ++successes;
            throughput += sample->throughput_bps();
        }
    }

    double success_ratio = static_cast<double>(successes) / static_cast<double>(window);

    if (success_ratio < settings_.success_threshold) {
        return std::max(settings_.min_chunk_size, session.suggestion / 2);
    }

    double average = successes > 0 ? throughput / static_cast<double>(successes) : 0.0;
    if (success_ratio >= GROWTH_RATIO && average > static_cast<double>(settings_.fast_throughput_bps)) {
        auto grown = static_cast<uint64_t>(static_cast<double>(session.suggestion) * GROWTH_FACTOR);
        return std::min(settings_.max_chunk_size, grown);
    }

    return session.suggestion;
}

}
