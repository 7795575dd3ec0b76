#pragma once

#include "chunkvault/core/result.hpp"
#include "chunkvault/transfer/upload_settings.hpp"
#include <chrono>
#include <cstdint>

namespace chunkvault::transfer {

// Exponential backoff policy. Attempts are 1-based and reported by the client;
// nothing is counted server-side.
class RetryCoordinator {
public:
    RetryCoordinator(std::chrono::milliseconds base_delay,
                     std::chrono::milliseconds max_delay,
                     uint32_t max_attempts);
    explicit RetryCoordinator(const UploadSettings& settings);

    // min(base * 2^(attempt-1), cap)
    std::chrono::milliseconds backoff(uint32_t attempt) const;

    bool exhausted(uint32_t attempt) const { return attempt >= max_attempts_; }

    core::RetryAdvice advise(uint32_t attempt) const;

    uint32_t max_attempts() const { return max_attempts_; }

private:
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    uint32_t max_attempts_;
};

}
