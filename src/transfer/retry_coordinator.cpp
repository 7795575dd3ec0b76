#include "chunkvault/transfer/retry_coordinator.hpp"
#include <algorithm>

namespace chunkvault::transfer {

RetryCoordinator::RetryCoordinator(std::chrono::milliseconds base_delay,
                                   std::chrono::milliseconds max_delay,
                                   uint32_t max_attempts)
    : base_delay_(base_delay)
    , max_delay_(std::max(max_delay, base_delay))
    , max_attempts_(std::max<uint32_t>(max_attempts, 1)) {
}

RetryCoordinator::RetryCoordinator(const UploadSettings& settings)
    : RetryCoordinator(settings.retry_base_delay, settings.retry_max_delay, settings.max_attempts) {
}

std::chrono::milliseconds RetryCoordinator::backoff(uint32_t attempt) const {
    uint32_t exponent = attempt > 0 ? attempt - 1 : 0;

    auto delay = base_delay_;
    for (uint32_t i = 0; i < exponent && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

core::RetryAdvice RetryCoordinator::advise(uint32_t attempt) const {
    core::RetryAdvice advice;
    advice.attempt = std::max<uint32_t>(attempt, 1);
    advice.max_attempts = max_attempts_;
    advice.exhausted = exhausted(advice.attempt);
    advice.retry_after = advice.exhausted ? std::chrono::milliseconds(0) : backoff(advice.attempt);
    return advice;
}

}
