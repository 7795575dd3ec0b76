#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkvault::core {

// Every failure the upload engine reports. Callers switch on the kind.
enum class UploadError {
    SUCCESS = 0,
    INVALID_ARGUMENT,
    ALREADY_EXISTS,
    NOT_FOUND,
    UNAUTHORIZED,
    INVALID_STATE,
    CHUNK_INTEGRITY,
    TRANSIENT_STORAGE,
    INCOMPLETE,
    HASH_MISMATCH,
    RETRY_BUDGET_EXHAUSTED,
    INTERNAL
};

const char* to_string(UploadError error);

// Guidance attached to retryable failures.
struct RetryAdvice {
    std::chrono::milliseconds retry_after{0};
    uint32_t attempt = 0;
    uint32_t max_attempts = 0;
    bool exhausted = false;
};

struct UploadResult {
    UploadError error;
    std::string message;
    std::optional<RetryAdvice> retry;
    std::optional<uint64_t> suggested_chunk_size;

    UploadResult(UploadError err = UploadError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == UploadError::SUCCESS; }
    operator bool() const { return success(); }

    // True for the kinds a client is expected to resend.
    bool retryable() const {
        return error == UploadError::CHUNK_INTEGRITY || error == UploadError::TRANSIENT_STORAGE;
    }
};

}
