#include "chunkvault/core/result.hpp"

namespace chunkvault::core {

const char* to_string(UploadError error) {
    switch (error) {
        case UploadError::SUCCESS: return "success";
        case UploadError::INVALID_ARGUMENT: return "invalid_argument";
        case UploadError::ALREADY_EXISTS: return "already_exists";
        case UploadError::NOT_FOUND: return "not_found";
        case UploadError::UNAUTHORIZED: return "unauthorized";
        case UploadError::INVALID_STATE: return "invalid_state";
        case UploadError::CHUNK_INTEGRITY: return "chunk_integrity";
        case UploadError::TRANSIENT_STORAGE: return "transient_storage";
        case UploadError::INCOMPLETE: return "incomplete";
        case UploadError::HASH_MISMATCH: return "hash_mismatch";
        case UploadError::RETRY_BUDGET_EXHAUSTED: return "retry_budget_exhausted";
        case UploadError::INTERNAL: return "internal";
    }
    return "unknown";
}

}
