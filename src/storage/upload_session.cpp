#include "chunkvault/storage/upload_session.hpp"
#include "chunkvault/crypto/hash.hpp"

namespace chunkvault::storage {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::UPLOADING: return "uploading";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::FAILED: return "failed";
        case SessionStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::optional<SessionStatus> status_from_string(const std::string& value) {
    if (value == "uploading") return SessionStatus::UPLOADING;
    if (value == "completed") return SessionStatus::COMPLETED;
    if (value == "failed") return SessionStatus::FAILED;
    if (value == "cancelled") return SessionStatus::CANCELLED;
    return std::nullopt;
}

std::vector<uint32_t> UploadSession::missing_chunks(size_t limit) const {
    std::vector<uint32_t> missing;
    auto present = chunk_presence.begin();

    for (uint32_t index = 0; index < total_chunks && missing.size() < limit; ++index) {
        while (present != chunk_presence.end() && *present < index) {
            ++present;
        }
        if (present == chunk_presence.end() || *present != index) {
            missing.push_back(index);
        }
    }

    return missing;
}

double UploadSession::progress_percent() const {
    if (total_chunks == 0) {
        return 0.0;
    }
    return static_cast<double>(uploaded_count()) * 100.0 / static_cast<double>(total_chunks);
}

bool UploadSession::same_parameters(const UploadSession& other) const {
    return file_id == other.file_id &&
           owner_id == other.owner_id &&
           filename == other.filename &&
           declared_size == other.declared_size &&
           total_chunks == other.total_chunks &&
           crypto::hash_utils::digests_equal(expected_hash, other.expected_hash);
}

}
