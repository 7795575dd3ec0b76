#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkvault::storage {

// UPLOADING is the only initial state; the other three are terminal.
enum class SessionStatus {
    UPLOADING,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(SessionStatus status);
std::optional<SessionStatus> status_from_string(const std::string& value);

inline bool is_terminal(SessionStatus status) {
    return status != SessionStatus::UPLOADING;
}

struct UploadSession {
    std::string file_id;
    std::string owner_id;
    std::string filename;
    uint64_t declared_size = 0;
    uint32_t total_chunks = 0;
    std::string expected_hash;

    std::set<uint32_t> chunk_presence;
    SessionStatus status = SessionStatus::UPLOADING;
    std::string detail;
    std::string final_path;

    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    uint32_t uploaded_count() const { return static_cast<uint32_t>(chunk_presence.size()); }
    bool is_complete() const { return uploaded_count() == total_chunks; }

    // Ascending indices not yet present, at most `limit` of them.
    std::vector<uint32_t> missing_chunks(size_t limit = SIZE_MAX) const;

    double progress_percent() const;

    // Same file_id, owner and declared parameters.
    bool same_parameters(const UploadSession& other) const;
};

struct ChunkRecord {
    std::string file_id;
    uint32_t chunk_number = 0;
    uint64_t byte_length = 0;
    std::string content_hash;
    std::chrono::system_clock::time_point written_at;
};

}
