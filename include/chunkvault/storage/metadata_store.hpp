#pragma once

#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/upload_session.hpp"
#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace chunkvault::storage {

// Durable keyed storage for sessions and chunk records.
// Lookups that miss return NOT_FOUND; backend failures return INTERNAL.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual core::UploadResult initialize() = 0;

    // ALREADY_EXISTS if a row for file_id is present.
    virtual core::UploadResult insert_session(const UploadSession& session) = 0;

    // Overwrites any previous row for file_id.
    virtual core::UploadResult replace_session(const UploadSession& session) = 0;

    virtual core::UploadResult get_session(const std::string& file_id, UploadSession& session) = 0;

    // Only applies while the session is UPLOADING; INVALID_STATE otherwise.
    virtual core::UploadResult update_progress(const std::string& file_id,
                                               const std::set<uint32_t>& chunk_presence,
                                               std::chrono::system_clock::time_point updated_at) = 0;

    // Compare-and-swap on status. INVALID_STATE when the current status is not `from`.
    virtual core::UploadResult transition_status(const std::string& file_id,
                                                 SessionStatus from,
                                                 SessionStatus to,
                                                 const std::string& detail,
                                                 const std::string& final_path,
                                                 std::chrono::system_clock::time_point updated_at) = 0;

    virtual core::UploadResult list_sessions_idle_since(SessionStatus status,
                                                        std::chrono::system_clock::time_point cutoff,
                                                        std::vector<UploadSession>& sessions) = 0;

    virtual core::UploadResult put_chunk_record(const ChunkRecord& record) = 0;
    virtual core::UploadResult get_chunk_record(const std::string& file_id, uint32_t chunk_number,
                                                ChunkRecord& record) = 0;
    virtual core::UploadResult list_chunk_records(const std::string& file_id,
                                                  std::vector<ChunkRecord>& records) = 0;
    virtual core::UploadResult remove_chunk_record(const std::string& file_id, uint32_t chunk_number) = 0;
    virtual core::UploadResult remove_chunk_records(const std::string& file_id) = 0;
};

}
