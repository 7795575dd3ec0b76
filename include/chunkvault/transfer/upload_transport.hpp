#pragma once

#include "chunkvault/core/result.hpp"
#include "chunkvault/transfer/session_manager.hpp"
#include <span>
#include <string>

namespace chunkvault::transfer {

// Client view of the upload service; credentials are the transport's concern.
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    virtual core::UploadResult start_session(const StartSessionRequest& request, SessionHandle& handle) = 0;
    virtual core::UploadResult get_status(const std::string& file_id, SessionStatusReport& report) = 0;
    virtual core::UploadResult ingest_chunk(const std::string& file_id, uint32_t chunk_number,
                                            std::span<const uint8_t> payload, const std::string& chunk_hash,
                                            uint32_t attempt, ChunkReceipt& receipt) = 0;
    virtual core::UploadResult complete(const std::string& file_id, const std::string& expected_hash,
                                        FinalLocation& location) = 0;
    virtual core::UploadResult cancel(const std::string& file_id) = 0;
};

}
