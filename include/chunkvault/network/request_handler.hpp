#pragma once

#include "chunkvault/core/identity.hpp"
#include "chunkvault/network/protocol.hpp"
#include "chunkvault/transfer/session_manager.hpp"
#include <chrono>
#include <memory>
#include <span>
#include <vector>

namespace chunkvault::network {

struct Response {
    MessageType type = MessageType::ERROR_RESPONSE;
    std::vector<std::uint8_t> payload;
};

// Decodes one request, authenticates its token and dispatches it to the SessionManager.
// Never throws; every failure becomes an ERROR_RESPONSE.
class RequestHandler {
public:
    RequestHandler(std::shared_ptr<transfer::SessionManager> sessions,
                   std::shared_ptr<const core::IdentityProvider> identity);

    Response handle(const MessageHeader& header, std::span<const std::uint8_t> payload,
                    std::chrono::milliseconds transfer_time = std::chrono::milliseconds(0));

private:
    Response start_session(std::span<const std::uint8_t> payload, std::uint64_t request_id);
    Response ingest_chunk(std::span<const std::uint8_t> payload, std::uint64_t request_id,
                          std::chrono::milliseconds transfer_time);
    Response get_status(std::span<const std::uint8_t> payload, std::uint64_t request_id);
    Response complete(std::span<const std::uint8_t> payload, std::uint64_t request_id);
    Response cancel(std::span<const std::uint8_t> payload, std::uint64_t request_id);

    bool authenticate(const std::string& token, core::Principal& principal) const;

    static Response error_response(const core::UploadResult& result, std::uint64_t request_id);

    std::shared_ptr<transfer::SessionManager> sessions_;
    std::shared_ptr<const core::IdentityProvider> identity_;
};

}
