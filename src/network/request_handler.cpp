#include "chunkvault/network/request_handler.hpp"
#include "chunkvault/core/logger.hpp"
#include <stdexcept>

namespace chunkvault::network {

using core::UploadError;
using core::UploadResult;

namespace {
    template<MessagePayload T>
    Response make_response(MessageType type, const T& message) {
        return Response{type, message.serialize()};
    }

    UploadResult unauthorized() {
        return UploadResult(UploadError::UNAUTHORIZED, "Invalid or missing auth token");
    }
}

RequestHandler::RequestHandler(std::shared_ptr<transfer::SessionManager> sessions,
                               std::shared_ptr<const core::IdentityProvider> identity)
    : sessions_(std::move(sessions))
    , identity_(std::move(identity)) {
}

Response RequestHandler::handle(const MessageHeader& header, std::span<const std::uint8_t> payload,
                                std::chrono::milliseconds transfer_time) {
    try {
        switch (header.type) {
            case MessageType::START_SESSION:
                return start_session(payload, header.message_id);
            case MessageType::INGEST_CHUNK:
                return ingest_chunk(payload, header.message_id, transfer_time);
            case MessageType::GET_STATUS:
                return get_status(payload, header.message_id);
            case MessageType::COMPLETE:
                return complete(payload, header.message_id);
            case MessageType::CANCEL:
                return cancel(payload, header.message_id);
            default:
                LOG_WARN("Unsupported message type 0x{:02x}", static_cast<int>(header.type));
                return error_response(
                    UploadResult(UploadError::INVALID_ARGUMENT, "Unsupported message type"),
                    header.message_id);
        }
    } catch (const std::runtime_error& e) {
        LOG_WARN("Malformed {} request: {}", to_string(header.type), e.what());
        return error_response(UploadResult(UploadError::INVALID_ARGUMENT,
                                           std::string("Malformed request: ") + e.what()),
                              header.message_id);
    }
}

Response RequestHandler::start_session(std::span<const std::uint8_t> payload, std::uint64_t request_id) {
    auto msg = StartSessionMessage::deserialize(payload);

    core::Principal principal;
    if (!authenticate(msg.auth_token, principal)) {
        return error_response(unauthorized(), request_id);
    }

    transfer::StartSessionRequest request;
    request.file_id = msg.file_id;
    request.filename = msg.filename;
    request.total_chunks = msg.total_chunks;
    request.declared_size = msg.declared_size;
    request.expected_hash = msg.expected_hash;

    transfer::SessionHandle handle;
    auto result = sessions_->start_session(principal, request, handle);
    if (!result) {
        return error_response(result, request_id);
    }

    SessionStartedMessage reply;
    reply.file_id = handle.file_id;
    reply.status = static_cast<std::uint8_t>(handle.status);
    reply.total_chunks = handle.total_chunks;
    reply.uploaded_count = handle.uploaded_count;
    reply.suggested_chunk_size = handle.suggested_chunk_size;
    reply.resumed = handle.resumed;
    return make_response(MessageType::SESSION_STARTED, reply);
}

Response RequestHandler::ingest_chunk(std::span<const std::uint8_t> payload, std::uint64_t request_id,
                                      std::chrono::milliseconds transfer_time) {
    auto msg = IngestChunkMessage::deserialize(payload);

    core::Principal principal;
    if (!authenticate(msg.auth_token, principal)) {
        return error_response(unauthorized(), request_id);
    }

    transfer::ChunkUpload upload;
    upload.file_id = msg.file_id;
    upload.chunk_number = msg.chunk_number;
    upload.payload = msg.data;
    upload.claimed_hash = msg.chunk_hash;
    upload.attempt = msg.attempt;
    upload.transfer_time = transfer_time;

    transfer::ChunkReceipt receipt;
    auto result = sessions_->ingest_chunk(principal, upload, receipt);
    if (!result) {
        return error_response(result, request_id);
    }

    ChunkReceiptMessage reply;
    reply.chunk_number = receipt.chunk_number;
    reply.duplicate = receipt.duplicate;
    reply.uploaded_count = receipt.uploaded_count;
    reply.total_chunks = receipt.total_chunks;
    reply.progress_percent = receipt.progress_percent;
    reply.suggested_chunk_size = receipt.suggested_chunk_size;
    return make_response(MessageType::CHUNK_RECEIPT, reply);
}

Response RequestHandler::get_status(std::span<const std::uint8_t> payload, std::uint64_t request_id) {
    auto msg = FileRequestMessage::deserialize(payload);

    core::Principal principal;
    if (!authenticate(msg.auth_token, principal)) {
        return error_response(unauthorized(), request_id);
    }

    transfer::SessionStatusReport report;
    auto result = sessions_->get_status(principal, msg.file_id, report);
    if (!result) {
        return error_response(result, request_id);
    }

    StatusReportMessage reply;
    reply.file_id = report.file_id;
    reply.filename = report.filename;
    reply.status = static_cast<std::uint8_t>(report.status);
    reply.uploaded_count = report.uploaded_count;
    reply.total_chunks = report.total_chunks;
    reply.missing_indices = std::move(report.missing_indices);
    reply.missing_truncated = report.missing_truncated;
    reply.progress_percent = report.progress_percent;
    reply.suggested_chunk_size = report.suggested_chunk_size;
    reply.recommended_concurrency = report.recommended_concurrency;
    reply.detail = report.detail;
    reply.final_path = report.final_path;
    return make_response(MessageType::STATUS_REPORT, reply);
}

Response RequestHandler::complete(std::span<const std::uint8_t> payload, std::uint64_t request_id) {
    auto msg = CompleteMessage::deserialize(payload);

    core::Principal principal;
    if (!authenticate(msg.auth_token, principal)) {
        return error_response(unauthorized(), request_id);
    }

    transfer::FinalLocation location;
    auto result = sessions_->complete(principal, msg.file_id, msg.expected_hash, location);
    if (!result) {
        return error_response(result, request_id);
    }

    CompletedMessage reply;
    reply.final_path = location.path.string();
    reply.final_size = location.final_size;
    reply.final_hash = location.final_hash;
    return make_response(MessageType::COMPLETED, reply);
}

Response RequestHandler::cancel(std::span<const std::uint8_t> payload, std::uint64_t request_id) {
    auto msg = FileRequestMessage::deserialize(payload);

    core::Principal principal;
    if (!authenticate(msg.auth_token, principal)) {
        return error_response(unauthorized(), request_id);
    }

    auto result = sessions_->cancel(principal, msg.file_id);
    if (!result) {
        return error_response(result, request_id);
    }

    CancelledMessage reply;
    reply.file_id = msg.file_id;
    return make_response(MessageType::CANCELLED, reply);
}

bool RequestHandler::authenticate(const std::string& token, core::Principal& principal) const {
    auto authenticated = identity_->authenticate(token);
    if (!authenticated) {
        LOG_WARN("Rejected request with unknown auth token");
        return false;
    }
    principal = std::move(*authenticated);
    return true;
}

Response RequestHandler::error_response(const UploadResult& result, std::uint64_t request_id) {
    return make_response(MessageType::ERROR_RESPONSE, make_error_message(result, request_id));
}

}
