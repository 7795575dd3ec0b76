#include "chunkvault/network/upload_client.hpp"
#include "chunkvault/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <array>

namespace chunkvault::network {

using core::UploadError;
using core::UploadResult;

namespace {
    UploadResult transport_error(const std::string& what) {
        return UploadResult(UploadError::INTERNAL, "Transport error: " + what);
    }

    storage::SessionStatus decode_status(std::uint8_t value) {
        if (value > static_cast<std::uint8_t>(storage::SessionStatus::CANCELLED)) {
            throw std::runtime_error("Unknown session status " + std::to_string(value));
        }
        return static_cast<storage::SessionStatus>(value);
    }
}

UploadClient::UploadClient(ClientOptions options)
    : options_(std::move(options))
    , io_context_()
    , socket_(io_context_)
    , next_message_id_(1) {
}

UploadClient::~UploadClient() {
    disconnect();
}

bool UploadClient::run_with_timeout() {
    io_context_.restart();
    io_context_.run_for(options_.timeout);

    if (!io_context_.stopped()) {
        // Timed out: cancel outstanding operations and let their handlers run.
        boost::system::error_code ec;
        socket_.close(ec);
        io_context_.run();
        return false;
    }
    return true;
}

bool UploadClient::connect() {
    if (is_connected()) {
        return true;
    }

    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec) {
        LOG_ERROR("Cannot resolve {}: {}", options_.host, ec.message());
        return false;
    }

    boost::system::error_code connect_ec = boost::asio::error::would_block;
    boost::asio::async_connect(socket_, endpoints,
        [&connect_ec](const boost::system::error_code& result, const tcp::endpoint&) {
            connect_ec = result;
        });

    if (!run_with_timeout()) {
        LOG_ERROR("Connection to {}:{} timed out", options_.host, options_.port);
        return false;
    }

    if (connect_ec) {
        LOG_ERROR("Connection to {}:{} failed: {}", options_.host, options_.port, connect_ec.message());
        socket_.close(ec);
        return false;
    }

    LOG_DEBUG("Connected to {}:{}", options_.host, options_.port);
    return true;
}

void UploadClient::disconnect() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

UploadResult UploadClient::round_trip(MessageType request_type, const std::vector<std::uint8_t>& payload,
                                      MessageType reply_type, std::vector<std::uint8_t>& reply) {
    if (!connect()) {
        return transport_error("cannot connect to " + options_.host + ":" + std::to_string(options_.port));
    }

    auto message_id = next_message_id_++;
    auto frame = encode_frame(request_type, message_id, payload);

    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> header_buffer{};
    MessageHeader header;
    boost::system::error_code ec = boost::asio::error::would_block;
    std::string failure;

    boost::asio::async_write(socket_, boost::asio::buffer(frame),
        [&](const boost::system::error_code& write_ec, std::size_t) {
            if (write_ec) {
                ec = write_ec;
                return;
            }
            boost::asio::async_read(socket_, boost::asio::buffer(header_buffer),
                [&](const boost::system::error_code& header_ec, std::size_t) {
                    if (header_ec) {
                        ec = header_ec;
                        return;
                    }
                    try {
                        header = MessageHeader::deserialize(header_buffer);
                    } catch (const std::runtime_error& e) {
                        failure = e.what();
                        ec = boost::asio::error::invalid_argument;
                        return;
                    }
                    if (!header.is_valid() || header.payload_size > options_.max_message_size) {
                        failure = "invalid response header";
                        ec = boost::asio::error::invalid_argument;
                        return;
                    }
                    reply.resize(header.payload_size);
                    boost::asio::async_read(socket_, boost::asio::buffer(reply),
                        [&](const boost::system::error_code& payload_ec, std::size_t) {
                            ec = payload_ec;
                        });
                });
        });

    if (!run_with_timeout()) {
        disconnect();
        return transport_error(std::string("request ") + to_string(request_type) + " timed out");
    }

    if (ec) {
        disconnect();
        return transport_error(failure.empty() ? ec.message() : failure);
    }

    if (!header.verify_checksum(reply)) {
        disconnect();
        return transport_error("response checksum mismatch");
    }

    if (header.message_id != message_id) {
        disconnect();
        return transport_error("response does not match request");
    }

    if (header.type == MessageType::ERROR_RESPONSE) {
        try {
            return result_from_error(ErrorMessage::deserialize(reply));
        } catch (const std::runtime_error& e) {
            return transport_error(std::string("malformed error response: ") + e.what());
        }
    }

    if (header.type != reply_type) {
        return transport_error(std::string("unexpected reply ") + to_string(header.type));
    }

    return UploadResult();
}

UploadResult UploadClient::start_session(const transfer::StartSessionRequest& request,
                                         transfer::SessionHandle& handle) {
    StartSessionMessage msg;
    msg.auth_token = options_.auth_token;
    msg.file_id = request.file_id;
    msg.filename = request.filename;
    msg.total_chunks = request.total_chunks;
    msg.declared_size = request.declared_size;
    msg.expected_hash = request.expected_hash;

    std::vector<std::uint8_t> reply;
    auto result = round_trip(MessageType::START_SESSION, msg.serialize(), MessageType::SESSION_STARTED, reply);
    if (!result) {
        return result;
    }

    try {
        auto started = SessionStartedMessage::deserialize(reply);
        handle.file_id = started.file_id;
        handle.status = decode_status(started.status);
        handle.total_chunks = started.total_chunks;
        handle.uploaded_count = started.uploaded_count;
        handle.suggested_chunk_size = started.suggested_chunk_size;
        handle.resumed = started.resumed;
    } catch (const std::runtime_error& e) {
        return transport_error(e.what());
    }
    return result;
}

UploadResult UploadClient::get_status(const std::string& file_id, transfer::SessionStatusReport& report) {
    FileRequestMessage msg;
    msg.auth_token = options_.auth_token;
    msg.file_id = file_id;

    std::vector<std::uint8_t> reply;
    auto result = round_trip(MessageType::GET_STATUS, msg.serialize(), MessageType::STATUS_REPORT, reply);
    if (!result) {
        return result;
    }

    try {
        auto status = StatusReportMessage::deserialize(reply);
        report.file_id = status.file_id;
        report.filename = status.filename;
        report.status = decode_status(status.status);
        report.uploaded_count = status.uploaded_count;
        report.total_chunks = status.total_chunks;
        report.missing_indices = std::move(status.missing_indices);
        report.missing_truncated = status.missing_truncated;
        report.progress_percent = status.progress_percent;
        report.suggested_chunk_size = status.suggested_chunk_size;
        report.recommended_concurrency = status.recommended_concurrency;
        report.detail = status.detail;
        report.final_path = status.final_path;
    } catch (const std::runtime_error& e) {
        return transport_error(e.what());
    }
    return result;
}

UploadResult UploadClient::ingest_chunk(const std::string& file_id, uint32_t chunk_number,
                                        std::span<const uint8_t> payload, const std::string& chunk_hash,
                                        uint32_t attempt, transfer::ChunkReceipt& receipt) {
    IngestChunkMessage msg;
    msg.auth_token = options_.auth_token;
    msg.file_id = file_id;
    msg.chunk_number = chunk_number;
    msg.attempt = attempt;
    msg.chunk_hash = chunk_hash;
    msg.data.assign(payload.begin(), payload.end());

    std::vector<std::uint8_t> reply;
    auto result = round_trip(MessageType::INGEST_CHUNK, msg.serialize(), MessageType::CHUNK_RECEIPT, reply);
    if (!result) {
        return result;
    }

    try {
        auto ack = ChunkReceiptMessage::deserialize(reply);
        receipt.chunk_number = ack.chunk_number;
        receipt.duplicate = ack.duplicate;
        receipt.uploaded_count = ack.uploaded_count;
        receipt.total_chunks = ack.total_chunks;
        receipt.progress_percent = ack.progress_percent;
        receipt.suggested_chunk_size = ack.suggested_chunk_size;
    } catch (const std::runtime_error& e) {
        return transport_error(e.what());
    }
    return result;
}

UploadResult UploadClient::complete(const std::string& file_id, const std::string& expected_hash,
                                    transfer::FinalLocation& location) {
    CompleteMessage msg;
    msg.auth_token = options_.auth_token;
    msg.file_id = file_id;
    msg.expected_hash = expected_hash;

    std::vector<std::uint8_t> reply;
    auto result = round_trip(MessageType::COMPLETE, msg.serialize(), MessageType::COMPLETED, reply);
    if (!result) {
        return result;
    }

    try {
        auto completed = CompletedMessage::deserialize(reply);
        location.path = completed.final_path;
        location.final_size = completed.final_size;
        location.final_hash = completed.final_hash;
    } catch (const std::runtime_error& e) {
        return transport_error(e.what());
    }
    return result;
}

UploadResult UploadClient::cancel(const std::string& file_id) {
    FileRequestMessage msg;
    msg.auth_token = options_.auth_token;
    msg.file_id = file_id;

    std::vector<std::uint8_t> reply;
    return round_trip(MessageType::CANCEL, msg.serialize(), MessageType::CANCELLED, reply);
}

}
