#include "chunkvault/network/protocol.hpp"
#include <algorithm>
#include <bit>
#include <chrono>
#include <stdexcept>

namespace chunkvault::network {

namespace {
    constexpr std::array<std::uint32_t, 256> make_crc32_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t value = i;
            for (int bit = 0; bit < 8; ++bit) {
                value = (value & 1) ? (0xEDB88320u ^ (value >> 1)) : (value >> 1);
            }
            table[i] = value;
        }
        return table;
    }

    constexpr auto CRC32_TABLE = make_crc32_table();

    std::uint64_t get_timestamp_ms() {
        auto now = std::chrono::system_clock::now();
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
    }

    void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }

    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer.push_back((value >> shift) & 0xFF);
        }
    }

    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            buffer.push_back((value >> shift) & 0xFF);
        }
    }

    void write_int64(std::vector<std::uint8_t>& buffer, std::int64_t value) {
        write_uint64(buffer, static_cast<std::uint64_t>(value));
    }

    void write_double(std::vector<std::uint8_t>& buffer, double value) {
        write_uint64(buffer, std::bit_cast<std::uint64_t>(value));
    }

    void write_bool(std::vector<std::uint8_t>& buffer, bool value) {
        buffer.push_back(value ? 1 : 0);
    }

    void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> bytes) {
        write_uint32(buffer, static_cast<std::uint32_t>(bytes.size()));
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
        auto value = data[0];
        data = data.subspan(1);
        return value;
    }

    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = static_cast<std::uint16_t>((data[0] << 8) | data[1]);
        data = data.subspan(2);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data[i];
        }
        data = data.subspan(4);
        return value;
    }

    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        if (data.size() < 8) throw std::runtime_error("Insufficient data for uint64");
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data[i];
        }
        data = data.subspan(8);
        return value;
    }

    std::int64_t read_int64(std::span<const std::uint8_t>& data) {
        return static_cast<std::int64_t>(read_uint64(data));
    }

    double read_double(std::span<const std::uint8_t>& data) {
        return std::bit_cast<double>(read_uint64(data));
    }

    bool read_bool(std::span<const std::uint8_t>& data) {
        return read_uint8(data) != 0;
    }

    std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for byte field");
        std::vector<std::uint8_t> bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);
        return bytes;
    }

    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::START_SESSION: return "START_SESSION";
        case MessageType::SESSION_STARTED: return "SESSION_STARTED";
        case MessageType::INGEST_CHUNK: return "INGEST_CHUNK";
        case MessageType::CHUNK_RECEIPT: return "CHUNK_RECEIPT";
        case MessageType::GET_STATUS: return "GET_STATUS";
        case MessageType::STATUS_REPORT: return "STATUS_REPORT";
        case MessageType::COMPLETE: return "COMPLETE";
        case MessageType::COMPLETED: return "COMPLETED";
        case MessageType::CANCEL: return "CANCEL";
        case MessageType::CANCELLED: return "CANCELLED";
        case MessageType::ERROR_RESPONSE: return "ERROR_RESPONSE";
    }
    return "UNKNOWN";
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = CRC32_TABLE[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

MessageHeader::MessageHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::ERROR_RESPONSE)
    , flags(0)
    , message_id(0)
    , payload_size(0)
    , timestamp(get_timestamp_ms())
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : MessageHeader() {
    type = msg_type;
    payload_size = payload_len;
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                      (static_cast<std::uint32_t>(checksum[1]) << 16) |
                      (static_cast<std::uint32_t>(checksum[2]) << 8) |
                      static_cast<std::uint32_t>(checksum[3]);
    return crc32(payload) == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);

    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    write_uint8(buffer, static_cast<std::uint8_t>(type));
    write_uint8(buffer, flags);
    write_uint64(buffer, message_id);
    write_uint32(buffer, payload_size);
    write_uint64(buffer, timestamp);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());

    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }

    MessageHeader header;
    auto span = data;

    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(read_uint8(span));
    header.flags = read_uint8(span);
    header.message_id = read_uint64(span);
    header.payload_size = read_uint32(span);
    header.timestamp = read_uint64(span);
    std::copy(span.begin(), span.begin() + 4, header.checksum.begin());

    return header;
}

std::vector<std::uint8_t> encode_frame(MessageType type, std::uint64_t message_id,
                                       std::span<const std::uint8_t> payload) {
    MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
    header.message_id = message_id;
    header.calculate_checksum(payload);

    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::vector<std::uint8_t> StartSessionMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, auth_token);
    write_string(buffer, file_id);
    write_string(buffer, filename);
    write_int64(buffer, total_chunks);
    write_int64(buffer, declared_size);
    write_string(buffer, expected_hash);
    return buffer;
}

StartSessionMessage StartSessionMessage::deserialize(std::span<const std::uint8_t> data) {
    StartSessionMessage msg;
    auto span = data;
    msg.auth_token = read_string(span);
    msg.file_id = read_string(span);
    msg.filename = read_string(span);
    msg.total_chunks = read_int64(span);
    msg.declared_size = read_int64(span);
    msg.expected_hash = read_string(span);
    return msg;
}

std::vector<std::uint8_t> SessionStartedMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_uint8(buffer, status);
    write_uint32(buffer, total_chunks);
    write_uint32(buffer, uploaded_count);
    write_uint64(buffer, suggested_chunk_size);
    write_bool(buffer, resumed);
    return buffer;
}

SessionStartedMessage SessionStartedMessage::deserialize(std::span<const std::uint8_t> data) {
    SessionStartedMessage msg;
    auto span = data;
    msg.file_id = read_string(span);
    msg.status = read_uint8(span);
    msg.total_chunks = read_uint32(span);
    msg.uploaded_count = read_uint32(span);
    msg.suggested_chunk_size = read_uint64(span);
    msg.resumed = read_bool(span);
    return msg;
}

std::vector<std::uint8_t> IngestChunkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(data.size() + auth_token.size() + file_id.size() + chunk_hash.size() + 40);
    write_string(buffer, auth_token);
    write_string(buffer, file_id);
    write_int64(buffer, chunk_number);
    write_uint32(buffer, attempt);
    write_string(buffer, chunk_hash);
    write_bytes(buffer, data);
    return buffer;
}

IngestChunkMessage IngestChunkMessage::deserialize(std::span<const std::uint8_t> data_span) {
    IngestChunkMessage msg;
    auto span = data_span;
    msg.auth_token = read_string(span);
    msg.file_id = read_string(span);
    msg.chunk_number = read_int64(span);
    msg.attempt = read_uint32(span);
    msg.chunk_hash = read_string(span);
    msg.data = read_bytes(span);
    return msg;
}

std::vector<std::uint8_t> ChunkReceiptMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, chunk_number);
    write_bool(buffer, duplicate);
    write_uint32(buffer, uploaded_count);
    write_uint32(buffer, total_chunks);
    write_double(buffer, progress_percent);
    write_uint64(buffer, suggested_chunk_size);
    return buffer;
}

ChunkReceiptMessage ChunkReceiptMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkReceiptMessage msg;
    auto span = data;
    msg.chunk_number = read_uint32(span);
    msg.duplicate = read_bool(span);
    msg.uploaded_count = read_uint32(span);
    msg.total_chunks = read_uint32(span);
    msg.progress_percent = read_double(span);
    msg.suggested_chunk_size = read_uint64(span);
    return msg;
}

std::vector<std::uint8_t> FileRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, auth_token);
    write_string(buffer, file_id);
    return buffer;
}

FileRequestMessage FileRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    FileRequestMessage msg;
    auto span = data;
    msg.auth_token = read_string(span);
    msg.file_id = read_string(span);
    return msg;
}

std::vector<std::uint8_t> StatusReportMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string(buffer, filename);
    write_uint8(buffer, status);
    write_uint32(buffer, uploaded_count);
    write_uint32(buffer, total_chunks);
    write_uint32(buffer, static_cast<std::uint32_t>(missing_indices.size()));
    for (auto index : missing_indices) {
        write_uint32(buffer, index);
    }
    write_bool(buffer, missing_truncated);
    write_double(buffer, progress_percent);
    write_uint64(buffer, suggested_chunk_size);
    write_uint32(buffer, recommended_concurrency);
    write_string(buffer, detail);
    write_string(buffer, final_path);
    return buffer;
}

StatusReportMessage StatusReportMessage::deserialize(std::span<const std::uint8_t> data) {
    StatusReportMessage msg;
    auto span = data;
    msg.file_id = read_string(span);
    msg.filename = read_string(span);
    msg.status = read_uint8(span);
    msg.uploaded_count = read_uint32(span);
    msg.total_chunks = read_uint32(span);
    auto missing_count = read_uint32(span);
    if (span.size() / 4 < missing_count) {
        throw std::runtime_error("Insufficient data for missing indices");
    }
    msg.missing_indices.reserve(missing_count);
    for (std::uint32_t i = 0; i < missing_count; ++i) {
        msg.missing_indices.push_back(read_uint32(span));
    }
    msg.missing_truncated = read_bool(span);
    msg.progress_percent = read_double(span);
    msg.suggested_chunk_size = read_uint64(span);
    msg.recommended_concurrency = read_uint32(span);
    msg.detail = read_string(span);
    msg.final_path = read_string(span);
    return msg;
}

std::vector<std::uint8_t> CompleteMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, auth_token);
    write_string(buffer, file_id);
    write_string(buffer, expected_hash);
    return buffer;
}

CompleteMessage CompleteMessage::deserialize(std::span<const std::uint8_t> data) {
    CompleteMessage msg;
    auto span = data;
    msg.auth_token = read_string(span);
    msg.file_id = read_string(span);
    msg.expected_hash = read_string(span);
    return msg;
}

std::vector<std::uint8_t> CompletedMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, final_path);
    write_uint64(buffer, final_size);
    write_string(buffer, final_hash);
    return buffer;
}

CompletedMessage CompletedMessage::deserialize(std::span<const std::uint8_t> data) {
    CompletedMessage msg;
    auto span = data;
    msg.final_path = read_string(span);
    msg.final_size = read_uint64(span);
    msg.final_hash = read_string(span);
    return msg;
}

std::vector<std::uint8_t> CancelledMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

CancelledMessage CancelledMessage::deserialize(std::span<const std::uint8_t> data) {
    CancelledMessage msg;
    auto span = data;
    msg.file_id = read_string(span);
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, error_code);
    write_string(buffer, error_message);
    write_uint64(buffer, request_id);
    write_bool(buffer, has_retry);
    write_uint64(buffer, retry_after_ms);
    write_uint32(buffer, attempt);
    write_uint32(buffer, max_attempts);
    write_bool(buffer, exhausted);
    write_uint64(buffer, suggested_chunk_size);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    auto span = data;
    msg.error_code = read_uint32(span);
    msg.error_message = read_string(span);
    msg.request_id = read_uint64(span);
    msg.has_retry = read_bool(span);
    msg.retry_after_ms = read_uint64(span);
    msg.attempt = read_uint32(span);
    msg.max_attempts = read_uint32(span);
    msg.exhausted = read_bool(span);
    msg.suggested_chunk_size = read_uint64(span);
    return msg;
}

ErrorMessage make_error_message(const core::UploadResult& result, std::uint64_t request_id) {
    ErrorMessage msg;
    msg.error_code = static_cast<std::uint32_t>(result.error);
    msg.error_message = result.message;
    msg.request_id = request_id;
    if (result.retry) {
        msg.has_retry = true;
        msg.retry_after_ms = static_cast<std::uint64_t>(result.retry->retry_after.count());
        msg.attempt = result.retry->attempt;
        msg.max_attempts = result.retry->max_attempts;
        msg.exhausted = result.retry->exhausted;
    }
    msg.suggested_chunk_size = result.suggested_chunk_size.value_or(0);
    return msg;
}

core::UploadResult result_from_error(const ErrorMessage& message) {
    auto error = core::UploadError::INTERNAL;
    if (message.error_code > 0 &&
        message.error_code <= static_cast<std::uint32_t>(core::UploadError::INTERNAL)) {
        error = static_cast<core::UploadError>(message.error_code);
    }

    core::UploadResult result(error, message.error_message);
    if (message.has_retry) {
        core::RetryAdvice advice;
        advice.retry_after = std::chrono::milliseconds(message.retry_after_ms);
        advice.attempt = message.attempt;
        advice.max_attempts = message.max_attempts;
        advice.exhausted = message.exhausted;
        result.retry = advice;
    }
    if (message.suggested_chunk_size > 0) {
        result.suggested_chunk_size = message.suggested_chunk_size;
    }
    return result;
}

}
