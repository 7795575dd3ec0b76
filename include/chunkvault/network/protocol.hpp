#pragma once

#include "chunkvault/core/result.hpp"
#include <array>
#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace chunkvault::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x43564C54; // "CVLT"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;

// Each reply type is its request type plus one.
enum class MessageType : std::uint8_t {
    START_SESSION   = 0x10,
    SESSION_STARTED = 0x11,

    INGEST_CHUNK    = 0x20,
    CHUNK_RECEIPT   = 0x21,

    GET_STATUS      = 0x30,
    STATUS_REPORT   = 0x31,

    COMPLETE        = 0x40,
    COMPLETED       = 0x41,

    CANCEL          = 0x50,
    CANCELLED       = 0x51,

    ERROR_RESPONSE  = 0xFF
};

const char* to_string(MessageType type);

struct MessageHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    MessageType type;              // Message type
    std::uint8_t flags;            // Reserved, zero
    std::uint64_t message_id;      // Echoed back in the reply
    std::uint32_t payload_size;    // Payload length in bytes
    std::uint64_t timestamp;       // Unix timestamp (milliseconds)
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload

    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);

    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;

    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
} __attribute__((packed));

static_assert(sizeof(MessageHeader) == MESSAGE_HEADER_SIZE);

std::uint32_t crc32(std::span<const std::uint8_t> data);

// Header plus payload, checksummed, ready for the socket.
std::vector<std::uint8_t> encode_frame(MessageType type, std::uint64_t message_id,
                                       std::span<const std::uint8_t> payload);

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

struct StartSessionMessage {
    std::string auth_token;
    std::string file_id;
    std::string filename;
    std::int64_t total_chunks = 0;
    std::int64_t declared_size = 0;
    std::string expected_hash;

    std::vector<std::uint8_t> serialize() const;
    static StartSessionMessage deserialize(std::span<const std::uint8_t> data);
};

struct SessionStartedMessage {
    std::string file_id;
    std::uint8_t status = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t uploaded_count = 0;
    std::uint64_t suggested_chunk_size = 0;
    bool resumed = false;

    std::vector<std::uint8_t> serialize() const;
    static SessionStartedMessage deserialize(std::span<const std::uint8_t> data);
};

struct IngestChunkMessage {
    std::string auth_token;
    std::string file_id;
    std::int64_t chunk_number = 0;
    std::uint32_t attempt = 1;
    std::string chunk_hash;
    std::vector<std::uint8_t> data;

    std::vector<std::uint8_t> serialize() const;
    static IngestChunkMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkReceiptMessage {
    std::uint32_t chunk_number = 0;
    bool duplicate = false;
    std::uint32_t uploaded_count = 0;
    std::uint32_t total_chunks = 0;
    double progress_percent = 0.0;
    std::uint64_t suggested_chunk_size = 0;

    std::vector<std::uint8_t> serialize() const;
    static ChunkReceiptMessage deserialize(std::span<const std::uint8_t> data);
};

// Used by GET_STATUS and CANCEL.
struct FileRequestMessage {
    std::string auth_token;
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static FileRequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct StatusReportMessage {
    std::string file_id;
    std::string filename;
    std::uint8_t status = 0;
    std::uint32_t uploaded_count = 0;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint32_t> missing_indices;
    bool missing_truncated = false;
    double progress_percent = 0.0;
    std::uint64_t suggested_chunk_size = 0;
    std::uint32_t recommended_concurrency = 1;
    std::string detail;
    std::string final_path;

    std::vector<std::uint8_t> serialize() const;
    static StatusReportMessage deserialize(std::span<const std::uint8_t> data);
};

struct CompleteMessage {
    std::string auth_token;
    std::string file_id;
    std::string expected_hash;

    std::vector<std::uint8_t> serialize() const;
    static CompleteMessage deserialize(std::span<const std::uint8_t> data);
};

struct CompletedMessage {
    std::string final_path;
    std::uint64_t final_size = 0;
    std::string final_hash;

    std::vector<std::uint8_t> serialize() const;
    static CompletedMessage deserialize(std::span<const std::uint8_t> data);
};

struct CancelledMessage {
    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static CancelledMessage deserialize(std::span<const std::uint8_t> data);
};

// error_code carries a core::UploadError value.
struct ErrorMessage {
    std::uint32_t error_code = 0;
    std::string error_message;
    std::uint64_t request_id = 0;
    bool has_retry = false;
    std::uint64_t retry_after_ms = 0;
    std::uint32_t attempt = 0;
    std::uint32_t max_attempts = 0;
    bool exhausted = false;
    std::uint64_t suggested_chunk_size = 0; // zero when absent

    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

ErrorMessage make_error_message(const core::UploadResult& result, std::uint64_t request_id);

// Unknown error codes come back as INTERNAL.
core::UploadResult result_from_error(const ErrorMessage& message);

}

static_assert(chunkvault::network::MessagePayload<chunkvault::network::StartSessionMessage>);
static_assert(chunkvault::network::MessagePayload<chunkvault::network::IngestChunkMessage>);
static_assert(chunkvault::network::MessagePayload<chunkvault::network::StatusReportMessage>);
static_assert(chunkvault::network::MessagePayload<chunkvault::network::ErrorMessage>);
