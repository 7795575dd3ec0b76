#include <gtest/gtest.h>
#include "chunkvault/network/request_handler.hpp"
#include "chunkvault/storage/sqlite_metadata_store.hpp"
#include "test_support.hpp"
#include <filesystem>

using namespace chunkvault::network;
using namespace chunkvault::transfer;
using chunkvault::core::StaticTokenIdentityProvider;
using chunkvault::core::UploadError;
using chunkvault::storage::ChunkStore;
using chunkvault::storage::SessionStatus;
using chunkvault::storage::SqliteMetadataStore;
using chunkvault::storage::StorageConfig;
using chunkvault::test::concat;
using chunkvault::test::digest;
using chunkvault::test::make_payload;

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(chunkvault::crypto::initialize());
        test_dir = chunkvault::test::fresh_directory("chunkvault_request_handler_test");
        StorageConfig config(test_dir);
        ASSERT_TRUE(config.create_directories());

        auto metadata = std::make_shared<SqliteMetadataStore>(":memory:");
        ASSERT_TRUE(metadata->initialize());
        auto chunks = std::make_shared<ChunkStore>(config, metadata);
        ASSERT_TRUE(chunks->initialize());

        UploadSettings settings;
        auto sessions = std::make_shared<SessionManager>(
            settings, metadata, chunks,
            std::make_shared<MergeEngine>(config, chunks),
            std::make_shared<NetworkMonitor>(settings));

        auto identity = std::make_shared<StaticTokenIdentityProvider>(
            StaticTokenIdentityProvider::from_string("alice:alice-token,bob:bob-token"));
        handler = std::make_unique<RequestHandler>(sessions, identity);

        parts = {make_payload(3000, 1), make_payload(3000, 2)};
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    template<MessagePayload T>
    Response dispatch(MessageType type, const T& message, std::uint64_t id = 1) {
        auto payload = message.serialize();
        MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
        header.message_id = id;
        return handler->handle(header, payload);
    }

    ErrorMessage error_of(const Response& response) {
        EXPECT_EQ(response.type, MessageType::ERROR_RESPONSE);
        return ErrorMessage::deserialize(response.payload);
    }

    StartSessionMessage start_message(const std::string& token) {
        auto whole = concat(parts);
        StartSessionMessage msg;
        msg.auth_token = token;
        msg.file_id = "upload-1";
        msg.filename = "video.mp4";
        msg.total_chunks = static_cast<std::int64_t>(parts.size());
        msg.declared_size = static_cast<std::int64_t>(whole.size());
        msg.expected_hash = digest(whole);
        return msg;
    }

    IngestChunkMessage chunk_message(std::int64_t index, const std::string& token = "alice-token") {
        IngestChunkMessage msg;
        msg.auth_token = token;
        msg.file_id = "upload-1";
        msg.chunk_number = index;
        msg.data = parts[static_cast<size_t>(index)];
        msg.chunk_hash = digest(msg.data);
        return msg;
    }

    std::filesystem::path test_dir;
    std::unique_ptr<RequestHandler> handler;
    std::vector<std::vector<std::uint8_t>> parts;
};

TEST_F(RequestHandlerTest, FullUploadFlow) {
    auto started = dispatch(MessageType::START_SESSION, start_message("alice-token"));
    ASSERT_EQ(started.type, MessageType::SESSION_STARTED);
    auto handle = SessionStartedMessage::deserialize(started.payload);
    EXPECT_EQ(handle.file_id, "upload-1");
    EXPECT_EQ(handle.total_chunks, 2u);
    EXPECT_FALSE(handle.resumed);

    auto first = dispatch(MessageType::INGEST_CHUNK, chunk_message(1));
    ASSERT_EQ(first.type, MessageType::CHUNK_RECEIPT);
    auto receipt = ChunkReceiptMessage::deserialize(first.payload);
    EXPECT_EQ(receipt.chunk_number, 1u);
    EXPECT_EQ(receipt.uploaded_count, 1u);
    EXPECT_DOUBLE_EQ(receipt.progress_percent, 50.0);

    FileRequestMessage status_request{"alice-token", "upload-1"};
    auto status = dispatch(MessageType::GET_STATUS, status_request);
    ASSERT_EQ(status.type, MessageType::STATUS_REPORT);
    auto report = StatusReportMessage::deserialize(status.payload);
    EXPECT_EQ(report.missing_indices, (std::vector<std::uint32_t>{0}));
    EXPECT_EQ(report.status, static_cast<std::uint8_t>(SessionStatus::UPLOADING));

    ASSERT_EQ(dispatch(MessageType::INGEST_CHUNK, chunk_message(0)).type, MessageType::CHUNK_RECEIPT);

    CompleteMessage complete{"alice-token", "upload-1", digest(concat(parts))};
    auto completed = dispatch(MessageType::COMPLETE, complete);
    ASSERT_EQ(completed.type, MessageType::COMPLETED);
    auto location = CompletedMessage::deserialize(completed.payload);
    EXPECT_EQ(location.final_size, 6000u);
    EXPECT_EQ(location.final_hash, digest(concat(parts)));
    EXPECT_TRUE(std::filesystem::exists(location.final_path));
}

TEST_F(RequestHandlerTest, UnknownTokenIsUnauthorized) {
    auto response = dispatch(MessageType::START_SESSION, start_message("forged"), 5);
    auto error = error_of(response);
    EXPECT_EQ(error.error_code, static_cast<std::uint32_t>(UploadError::UNAUTHORIZED));
    EXPECT_EQ(error.request_id, 5u);
}

TEST_F(RequestHandlerTest, OtherUserIsUnauthorized) {
    ASSERT_EQ(dispatch(MessageType::START_SESSION, start_message("alice-token")).type, MessageType::SESSION_STARTED);

    auto response = dispatch(MessageType::INGEST_CHUNK, chunk_message(0, "bob-token"));
    EXPECT_EQ(error_of(response).error_code, static_cast<std::uint32_t>(UploadError::UNAUTHORIZED));

    FileRequestMessage cancel{"bob-token", "upload-1"};
    response = dispatch(MessageType::CANCEL, cancel);
    EXPECT_EQ(error_of(response).error_code, static_cast<std::uint32_t>(UploadError::UNAUTHORIZED));
}

TEST_F(RequestHandlerTest, MalformedPayload) {
    std::vector<std::uint8_t> garbage = {0x00, 0x00, 0x10};
    MessageHeader header(MessageType::START_SESSION, static_cast<std::uint32_t>(garbage.size()));
    header.message_id = 9;

    auto response = handler->handle(header, garbage);
    auto error = error_of(response);
    EXPECT_EQ(error.error_code, static_cast<std::uint32_t>(UploadError::INVALID_ARGUMENT));
    EXPECT_EQ(error.request_id, 9u);
    EXPECT_EQ(error.error_message.rfind("Malformed request", 0), 0u);
}

TEST_F(RequestHandlerTest, ReplyTypesAreRejectedAsRequests) {
    CancelledMessage message{"upload-1"};
    auto response = dispatch(MessageType::CANCELLED, message);
    EXPECT_EQ(error_of(response).error_code, static_cast<std::uint32_t>(UploadError::INVALID_ARGUMENT));
}

TEST_F(RequestHandlerTest, IntegrityFailureCarriesAdvice) {
    ASSERT_EQ(dispatch(MessageType::START_SESSION, start_message("alice-token")).type, MessageType::SESSION_STARTED);

    auto message = chunk_message(0);
    message.data[10] ^= 0x01;
    message.attempt = 1;

    auto error = error_of(dispatch(MessageType::INGEST_CHUNK, message));
    EXPECT_EQ(error.error_code, static_cast<std::uint32_t>(UploadError::CHUNK_INTEGRITY));
    EXPECT_TRUE(error.has_retry);
    EXPECT_EQ(error.retry_after_ms, 1000u);
    EXPECT_EQ(error.attempt, 1u);
    EXPECT_EQ(error.max_attempts, 3u);
    EXPECT_FALSE(error.exhausted);
    EXPECT_GT(error.suggested_chunk_size, 0u);
}

TEST_F(RequestHandlerTest, CancelReply) {
    ASSERT_EQ(dispatch(MessageType::START_SESSION, start_message("alice-token")).type, MessageType::SESSION_STARTED);

    FileRequestMessage cancel{"alice-token", "upload-1"};
    auto response = dispatch(MessageType::CANCEL, cancel);
    ASSERT_EQ(response.type, MessageType::CANCELLED);
    EXPECT_EQ(CancelledMessage::deserialize(response.payload).file_id, "upload-1");

    auto incomplete = dispatch(MessageType::COMPLETE, CompleteMessage{"alice-token", "upload-1", digest(concat(parts))});
    EXPECT_EQ(error_of(incomplete).error_code, static_cast<std::uint32_t>(UploadError::INVALID_STATE));
}
