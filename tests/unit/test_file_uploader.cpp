#include <gtest/gtest.h>
#include "chunkvault/transfer/file_uploader.hpp"
#include "chunkvault/core/utils.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <map>

using namespace chunkvault::transfer;
using chunkvault::core::RetryAdvice;
using chunkvault::core::UploadError;
using chunkvault::core::UploadResult;
using chunkvault::test::concat;
using chunkvault::test::digest;
using chunkvault::test::make_payload;

namespace {

// In-memory service with scripted chunk failures.
class FakeTransport : public UploadTransport {
public:
    UploadResult start_session(const StartSessionRequest& request, SessionHandle& handle) override {
        request_ = request;
        handle.file_id = request.file_id;
        handle.total_chunks = static_cast<uint32_t>(request.total_chunks);
        handle.uploaded_count = static_cast<uint32_t>(stored.size());
        handle.suggested_chunk_size = 1048576;
        handle.resumed = !stored.empty();
        return UploadResult();
    }

    UploadResult get_status(const std::string& file_id, SessionStatusReport& report) override {
        report.file_id = file_id;
        report.total_chunks = static_cast<uint32_t>(request_.total_chunks);
        for (uint32_t i = 0; i < report.total_chunks; ++i) {
            if (stored.count(i) == 0) {
                report.missing_indices.push_back(i);
            }
        }
        report.uploaded_count = report.total_chunks - static_cast<uint32_t>(report.missing_indices.size());
        return UploadResult();
    }

    UploadResult ingest_chunk(const std::string&, uint32_t chunk_number, std::span<const uint8_t> payload,
                              const std::string& chunk_hash, uint32_t attempt, ChunkReceipt& receipt) override {
        attempts.push_back({chunk_number, attempt});

        auto failure = failures.find(chunk_number);
        if (failure != failures.end() && failure->second.remaining > 0) {
            --failure->second.remaining;
            UploadResult result(failure->second.error, "scripted failure");
            RetryAdvice advice;
            advice.retry_after = std::chrono::milliseconds(250 * attempt);
            advice.attempt = attempt;
            advice.max_attempts = server_max_attempts;
            advice.exhausted = attempt >= server_max_attempts;
            result.retry = advice;
            result.suggested_chunk_size = 262144;
            return result;
        }

        if (chunk_hash != digest(std::vector<uint8_t>(payload.begin(), payload.end()))) {
            return UploadResult(UploadError::CHUNK_INTEGRITY, "hash mismatch");
        }

        stored[chunk_number] = std::vector<uint8_t>(payload.begin(), payload.end());
        receipt.chunk_number = chunk_number;
        receipt.uploaded_count = static_cast<uint32_t>(stored.size());
        receipt.total_chunks = static_cast<uint32_t>(request_.total_chunks);
        receipt.suggested_chunk_size = 524288;
        return UploadResult();
    }

    UploadResult complete(const std::string&, const std::string& expected_hash,
                          FinalLocation& location) override {
        completed_with = expected_hash;
        std::vector<std::vector<uint8_t>> parts;
        for (const auto& [index, data] : stored) {
            parts.push_back(data);
        }
        assembled = concat(parts);
        location.path = "/uploads/" + request_.file_id + "/" + request_.filename;
        location.final_size = assembled.size();
        location.final_hash = digest(assembled);
        return UploadResult();
    }

    UploadResult cancel(const std::string&) override {
        return UploadResult();
    }

    struct Failure {
        UploadError error;
        int remaining;
    };

    std::map<uint32_t, std::vector<uint8_t>> stored;
    std::map<uint32_t, Failure> failures;
    std::vector<std::pair<uint32_t, uint32_t>> attempts;
    uint32_t server_max_attempts = 3;
    std::string completed_with;
    std::vector<uint8_t> assembled;

private:
    StartSessionRequest request_;
};

}

class FileUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(chunkvault::crypto::initialize());
        test_dir = chunkvault::test::fresh_directory("chunkvault_file_uploader_test");
        uploader = std::make_unique<FileUploader>(transport);
        uploader->set_sleeper([this](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path write_file(const std::string& name, const std::vector<uint8_t>& content) {
        auto path = test_dir / name;
        EXPECT_TRUE(chunkvault::core::utils::FileUtils::write_binary(path, content));
        return path;
    }

    std::filesystem::path test_dir;
    FakeTransport transport;
    std::unique_ptr<FileUploader> uploader;
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(FileUploaderTest, UploadsEveryChunk) {
    auto content = make_payload(2500, 42);
    auto path = write_file("clip.bin", content);

    UploadOptions options;
    options.chunk_size = 1000;

    int progress_calls = 0;
    uploader->set_progress_callback([&](const ChunkReceipt&) { ++progress_calls; });

    UploadReport report;
    auto result = uploader->upload(path, options, report);
    ASSERT_TRUE(result) << result.message;

    EXPECT_EQ(report.file_hash, digest(content));
    EXPECT_EQ(report.file_id, report.file_hash.substr(0, 32));
    EXPECT_EQ(report.file_size, 2500u);
    EXPECT_EQ(report.total_chunks, 3u);
    EXPECT_EQ(report.chunks_sent, 3u);
    EXPECT_EQ(report.retries, 0u);
    EXPECT_FALSE(report.resumed);
    EXPECT_EQ(report.suggested_chunk_size, 524288u);
    EXPECT_EQ(progress_calls, 3);

    EXPECT_EQ(transport.stored[2].size(), 500u);
    EXPECT_EQ(transport.assembled, content);
    EXPECT_EQ(transport.completed_with, digest(content));
    EXPECT_EQ(report.location.final_size, 2500u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(FileUploaderTest, ExplicitFileId) {
    auto path = write_file("a.txt", chunkvault::test::bytes("hello"));

    UploadOptions options;
    options.file_id = "my-upload";

    UploadReport report;
    ASSERT_TRUE(uploader->upload(path, options, report));
    EXPECT_EQ(report.file_id, "my-upload");
    EXPECT_EQ(report.total_chunks, 1u);
}

TEST_F(FileUploaderTest, RetriesWithAdvisedDelay) {
    auto content = make_payload(3000, 7);
    auto path = write_file("retry.bin", content);
    transport.failures[1] = {UploadError::CHUNK_INTEGRITY, 1};

    UploadOptions options;
    options.chunk_size = 1000;

    UploadReport report;
    auto result = uploader->upload(path, options, report);
    ASSERT_TRUE(result) << result.message;

    EXPECT_EQ(report.retries, 1u);
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(250));
    EXPECT_EQ(transport.assembled, content);

    // Chunk 1 went out twice, second time as attempt 2.
    std::vector<std::pair<uint32_t, uint32_t>> expected = {{0, 1}, {1, 1}, {1, 2}, {2, 1}};
    EXPECT_EQ(transport.attempts, expected);
}

TEST_F(FileUploaderTest, StopsAtClientAttemptLimit) {
    auto path = write_file("stuck.bin", make_payload(500, 1));
    transport.failures[0] = {UploadError::TRANSIENT_STORAGE, 100};
    transport.server_max_attempts = 10;

    UploadOptions options;
    options.chunk_size = 1000;
    options.max_attempts = 3;

    UploadReport report;
    auto result = uploader->upload(path, options, report);
    EXPECT_EQ(result.error, UploadError::TRANSIENT_STORAGE);
    EXPECT_EQ(transport.attempts.size(), 3u);
    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(report.suggested_chunk_size, 262144u);
    EXPECT_TRUE(transport.completed_with.empty());
}

TEST_F(FileUploaderTest, StopsWhenServerSaysExhausted) {
    auto path = write_file("stuck.bin", make_payload(500, 1));
    transport.failures[0] = {UploadError::TRANSIENT_STORAGE, 100};
    transport.server_max_attempts = 2;

    UploadOptions options;
    options.max_attempts = 5;

    UploadReport report;
    auto result = uploader->upload(path, options, report);
    EXPECT_FALSE(result);
    EXPECT_EQ(transport.attempts.size(), 2u);
    EXPECT_EQ(sleeps.size(), 1u);
}

TEST_F(FileUploaderTest, NonRetryableErrorStopsImmediately) {
    auto path = write_file("denied.bin", make_payload(500, 1));
    transport.failures[0] = {UploadError::UNAUTHORIZED, 1};

    UploadReport report;
    auto result = uploader->upload(path, UploadOptions{}, report);
    EXPECT_EQ(result.error, UploadError::UNAUTHORIZED);
    EXPECT_EQ(transport.attempts.size(), 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(FileUploaderTest, ResumeSendsOnlyMissingChunks) {
    auto content = make_payload(3000, 3);
    auto path = write_file("resume.bin", content);
    transport.stored[0] = std::vector<uint8_t>(content.begin(), content.begin() + 1000);

    UploadOptions options;
    options.chunk_size = 1000;

    UploadReport report;
    ASSERT_TRUE(uploader->upload(path, options, report));
    EXPECT_TRUE(report.resumed);
    EXPECT_EQ(report.chunks_sent, 2u);
    EXPECT_EQ(transport.attempts.size(), 2u);
    EXPECT_EQ(transport.assembled, content);
}

TEST_F(FileUploaderTest, EmptyFileIsOneEmptyChunk) {
    auto path = write_file("empty.bin", {});

    UploadReport report;
    ASSERT_TRUE(uploader->upload(path, UploadOptions{}, report));
    EXPECT_EQ(report.total_chunks, 1u);
    EXPECT_EQ(report.chunks_sent, 1u);
    EXPECT_TRUE(transport.stored[0].empty());
}

TEST_F(FileUploaderTest, RejectsBadInput) {
    UploadReport report;
    EXPECT_EQ(uploader->upload(test_dir / "absent.bin", UploadOptions{}, report).error, UploadError::NOT_FOUND);

    auto path = write_file("x.bin", make_payload(10, 1));
    UploadOptions options;
    options.chunk_size = 0;
    EXPECT_EQ(uploader->upload(path, options, report).error, UploadError::INVALID_ARGUMENT);
    EXPECT_TRUE(transport.attempts.empty());
}
