#include <gtest/gtest.h>
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/network/upload_client.hpp"
#include "chunkvault/network/upload_server.hpp"
#include "chunkvault/storage/sqlite_metadata_store.hpp"
#include "chunkvault/transfer/file_uploader.hpp"
#include <boost/asio.hpp>
#include <array>
#include <filesystem>
#include <thread>

using namespace chunkvault;
using namespace chunkvault::network;
using core::UploadError;
using core::utils::FileUtils;

namespace {
    std::vector<std::uint8_t> pattern(std::size_t size, std::uint8_t seed) {
        std::vector<std::uint8_t> data(size);
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xFF);
        }
        return data;
    }
}

class UploadServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::initialize());

        test_dir = std::filesystem::temp_directory_path() / "chunkvault_upload_service_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir / "outgoing");

        storage::StorageConfig config(test_dir / "server");
        ASSERT_TRUE(config.create_directories());

        auto metadata = std::make_shared<storage::SqliteMetadataStore>(config.database_path);
        ASSERT_TRUE(metadata->initialize());
        auto chunks = std::make_shared<storage::ChunkStore>(config, metadata);
        ASSERT_TRUE(chunks->initialize());

        transfer::UploadSettings settings;
        settings.retry_base_delay = std::chrono::milliseconds(10);
        sessions = std::make_shared<transfer::SessionManager>(
            settings, metadata, chunks,
            std::make_shared<transfer::MergeEngine>(config, chunks),
            std::make_shared<transfer::NetworkMonitor>(settings));

        auto identity = std::make_shared<core::StaticTokenIdentityProvider>(
            core::StaticTokenIdentityProvider::from_string("alice:alice-token,bob:bob-token"));

        ServerOptions options;
        options.bind_address = "127.0.0.1";
        options.port = 0;
        options.worker_threads = 2;
        handler = std::make_shared<RequestHandler>(sessions, identity);
        server = std::make_unique<UploadServer>(options, handler);
        ASSERT_TRUE(server->start());
        ASSERT_NE(server->port(), 0);
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        std::filesystem::remove_all(test_dir);
    }

    ClientOptions client_options(const std::string& token) {
        ClientOptions options;
        options.host = "127.0.0.1";
        options.port = server->port();
        options.auth_token = token;
        options.timeout = std::chrono::seconds(10);
        return options;
    }

    std::filesystem::path write_file(const std::string& name, const std::vector<std::uint8_t>& content) {
        auto path = test_dir / "outgoing" / name;
        EXPECT_TRUE(FileUtils::write_binary(path, content));
        return path;
    }

    std::filesystem::path test_dir;
    std::shared_ptr<transfer::SessionManager> sessions;
    std::shared_ptr<RequestHandler> handler;
    std::unique_ptr<UploadServer> server;
};

TEST_F(UploadServiceTest, UploadsFileOverLoopback) {
    auto content = pattern(3 * 262144 + 1234, 7);
    auto path = write_file("movie.bin", content);

    UploadClient client(client_options("alice-token"));
    transfer::FileUploader uploader(client);

    transfer::UploadOptions options;
    options.chunk_size = 262144;

    transfer::UploadReport report;
    auto result = uploader.upload(path, options, report);
    ASSERT_TRUE(result) << result.message;

    EXPECT_EQ(report.total_chunks, 4u);
    EXPECT_EQ(report.chunks_sent, 4u);
    EXPECT_EQ(report.location.final_size, content.size());
    EXPECT_EQ(report.location.final_hash, crypto::hash_utils::hex_digest(content));
    EXPECT_EQ(report.location.path.filename(), "movie.bin");

    auto stored = FileUtils::read_binary(report.location.path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, content);

    transfer::SessionStatusReport status;
    ASSERT_TRUE(client.get_status(report.file_id, status));
    EXPECT_EQ(status.status, storage::SessionStatus::COMPLETED);
    EXPECT_EQ(status.final_path, report.location.path.string());
}

TEST_F(UploadServiceTest, ResumesAfterPartialUpload) {
    auto content = pattern(5000, 3);
    auto path = write_file("resume.bin", content);
    auto file_hash = crypto::hash_utils::hex_digest(content);

    {
        UploadClient first(client_options("alice-token"));
        transfer::StartSessionRequest request{"resume-1", "resume.bin", 5, 5000, file_hash};
        transfer::SessionHandle handle;
        ASSERT_TRUE(first.start_session(request, handle));

        std::vector<std::uint8_t> chunk(content.begin() + 2000, content.begin() + 3000);
        transfer::ChunkReceipt receipt;
        ASSERT_TRUE(first.ingest_chunk("resume-1", 2, chunk, crypto::hash_utils::hex_digest(chunk), 1, receipt));
        EXPECT_EQ(receipt.uploaded_count, 1u);
    }

    UploadClient second(client_options("alice-token"));
    transfer::FileUploader uploader(second);
    transfer::UploadOptions options;
    options.file_id = "resume-1";
    options.chunk_size = 1000;

    transfer::UploadReport report;
    auto result = uploader.upload(path, options, report);
    ASSERT_TRUE(result) << result.message;
    EXPECT_TRUE(report.resumed);
    EXPECT_EQ(report.chunks_sent, 4u);

    auto stored = FileUtils::read_binary(report.location.path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, content);
}

TEST_F(UploadServiceTest, UnknownTokenRejected) {
    UploadClient client(client_options("wrong"));
    transfer::StartSessionRequest request{"denied", "x.bin", 1, 1, crypto::hash_utils::hex_digest(pattern(1, 1))};
    transfer::SessionHandle handle;

    auto result = client.start_session(request, handle);
    EXPECT_EQ(result.error, UploadError::UNAUTHORIZED);
    // Application errors leave the connection usable.
    EXPECT_TRUE(client.is_connected());
}

TEST_F(UploadServiceTest, CorruptChunkGetsRetryAdvice) {
    auto content = pattern(100, 9);
    UploadClient client(client_options("alice-token"));

    transfer::StartSessionRequest request{"corrupt", "c.bin", 1, 100, crypto::hash_utils::hex_digest(content)};
    transfer::SessionHandle handle;
    ASSERT_TRUE(client.start_session(request, handle));

    auto tampered = content;
    tampered[0] ^= 0xFF;

    transfer::ChunkReceipt receipt;
    auto result = client.ingest_chunk("corrupt", 0, tampered, crypto::hash_utils::hex_digest(content), 1, receipt);
    EXPECT_EQ(result.error, UploadError::CHUNK_INTEGRITY);
    ASSERT_TRUE(result.retry.has_value());
    EXPECT_EQ(result.retry->retry_after, std::chrono::milliseconds(10));
    EXPECT_FALSE(result.retry->exhausted);
    EXPECT_TRUE(result.suggested_chunk_size.has_value());
}

TEST_F(UploadServiceTest, OwnershipAndCancel) {
    auto content = pattern(2000, 5);
    auto hash = crypto::hash_utils::hex_digest(content);

    UploadClient alice(client_options("alice-token"));
    UploadClient bob(client_options("bob-token"));

    transfer::StartSessionRequest request{"owned", "o.bin", 2, 2000, hash};
    transfer::SessionHandle handle;
    ASSERT_TRUE(alice.start_session(request, handle));

    transfer::SessionStatusReport report;
    EXPECT_EQ(bob.get_status("owned", report).error, UploadError::UNAUTHORIZED);
    EXPECT_EQ(bob.cancel("owned").error, UploadError::UNAUTHORIZED);

    ASSERT_TRUE(alice.cancel("owned"));
    ASSERT_TRUE(alice.get_status("owned", report));
    EXPECT_EQ(report.status, storage::SessionStatus::CANCELLED);

    transfer::FinalLocation location;
    EXPECT_EQ(alice.complete("owned", hash, location).error, UploadError::INVALID_STATE);
}

TEST_F(UploadServiceTest, ParallelClients) {
    std::vector<std::vector<std::uint8_t>> contents;
    std::vector<std::filesystem::path> paths;
    for (int i = 0; i < 4; ++i) {
        contents.push_back(pattern(40000 + static_cast<std::size_t>(i) * 777, static_cast<std::uint8_t>(i)));
        paths.push_back(write_file("parallel" + std::to_string(i) + ".bin", contents.back()));
    }

    std::vector<transfer::UploadReport> reports(4);
    std::vector<core::UploadResult> results(4);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i]() {
            UploadClient client(client_options(i % 2 == 0 ? "alice-token" : "bob-token"));
            transfer::FileUploader uploader(client);
            transfer::UploadOptions options;
            options.chunk_size = 8192;
            results[static_cast<std::size_t>(i)] = uploader.upload(paths[static_cast<std::size_t>(i)], options,
                                                                  reports[static_cast<std::size_t>(i)]);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (std::size_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(results[i]) << results[i].message;
        auto stored = FileUtils::read_binary(reports[i].location.path);
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(*stored, contents[i]);
    }
    EXPECT_EQ(sessions->lock_count(), 0u);
}

TEST_F(UploadServiceTest, ServerGoneIsTransportError) {
    auto options = client_options("alice-token");
    options.timeout = std::chrono::seconds(2);
    server->stop();

    UploadClient client(options);
    transfer::SessionStatusReport report;
    auto result = client.get_status("anything", report);
    EXPECT_EQ(result.error, UploadError::INTERNAL);
    EXPECT_EQ(result.message.rfind("Transport error", 0), 0u);
    EXPECT_FALSE(client.is_connected());
}

TEST_F(UploadServiceTest, StalledPayloadDropsConnection) {
    ServerOptions options;
    options.bind_address = "127.0.0.1";
    options.port = 0;
    options.worker_threads = 1;
    options.payload_timeout = std::chrono::milliseconds(100);
    UploadServer strict(options, handler);
    ASSERT_TRUE(strict.start());

    boost::asio::io_context io;
    boost::asio::ip::tcp::socket socket(io);
    socket.connect({boost::asio::ip::make_address("127.0.0.1"), strict.port()});

    // Announce 64 bytes of payload and never send them.
    MessageHeader header(MessageType::GET_STATUS, 64);
    auto bytes = header.serialize();
    boost::asio::write(socket, boost::asio::buffer(bytes));

    auto started = std::chrono::steady_clock::now();
    std::array<std::uint8_t, 1> reply{};
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::buffer(reply), ec);
    auto waited = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset) << ec.message();
    EXPECT_LT(waited, std::chrono::seconds(5));
    strict.stop();
}
