#include <gtest/gtest.h>
#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/storage/sqlite_metadata_store.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace chunkvault::storage;
using chunkvault::core::UploadError;
using chunkvault::test::digest;
using chunkvault::test::make_payload;

namespace {

class FailingChunkStore : public ChunkStore {
public:
    using ChunkStore::ChunkStore;

protected:
    bool persist(const std::filesystem::path&, std::span<const uint8_t>, std::string& error) override {
        error = "disk full";
        return false;
    }
};

// Flips a byte on every read, as if the medium returned different data.
class CorruptingChunkStore : public ChunkStore {
public:
    using ChunkStore::ChunkStore;

protected:
    bool read_back(const std::filesystem::path& path, std::vector<uint8_t>& data) const override {
        if (!ChunkStore::read_back(path, data)) {
            return false;
        }
        if (!data.empty()) {
            data[0] ^= 0xFF;
        }
        return true;
    }
};

// Reads of one chosen chunk fail once armed.
class UnreadableChunkStore : public ChunkStore {
public:
    using ChunkStore::ChunkStore;

    void fail_reads_of(uint32_t chunk_number) { unreadable_ = chunk_number; }

protected:
    bool read_back(const std::filesystem::path& path, std::vector<uint8_t>& data) const override {
        if (unreadable_ && ChunkStore::parse_chunk_filename(path.filename().string()) == unreadable_) {
            return false;
        }
        return ChunkStore::read_back(path, data);
    }

private:
    std::optional<uint32_t> unreadable_;
};

}

class ChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(chunkvault::crypto::initialize());
        test_dir = chunkvault::test::fresh_directory("chunkvault_chunk_store_test");
        config = StorageConfig(test_dir);
        metadata = std::make_shared<SqliteMetadataStore>(":memory:");
        ASSERT_TRUE(metadata->initialize());
        store = std::make_unique<ChunkStore>(config, metadata);
        ASSERT_TRUE(store->initialize());
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_chunk(const std::string& file_id, uint32_t index, const std::vector<uint8_t>& data) {
        ChunkRecord record;
        ASSERT_TRUE(store->write(file_id, index, data, digest(data), record));
    }

    std::filesystem::path test_dir;
    StorageConfig config;
    std::shared_ptr<SqliteMetadataStore> metadata;
    std::unique_ptr<ChunkStore> store;
};

TEST_F(ChunkStoreTest, WriteAndRead) {
    auto data = make_payload(4096, 1);

    ChunkRecord record;
    ASSERT_TRUE(store->write("file-a", 3, data, digest(data), record));
    EXPECT_EQ(record.chunk_number, 3u);
    EXPECT_EQ(record.byte_length, 4096u);
    EXPECT_EQ(record.content_hash, digest(data));

    EXPECT_TRUE(store->exists("file-a", 3));
    EXPECT_FALSE(store->exists("file-a", 4));

    std::vector<uint8_t> read_back;
    ASSERT_TRUE(store->read("file-a", 3, read_back));
    EXPECT_EQ(read_back, data);

    ChunkRecord stored;
    ASSERT_TRUE(store->get_record("file-a", 3, stored));
    EXPECT_EQ(stored.content_hash, digest(data));
}

TEST_F(ChunkStoreTest, ReadMissingChunk) {
    std::vector<uint8_t> data;
    EXPECT_EQ(store->read("file-a", 0, data).error, UploadError::NOT_FOUND);
}

TEST_F(ChunkStoreTest, OverwriteReplacesContent) {
    auto first = make_payload(100, 1);
    auto second = make_payload(120, 2);
    write_chunk("file-a", 0, first);
    write_chunk("file-a", 0, second);

    std::vector<uint8_t> data;
    ASSERT_TRUE(store->read("file-a", 0, data));
    EXPECT_EQ(data, second);

    ChunkRecord record;
    ASSERT_TRUE(store->get_record("file-a", 0, record));
    EXPECT_EQ(record.byte_length, 120u);
}

TEST_F(ChunkStoreTest, NoTemporaryFilesLeftBehind) {
    write_chunk("file-a", 0, make_payload(10, 1));
    write_chunk("file-a", 1, make_payload(10, 2));

    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(store->chunk_directory("file-a"))) {
        EXPECT_TRUE(ChunkStore::parse_chunk_filename(entry.path().filename().string()).has_value())
            << entry.path();
        ++entries;
    }
    EXPECT_EQ(entries, 2u);
}

TEST_F(ChunkStoreTest, PersistFailureIsTransient) {
    FailingChunkStore failing(config, metadata);
    auto data = make_payload(64, 1);

    ChunkRecord record;
    auto result = failing.write("file-a", 0, data, digest(data), record);
    EXPECT_EQ(result.error, UploadError::TRANSIENT_STORAGE);
    EXPECT_TRUE(result.retryable());
    EXPECT_FALSE(failing.exists("file-a", 0));

    ChunkRecord stored;
    EXPECT_EQ(metadata->get_chunk_record("file-a", 0, stored).error, UploadError::NOT_FOUND);
}

TEST_F(ChunkStoreTest, PostWriteVerificationFailureRemovesChunk) {
    CorruptingChunkStore corrupting(config, metadata);
    auto data = make_payload(64, 1);

    ChunkRecord record;
    auto result = corrupting.write("file-a", 0, data, digest(data), record);
    EXPECT_EQ(result.error, UploadError::TRANSIENT_STORAGE);
    EXPECT_FALSE(corrupting.exists("file-a", 0));
}

TEST_F(ChunkStoreTest, ListChunksSortedAndFiltered) {
    write_chunk("file-a", 10, make_payload(8, 10));
    write_chunk("file-a", 2, make_payload(8, 2));
    write_chunk("file-a", 7, make_payload(8, 7));

    std::ofstream(store->chunk_directory("file-a") / "notes.txt") << "ignored";
    std::ofstream(store->chunk_directory("file-a") / "chunk.000001.tmp.1.0") << "ignored";

    EXPECT_EQ(store->list_chunks("file-a"), (std::vector<uint32_t>{2, 7, 10}));
    EXPECT_TRUE(store->list_chunks("unknown").empty());
}

TEST_F(ChunkStoreTest, ReadOrderedIsLazyAndRestartable) {
    std::vector<std::vector<uint8_t>> chunks = {make_payload(32, 0), make_payload(32, 1), make_payload(5, 2)};
    write_chunk("file-a", 2, chunks[2]);
    write_chunk("file-a", 0, chunks[0]);
    write_chunk("file-a", 1, chunks[1]);

    auto sequence = store->read_ordered("file-a");

    for (int pass = 0; pass < 2; ++pass) {
        uint32_t expected = 0;
        for (const auto& entry : sequence) {
            EXPECT_EQ(entry.chunk_number, expected);
            EXPECT_EQ(entry.data, chunks[expected]);
            ++expected;
        }
        EXPECT_EQ(expected, 3u);
    }
}

TEST_F(ChunkStoreTest, ReadOrderedReportsUnreadableChunk) {
    UnreadableChunkStore flaky(config, metadata);
    for (uint32_t index = 0; index < 3; ++index) {
        auto data = make_payload(8, index);
        ChunkRecord record;
        ASSERT_TRUE(flaky.write("file-a", index, data, digest(data), record));
    }
    flaky.fail_reads_of(1);

    std::vector<uint32_t> seen;
    auto sequence = flaky.read_ordered("file-a");
    try {
        for (const auto& entry : sequence) {
            seen.push_back(entry.chunk_number);
        }
        FAIL() << "expected ChunkReadError";
    } catch (const ChunkReadError& e) {
        EXPECT_EQ(e.chunk_number(), 1u);
    }
    EXPECT_EQ(seen, (std::vector<uint32_t>{0}));
}

TEST_F(ChunkStoreTest, VerifiedChunksSkipsCorruption) {
    write_chunk("file-a", 0, make_payload(16, 0));
    write_chunk("file-a", 1, make_payload(16, 1));
    write_chunk("file-a", 2, make_payload(16, 2));

    {
        std::ofstream out(store->chunk_path("file-a", 1), std::ios::binary | std::ios::trunc);
        out << "tampered";
    }
    std::filesystem::remove(store->chunk_path("file-a", 2));

    EXPECT_EQ(store->verified_chunks("file-a"), (std::vector<uint32_t>{0}));
}

TEST_F(ChunkStoreTest, DeleteAllRemovesFilesAndRecords) {
    write_chunk("file-a", 0, make_payload(16, 0));
    write_chunk("file-b", 0, make_payload(16, 1));

    EXPECT_EQ(store->list_file_ids(), (std::vector<std::string>{"file-a", "file-b"}));

    store->delete_all("file-a");
    EXPECT_FALSE(std::filesystem::exists(store->chunk_directory("file-a")));
    EXPECT_EQ(store->list_file_ids(), (std::vector<std::string>{"file-b"}));

    std::vector<ChunkRecord> records;
    ASSERT_TRUE(metadata->list_chunk_records("file-a", records));
    EXPECT_TRUE(records.empty());

    // Deleting twice is harmless.
    store->delete_all("file-a");
}

TEST_F(ChunkStoreTest, RemoveSingleChunk) {
    write_chunk("file-a", 0, make_payload(16, 0));
    write_chunk("file-a", 1, make_payload(16, 1));

    store->remove_chunk("file-a", 0);
    EXPECT_EQ(store->list_chunks("file-a"), (std::vector<uint32_t>{1}));

    ChunkRecord record;
    EXPECT_EQ(store->get_record("file-a", 0, record).error, UploadError::NOT_FOUND);
}

TEST_F(ChunkStoreTest, LastModified) {
    EXPECT_FALSE(store->last_modified("file-a").has_value());

    auto before = std::chrono::system_clock::now() - std::chrono::seconds(5);
    write_chunk("file-a", 0, make_payload(16, 0));

    auto modified = store->last_modified("file-a");
    ASSERT_TRUE(modified.has_value());
    EXPECT_GT(*modified, before);
}

TEST(ChunkFilenameTest, Parse) {
    EXPECT_EQ(ChunkStore::parse_chunk_filename("chunk.000000"), 0u);
    EXPECT_EQ(ChunkStore::parse_chunk_filename("chunk.001234"), 1234u);
    EXPECT_EQ(ChunkStore::parse_chunk_filename("chunk.12345678"), 12345678u);

    EXPECT_FALSE(ChunkStore::parse_chunk_filename("chunk.").has_value());
    EXPECT_FALSE(ChunkStore::parse_chunk_filename("chunk.12a").has_value());
    EXPECT_FALSE(ChunkStore::parse_chunk_filename("chunk.000001.tmp.5.0").has_value());
    EXPECT_FALSE(ChunkStore::parse_chunk_filename("chunk.99999999999").has_value());
    EXPECT_FALSE(ChunkStore::parse_chunk_filename("part.000001").has_value());
}
