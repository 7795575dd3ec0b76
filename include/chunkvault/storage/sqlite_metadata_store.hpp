#pragma once

#include "chunkvault/storage/metadata_store.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkvault::storage {

// One connection, serialized by an internal mutex.
// Pass ":memory:" as the path for a private in-memory database.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::filesystem::path& db_path);
    ~SqliteMetadataStore() override;

    SqliteMetadataStore(const SqliteMetadataStore&) = delete;
    SqliteMetadataStore& operator=(const SqliteMetadataStore&) = delete;

    core::UploadResult initialize() override;

    core::UploadResult insert_session(const UploadSession& session) override;
    core::UploadResult replace_session(const UploadSession& session) override;
    core::UploadResult get_session(const std::string& file_id, UploadSession& session) override;
    core::UploadResult update_progress(const std::string& file_id,
                                       const std::set<uint32_t>& chunk_presence,
                                       std::chrono::system_clock::time_point updated_at) override;
    core::UploadResult transition_status(const std::string& file_id,
                                         SessionStatus from,
                                         SessionStatus to,
                                         const std::string& detail,
                                         const std::string& final_path,
                                         std::chrono::system_clock::time_point updated_at) override;
    core::UploadResult list_sessions_idle_since(SessionStatus status,
                                                std::chrono::system_clock::time_point cutoff,
                                                std::vector<UploadSession>& sessions) override;

    core::UploadResult put_chunk_record(const ChunkRecord& record) override;
    core::UploadResult get_chunk_record(const std::string& file_id, uint32_t chunk_number,
                                        ChunkRecord& record) override;
    core::UploadResult list_chunk_records(const std::string& file_id,
                                          std::vector<ChunkRecord>& records) override;
    core::UploadResult remove_chunk_record(const std::string& file_id, uint32_t chunk_number) override;
    core::UploadResult remove_chunk_records(const std::string& file_id) override;

    static std::vector<uint8_t> serialize_presence(const std::set<uint32_t>& chunks);
    static bool deserialize_presence(const void* data, size_t size, std::set<uint32_t>& chunks);

private:
    bool create_tables();
    core::UploadResult write_session(const char* sql, const UploadSession& session);
    core::UploadResult execute(sqlite3_stmt* stmt, const char* what);
    bool read_session_row(sqlite3_stmt* stmt, UploadSession& session);
    core::UploadResult database_error(const char* what) const;

    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
};

}
