#include "chunkvault/storage/sqlite_metadata_store.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <sqlite3.h>

namespace chunkvault::storage {

using core::UploadError;
using core::UploadResult;
using core::utils::TimeUtils;

namespace {
    // Finalizes on scope exit.
    class Statement {
    public:
        Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
            if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
                stmt_ = nullptr;
            }
        }
        ~Statement() { sqlite3_finalize(stmt_); }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        sqlite3_stmt* get() const { return stmt_; }
        explicit operator bool() const { return stmt_ != nullptr; }

    private:
        sqlite3_stmt* stmt_;
    };

    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
        sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    std::string column_text(sqlite3_stmt* stmt, int column) {
        auto text = sqlite3_column_text(stmt, column);
        if (!text) return {};
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
    }

    constexpr const char* session_columns =
        "file_id, owner_id, filename, declared_size, total_chunks, expected_hash, "
        "chunk_presence, status, detail, final_path, created_at, updated_at";
}

SqliteMetadataStore::SqliteMetadataStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SqliteMetadataStore::~SqliteMetadataStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

UploadResult SqliteMetadataStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return UploadResult();
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        auto error = database_error("open database");
        sqlite3_close(db_);
        db_ = nullptr;
        return error;
    }

    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) {
        return database_error("create tables");
    }

    LOG_INFO("Metadata store opened at {}", db_path_.string());
    return UploadResult();
}

bool SqliteMetadataStore::create_tables() {
    const char* schema = R"(
        PRAGMA journal_mode = WAL;
        PRAGMA synchronous = FULL;

        CREATE TABLE IF NOT EXISTS upload_sessions (
            file_id TEXT PRIMARY KEY,
            owner_id TEXT NOT NULL,
            filename TEXT NOT NULL,
            declared_size INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            expected_hash TEXT NOT NULL,
            chunk_presence BLOB,
            status TEXT NOT NULL,
            detail TEXT,
            final_path TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS chunk_records (
            file_id TEXT NOT NULL,
            chunk_number INTEGER NOT NULL,
            byte_length INTEGER NOT NULL,
            content_hash TEXT NOT NULL,
            written_at INTEGER NOT NULL,
            PRIMARY KEY (file_id, chunk_number)
        );

        CREATE INDEX IF NOT EXISTS idx_sessions_status_updated ON upload_sessions(status, updated_at);
    )";

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, schema, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create metadata tables: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }

    return true;
}

UploadResult SqliteMetadataStore::insert_session(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    static const std::string sql =
        std::string("INSERT INTO upload_sessions (") + session_columns +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    return write_session(sql.c_str(), session);
}

UploadResult SqliteMetadataStore::replace_session(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    static const std::string sql =
        std::string("INSERT OR REPLACE INTO upload_sessions (") + session_columns +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    return write_session(sql.c_str(), session);
}

UploadResult SqliteMetadataStore::write_session(const char* sql, const UploadSession& session) {
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_, sql);
    if (!stmt) {
        return database_error("prepare session write");
    }

    auto presence = serialize_presence(session.chunk_presence);

    bind_text(stmt.get(), 1, session.file_id);
    bind_text(stmt.get(), 2, session.owner_id);
    bind_text(stmt.get(), 3, session.filename);
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(session.declared_size));
    sqlite3_bind_int64(stmt.get(), 5, session.total_chunks);
    bind_text(stmt.get(), 6, session.expected_hash);
    sqlite3_bind_blob(stmt.get(), 7, presence.data(), static_cast<int>(presence.size()), SQLITE_TRANSIENT);
    bind_text(stmt.get(), 8, to_string(session.status));
    bind_text(stmt.get(), 9, session.detail);
    bind_text(stmt.get(), 10, session.final_path);
    sqlite3_bind_int64(stmt.get(), 11, TimeUtils::to_epoch_ms(session.created_at));
    sqlite3_bind_int64(stmt.get(), 12, TimeUtils::to_epoch_ms(session.updated_at));

    int result = sqlite3_step(stmt.get());
    if (result == SQLITE_CONSTRAINT) {
        return UploadResult(UploadError::ALREADY_EXISTS, "Session already exists: " + session.file_id);
    }
    if (result != SQLITE_DONE) {
        return database_error("write session");
    }

    return UploadResult();
}

UploadResult SqliteMetadataStore::get_session(const std::string& file_id, UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    static const std::string sql =
        std::string("SELECT ") + session_columns + " FROM upload_sessions WHERE file_id = ?;";
    Statement stmt(db_, sql.c_str());
    if (!stmt) {
        return database_error("prepare session lookup");
    }

    bind_text(stmt.get(), 1, file_id);
    int result = sqlite3_step(stmt.get());

    if (result == SQLITE_DONE) {
        return UploadResult(UploadError::NOT_FOUND, "Unknown file_id: " + file_id);
    }
    if (result != SQLITE_ROW) {
        return database_error("read session");
    }
    if (!read_session_row(stmt.get(), session)) {
        return UploadResult(UploadError::INTERNAL, "Corrupt session row for " + file_id);
    }

    return UploadResult();
}

UploadResult SqliteMetadataStore::update_progress(const std::string& file_id,
                                                  const std::set<uint32_t>& chunk_presence,
                                                  std::chrono::system_clock::time_point updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_,
        "UPDATE upload_sessions SET chunk_presence = ?, updated_at = ? "
        "WHERE file_id = ? AND status = 'uploading';");
    if (!stmt) {
        return database_error("prepare progress update");
    }

    auto presence = serialize_presence(chunk_presence);
    sqlite3_bind_blob(stmt.get(), 1, presence.data(), static_cast<int>(presence.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, TimeUtils::to_epoch_ms(updated_at));
    bind_text(stmt.get(), 3, file_id);

    auto result = execute(stmt.get(), "update progress");
    if (!result) {
        return result;
    }
    if (sqlite3_changes(db_) != 1) {
        return UploadResult(UploadError::INVALID_STATE, "Session is not uploading: " + file_id);
    }
    return UploadResult();
}

UploadResult SqliteMetadataStore::transition_status(const std::string& file_id,
                                                    SessionStatus from,
                                                    SessionStatus to,
                                                    const std::string& detail,
                                                    const std::string& final_path,
                                                    std::chrono::system_clock::time_point updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_,
        "UPDATE upload_sessions SET status = ?, detail = ?, final_path = ?, updated_at = ? "
        "WHERE file_id = ? AND status = ?;");
    if (!stmt) {
        return database_error("prepare status transition");
    }

    bind_text(stmt.get(), 1, to_string(to));
    bind_text(stmt.get(), 2, detail);
    bind_text(stmt.get(), 3, final_path);
    sqlite3_bind_int64(stmt.get(), 4, TimeUtils::to_epoch_ms(updated_at));
    bind_text(stmt.get(), 5, file_id);
    bind_text(stmt.get(), 6, to_string(from));

    auto result = execute(stmt.get(), "transition status");
    if (!result) {
        return result;
    }
    if (sqlite3_changes(db_) != 1) {
        return UploadResult(UploadError::INVALID_STATE,
                            std::string("Session ") + file_id + " is not " + to_string(from));
    }
    return UploadResult();
}

UploadResult SqliteMetadataStore::list_sessions_idle_since(SessionStatus status,
                                                           std::chrono::system_clock::time_point cutoff,
                                                           std::vector<UploadSession>& sessions) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    static const std::string sql =
        std::string("SELECT ") + session_columns +
        " FROM upload_sessions WHERE status = ? AND updated_at < ? ORDER BY updated_at;";
    Statement stmt(db_, sql.c_str());
    if (!stmt) {
        return database_error("prepare idle session query");
    }

    bind_text(stmt.get(), 1, to_string(status));
    sqlite3_bind_int64(stmt.get(), 2, TimeUtils::to_epoch_ms(cutoff));

    sessions.clear();
    int result;
    while ((result = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        UploadSession session;
        if (read_session_row(stmt.get(), session)) {
            sessions.push_back(std::move(session));
        } else {
            LOG_WARN("Skipping corrupt session row");
        }
    }

    if (result != SQLITE_DONE) {
        return database_error("list idle sessions");
    }
    return UploadResult();
}

UploadResult SqliteMetadataStore::put_chunk_record(const ChunkRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_,
        "INSERT OR REPLACE INTO chunk_records (file_id, chunk_number, byte_length, content_hash, written_at) "
        "VALUES (?, ?, ?, ?, ?);");
    if (!stmt) {
        return database_error("prepare chunk record write");
    }

    bind_text(stmt.get(), 1, record.file_id);
    sqlite3_bind_int64(stmt.get(), 2, record.chunk_number);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(record.byte_length));
    bind_text(stmt.get(), 4, record.content_hash);
    sqlite3_bind_int64(stmt.get(), 5, TimeUtils::to_epoch_ms(record.written_at));

    return execute(stmt.get(), "write chunk record");
}

UploadResult SqliteMetadataStore::get_chunk_record(const std::string& file_id, uint32_t chunk_number,
                                                   ChunkRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_,
        "SELECT byte_length, content_hash, written_at FROM chunk_records "
        "WHERE file_id = ? AND chunk_number = ?;");
    if (!stmt) {
        return database_error("prepare chunk record lookup");
    }

    bind_text(stmt.get(), 1, file_id);
    sqlite3_bind_int64(stmt.get(), 2, chunk_number);

    int result = sqlite3_step(stmt.get());
    if (result == SQLITE_DONE) {
        return UploadResult(UploadError::NOT_FOUND,
                            "No chunk " + std::to_string(chunk_number) + " for " + file_id);
    }
    if (result != SQLITE_ROW) {
        return database_error("read chunk record");
    }

    record.file_id = file_id;
    record.chunk_number = chunk_number;
    record.byte_length = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
    record.content_hash = column_text(stmt.get(), 1);
    record.written_at = TimeUtils::from_epoch_ms(sqlite3_column_int64(stmt.get(), 2));
    return UploadResult();
}

UploadResult SqliteMetadataStore::list_chunk_records(const std::string& file_id,
                                                     std::vector<ChunkRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_,
        "SELECT chunk_number, byte_length, content_hash, written_at FROM chunk_records "
        "WHERE file_id = ? ORDER BY chunk_number;");
    if (!stmt) {
        return database_error("prepare chunk record listing");
    }

    bind_text(stmt.get(), 1, file_id);

    records.clear();
    int result;
    while ((result = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ChunkRecord record;
        record.file_id = file_id;
        record.chunk_number = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 0));
        record.byte_length = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1));
        record.content_hash = column_text(stmt.get(), 2);
        record.written_at = TimeUtils::from_epoch_ms(sqlite3_column_int64(stmt.get(), 3));
        records.push_back(std::move(record));
    }

    if (result != SQLITE_DONE) {
        return database_error("list chunk records");
    }
    return UploadResult();
}

UploadResult SqliteMetadataStore::remove_chunk_record(const std::string& file_id, uint32_t chunk_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_, "DELETE FROM chunk_records WHERE file_id = ? AND chunk_number = ?;");
    if (!stmt) {
        return database_error("prepare chunk record delete");
    }

    bind_text(stmt.get(), 1, file_id);
    sqlite3_bind_int64(stmt.get(), 2, chunk_number);
    return execute(stmt.get(), "delete chunk record");
}

UploadResult SqliteMetadataStore::remove_chunk_records(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return UploadResult(UploadError::INTERNAL, "Metadata store not initialized");
    }

    Statement stmt(db_, "DELETE FROM chunk_records WHERE file_id = ?;");
    if (!stmt) {
        return database_error("prepare chunk records delete");
    }

    bind_text(stmt.get(), 1, file_id);
    return execute(stmt.get(), "delete chunk records");
}

std::vector<uint8_t> SqliteMetadataStore::serialize_presence(const std::set<uint32_t>& chunks) {
    std::vector<uint8_t> buffer;
    buffer.reserve(chunks.size() * 4);

    for (auto index : chunks) {
        buffer.push_back((index >> 24) & 0xFF);
        buffer.push_back((index >> 16) & 0xFF);
        buffer.push_back((index >> 8) & 0xFF);
        buffer.push_back(index & 0xFF);
    }

    return buffer;
}

bool SqliteMetadataStore::deserialize_presence(const void* data, size_t size, std::set<uint32_t>& chunks) {
    chunks.clear();
    if (size % 4 != 0) {
        return false;
    }

    auto bytes = static_cast<const uint8_t*>(data);
    for (size_t offset = 0; offset < size; offset += 4) {
        uint32_t index = (static_cast<uint32_t>(bytes[offset]) << 24) |
                         (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
                         (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
                         static_cast<uint32_t>(bytes[offset + 3]);
        chunks.insert(index);
    }

    return true;
}

UploadResult SqliteMetadataStore::execute(sqlite3_stmt* stmt, const char* what) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return database_error(what);
    }
    return UploadResult();
}

bool SqliteMetadataStore::read_session_row(sqlite3_stmt* stmt, UploadSession& session) {
    session.file_id = column_text(stmt, 0);
    session.owner_id = column_text(stmt, 1);
    session.filename = column_text(stmt, 2);
    session.declared_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    session.total_chunks = static_cast<uint32_t>(sqlite3_column_int64(stmt, 4));
    session.expected_hash = column_text(stmt, 5);

    if (!deserialize_presence(sqlite3_column_blob(stmt, 6),
                              static_cast<size_t>(sqlite3_column_bytes(stmt, 6)),
                              session.chunk_presence)) {
        return false;
    }

    auto status = status_from_string(column_text(stmt, 7));
    if (!status) {
        return false;
    }
    session.status = *status;
    session.detail = column_text(stmt, 8);
    session.final_path = column_text(stmt, 9);
    session.created_at = TimeUtils::from_epoch_ms(sqlite3_column_int64(stmt, 10));
    session.updated_at = TimeUtils::from_epoch_ms(sqlite3_column_int64(stmt, 11));
    return true;
}

UploadResult SqliteMetadataStore::database_error(const char* what) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "no database handle";
    LOG_ERROR("Metadata store failed to {}: {}", what, detail);
    return UploadResult(UploadError::INTERNAL, std::string("Failed to ") + what + ": " + detail);
}

}
