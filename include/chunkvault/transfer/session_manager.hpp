#pragma once

#include "chunkvault/core/identity.hpp"
#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/storage/metadata_store.hpp"
#include "chunkvault/storage/upload_session.hpp"
#include "chunkvault/transfer/merge_engine.hpp"
#include "chunkvault/transfer/network_monitor.hpp"
#include "chunkvault/transfer/retry_coordinator.hpp"
#include "chunkvault/transfer/session_lock_registry.hpp"
#include "chunkvault/transfer/upload_events.hpp"
#include "chunkvault/transfer/upload_settings.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace chunkvault::transfer {

constexpr int64_t MAX_TOTAL_CHUNKS = 10'000'000;

struct StartSessionRequest {
    std::string file_id;
    std::string filename;
    int64_t total_chunks = 0;
    int64_t declared_size = 0;
    std::string expected_hash;
};

struct SessionHandle {
    std::string file_id;
    storage::SessionStatus status = storage::SessionStatus::UPLOADING;
    uint32_t total_chunks = 0;
    uint32_t uploaded_count = 0;
    uint64_t suggested_chunk_size = 0;
    bool resumed = false;
};

struct SessionStatusReport {
    std::string file_id;
    std::string filename;
    storage::SessionStatus status = storage::SessionStatus::UPLOADING;
    uint32_t uploaded_count = 0;
    uint32_t total_chunks = 0;
    std::vector<uint32_t> missing_indices;
    bool missing_truncated = false;
    double progress_percent = 0.0;
    uint64_t suggested_chunk_size = 0;
    uint32_t recommended_concurrency = 1;
    std::string detail;
    std::string final_path;
};

struct ChunkUpload {
    std::string file_id;
    int64_t chunk_number = 0;
    std::span<const uint8_t> payload;
    std::string claimed_hash;
    uint32_t attempt = 1;
    // Time the payload spent in transit; zero means measure server-side handling.
    std::chrono::milliseconds transfer_time{0};
};

struct ChunkReceipt {
    uint32_t chunk_number = 0;
    bool duplicate = false;
    uint32_t uploaded_count = 0;
    uint32_t total_chunks = 0;
    double progress_percent = 0.0;
    uint64_t suggested_chunk_size = 0;
};

struct FinalLocation {
    std::filesystem::path path;
    uint64_t final_size = 0;
    std::string final_hash;
};

// Owns the UploadSession lifecycle. Every status change for a file_id runs
// under that file_id's lock; hashing and chunk I/O run outside it.
class SessionManager {
public:
    SessionManager(const UploadSettings& settings,
                   std::shared_ptr<storage::MetadataStore> metadata,
                   std::shared_ptr<storage::ChunkStore> chunk_store,
                   std::shared_ptr<MergeEngine> merge_engine,
                   std::shared_ptr<NetworkMonitor> network_monitor,
                   std::shared_ptr<NotificationChannel> events = nullptr);

    core::UploadResult start_session(const core::Principal& principal,
                                     const StartSessionRequest& request,
                                     SessionHandle& handle);

    core::UploadResult get_status(const core::Principal& principal,
                                  const std::string& file_id,
                                  SessionStatusReport& report);

    core::UploadResult ingest_chunk(const core::Principal& principal,
                                    const ChunkUpload& upload,
                                    ChunkReceipt& receipt);

    core::UploadResult complete(const core::Principal& principal,
                                const std::string& file_id,
                                const std::string& expected_hash,
                                FinalLocation& location);

    core::UploadResult cancel(const core::Principal& principal, const std::string& file_id);

    // Cancels an UPLOADING session whose last activity is older than cutoff.
    core::UploadResult expire_if_stale(const std::string& file_id,
                                       std::chrono::system_clock::time_point cutoff,
                                       bool& expired);

    // Releases chunk data retained by a FAILED session idle since before cutoff.
    core::UploadResult release_failed_if_stale(const std::string& file_id,
                                               std::chrono::system_clock::time_point cutoff,
                                               bool& released);

    // Deletes a chunk directory that no UPLOADING or FAILED session owns.
    core::UploadResult remove_orphan_chunks(const std::string& file_id,
                                            std::chrono::system_clock::time_point cutoff,
                                            bool& removed);

    const UploadSettings& settings() const { return settings_; }
    size_t lock_count() const { return locks_.size() + chunk_locks_.size(); }

private:
    core::UploadResult load_owned(const core::Principal& principal,
                                  const std::string& file_id,
                                  storage::UploadSession& session);

    core::UploadResult create_session(const core::Principal& principal,
                                      const StartSessionRequest& request,
                                      bool replace,
                                      SessionHandle& handle);

    core::UploadResult reopen_failed(storage::UploadSession session, SessionHandle& handle);

    core::UploadResult storage_failure(const ChunkUpload& upload, const std::string& owner_id,
                                       const core::UploadResult& cause);

    void finish_session(const std::string& file_id);
    void emit(UploadEvent event);

    UploadSettings settings_;
    std::shared_ptr<storage::MetadataStore> metadata_;
    std::shared_ptr<storage::ChunkStore> chunk_store_;
    std::shared_ptr<MergeEngine> merge_engine_;
    std::shared_ptr<NetworkMonitor> network_monitor_;
    std::shared_ptr<NotificationChannel> events_;
    RetryCoordinator retry_;
    SessionLockRegistry locks_;
    SessionLockRegistry chunk_locks_;
};

}
