#pragma once

#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/storage/metadata_store.hpp"
#include "chunkvault/transfer/session_manager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace chunkvault::transfer {

struct ReaperStats {
    size_t expired_sessions = 0;
    size_t released_failed = 0;
    size_t orphaned_directories = 0;
    size_t errors = 0;
};

// Periodic sweep that expires idle uploads and reclaims chunk data nobody owns.
// Runs once on start, then every interval until stopped.
class Reaper {
public:
    Reaper(std::shared_ptr<SessionManager> sessions,
           std::shared_ptr<storage::MetadataStore> metadata,
           std::shared_ptr<storage::ChunkStore> chunk_store,
           std::chrono::milliseconds ttl,
           std::chrono::milliseconds interval);
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // One sweep against the given clock reading. Per-session failures are
    // logged and counted, never thrown.
    ReaperStats run_once(std::chrono::system_clock::time_point now);

    uint64_t sweep_count() const { return sweeps_; }

private:
    void run();

    std::shared_ptr<SessionManager> sessions_;
    std::shared_ptr<storage::MetadataStore> metadata_;
    std::shared_ptr<storage::ChunkStore> chunk_store_;
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> sweeps_;
    std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_;
    std::thread thread_;
};

}
