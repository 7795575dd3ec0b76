#include "chunkvault/transfer/reaper.hpp"
#include "chunkvault/core/logger.hpp"

namespace chunkvault::transfer {

Reaper::Reaper(std::shared_ptr<SessionManager> sessions,
               std::shared_ptr<storage::MetadataStore> metadata,
               std::shared_ptr<storage::ChunkStore> chunk_store,
               std::chrono::milliseconds ttl,
               std::chrono::milliseconds interval)
    : sessions_(std::move(sessions))
    , metadata_(std::move(metadata))
    , chunk_store_(std::move(chunk_store))
    , ttl_(ttl)
    , interval_(interval)
    , running_(false)
    , sweeps_(0)
    , stop_requested_(false) {
}

Reaper::~Reaper() {
    stop();
}

void Reaper::start() {
    if (running_.exchange(true)) {
        LOG_WARN("Reaper already running");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }

    thread_ = std::thread([this]() { run(); });
    LOG_INFO("Reaper started (ttl {}s, interval {}s)",
             std::chrono::duration_cast<std::chrono::seconds>(ttl_).count(),
             std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
}

void Reaper::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("Reaper stopped");
}

void Reaper::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_requested_) {
        lock.unlock();
        auto stats = run_once(std::chrono::system_clock::now());
        if (stats.expired_sessions + stats.released_failed + stats.orphaned_directories > 0 || stats.errors > 0) {
            LOG_INFO("Reaper sweep: {} expired, {} failed released, {} orphans removed, {} errors",
                     stats.expired_sessions, stats.released_failed, stats.orphaned_directories, stats.errors);
        }
        lock.lock();

        stop_cv_.wait_for(lock, interval_, [this]() { return stop_requested_; });
    }
}

ReaperStats Reaper::run_once(std::chrono::system_clock::time_point now) {
    ReaperStats stats;
    auto cutoff = now - ttl_;

    std::vector<storage::UploadSession> idle;
    auto result = metadata_->list_sessions_idle_since(storage::SessionStatus::UPLOADING, cutoff, idle);
    if (!result) {
        LOG_ERROR("Reaper could not list idle uploads: {}", result.message);
        ++stats.errors;
    }

    for (const auto& session : idle) {
        bool expired = false;
        result = sessions_->expire_if_stale(session.file_id, cutoff, expired);
        if (!result) {
            LOG_ERROR("Reaper failed to expire {}: {}", session.file_id, result.message);
            ++stats.errors;
        } else if (expired) {
            ++stats.expired_sessions;
        }
    }

    std::vector<storage::UploadSession> failed;
    result = metadata_->list_sessions_idle_since(storage::SessionStatus::FAILED, cutoff, failed);
    if (!result) {
        LOG_ERROR("Reaper could not list failed uploads: {}", result.message);
        ++stats.errors;
    }

    for (const auto& session : failed) {
        if (!chunk_store_->last_modified(session.file_id)) {
            continue;
        }
        bool released = false;
        result = sessions_->release_failed_if_stale(session.file_id, cutoff, released);
        if (!result) {
            LOG_ERROR("Reaper failed to release {}: {}", session.file_id, result.message);
            ++stats.errors;
        } else if (released) {
            ++stats.released_failed;
        }
    }

    for (const auto& file_id : chunk_store_->list_file_ids()) {
        bool removed = false;
        result = sessions_->remove_orphan_chunks(file_id, cutoff, removed);
        if (!result) {
            LOG_ERROR("Reaper failed to inspect chunk data of {}: {}", file_id, result.message);
            ++stats.errors;
        } else if (removed) {
            ++stats.orphaned_directories;
        }
    }

    ++sweeps_;
    return stats;
}

}
