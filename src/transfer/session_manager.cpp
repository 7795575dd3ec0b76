#include "chunkvault/transfer/session_manager.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"

namespace chunkvault::transfer {

using core::UploadError;
using core::UploadResult;
using core::utils::StringUtils;
using core::utils::TimeUtils;
using storage::SessionStatus;
using storage::UploadSession;

namespace {
    UploadResult validate_file_id(const std::string& file_id) {
        if (!StringUtils::is_safe_identifier(file_id)) {
            return UploadResult(UploadError::INVALID_ARGUMENT,
                                "file_id must be 1-128 characters of [A-Za-z0-9._-]");
        }
        return UploadResult();
    }

    UploadResult validate_hash(const std::string& hash, const char* field) {
        if (!crypto::hash_utils::is_hex_digest(hash)) {
            return UploadResult(UploadError::INVALID_ARGUMENT,
                                std::string(field) + " must be a hex SHA-256 digest");
        }
        return UploadResult();
    }

    std::string describe_missing(const UploadSession& session) {
        auto missing = session.missing_chunks(10);
        std::vector<std::string> parts;
        for (auto index : missing) {
            parts.push_back(std::to_string(index));
        }
        auto remaining = session.total_chunks - session.uploaded_count();
        std::string text = StringUtils::join(parts, ", ");
        if (remaining > missing.size()) {
            text += ", ...";
        }
        return std::to_string(remaining) + " chunk(s) missing: " + text;
    }
}

SessionManager::SessionManager(const UploadSettings& settings,
                               std::shared_ptr<storage::MetadataStore> metadata,
                               std::shared_ptr<storage::ChunkStore> chunk_store,
                               std::shared_ptr<MergeEngine> merge_engine,
                               std::shared_ptr<NetworkMonitor> network_monitor,
                               std::shared_ptr<NotificationChannel> events)
    : settings_(settings)
    , metadata_(std::move(metadata))
    , chunk_store_(std::move(chunk_store))
    , merge_engine_(std::move(merge_engine))
    , network_monitor_(std::move(network_monitor))
    , events_(std::move(events))
    , retry_(settings) {
}

UploadResult SessionManager::start_session(const core::Principal& principal,
                                           const StartSessionRequest& request,
                                           SessionHandle& handle) {
    if (principal.user_id.empty()) {
        return UploadResult(UploadError::UNAUTHORIZED, "Anonymous callers cannot start uploads");
    }

    auto result = validate_file_id(request.file_id);
    if (!result) return result;

    if (!StringUtils::is_safe_filename(request.filename)) {
        return UploadResult(UploadError::INVALID_ARGUMENT, "filename must be a single path component");
    }
    if (request.total_chunks < 1 || request.total_chunks > MAX_TOTAL_CHUNKS) {
        return UploadResult(UploadError::INVALID_ARGUMENT, "total_chunks must be between 1 and " +
                            std::to_string(MAX_TOTAL_CHUNKS));
    }
    if (request.declared_size < 0) {
        return UploadResult(UploadError::INVALID_ARGUMENT, "declared_size must not be negative");
    }

    result = validate_hash(request.expected_hash, "expected_hash");
    if (!result) return result;

    auto guard = locks_.acquire(request.file_id);

    UploadSession existing;
    auto lookup = metadata_->get_session(request.file_id, existing);
    if (lookup.error == UploadError::NOT_FOUND) {
        return create_session(principal, request, false, handle);
    }
    if (!lookup) {
        return lookup;
    }

    UploadSession candidate;
    candidate.file_id = request.file_id;
    candidate.owner_id = principal.user_id;
    candidate.filename = request.filename;
    candidate.declared_size = static_cast<uint64_t>(request.declared_size);
    candidate.total_chunks = static_cast<uint32_t>(request.total_chunks);
    candidate.expected_hash = request.expected_hash;

    if (existing.status == SessionStatus::UPLOADING) {
        if (!existing.same_parameters(candidate)) {
            return UploadResult(UploadError::ALREADY_EXISTS,
                                "file_id " + request.file_id + " is held by an active upload");
        }

        handle.file_id = existing.file_id;
        handle.status = existing.status;
        handle.total_chunks = existing.total_chunks;
        handle.uploaded_count = existing.uploaded_count();
        handle.suggested_chunk_size = network_monitor_->suggest_chunk_size(existing.file_id);
        handle.resumed = true;

        LOG_INFO("Resuming upload {} ({}/{} chunks present)",
                 existing.file_id, handle.uploaded_count, handle.total_chunks);
        return UploadResult();
    }

    if (existing.owner_id != principal.user_id) {
        return UploadResult(UploadError::ALREADY_EXISTS,
                            "file_id " + request.file_id + " belongs to another user");
    }

    if (existing.status == SessionStatus::FAILED && existing.same_parameters(candidate)) {
        return reopen_failed(std::move(existing), handle);
    }

    // Previous terminal session is superseded
    chunk_store_->delete_all(request.file_id);
    return create_session(principal, request, true, handle);
}

UploadResult SessionManager::create_session(const core::Principal& principal,
                                            const StartSessionRequest& request,
                                            bool replace,
                                            SessionHandle& handle) {
    UploadSession session;
    session.file_id = request.file_id;
    session.owner_id = principal.user_id;
    session.filename = request.filename;
    session.declared_size = static_cast<uint64_t>(request.declared_size);
    session.total_chunks = static_cast<uint32_t>(request.total_chunks);
    session.expected_hash = StringUtils::to_lower(request.expected_hash);
    session.status = SessionStatus::UPLOADING;
    session.created_at = TimeUtils::now();
    session.updated_at = session.created_at;

    auto result = replace ? metadata_->replace_session(session) : metadata_->insert_session(session);
    if (!result) {
        return result;
    }

    network_monitor_->end_session(session.file_id);

    handle.file_id = session.file_id;
    handle.status = session.status;
    handle.total_chunks = session.total_chunks;
    handle.uploaded_count = 0;
    handle.suggested_chunk_size = settings_.default_chunk_size;
    handle.resumed = false;

    LOG_INFO("Started upload {} for {}: {} ({} bytes in {} chunks)",
             session.file_id, session.owner_id, session.filename,
             session.declared_size, session.total_chunks);

    UploadEvent event{UploadEventType::SESSION_STARTED, session.file_id, session.owner_id};
    emit(std::move(event));
    return UploadResult();
}

UploadResult SessionManager::reopen_failed(UploadSession session, SessionHandle& handle) {
    session.chunk_presence.clear();
    for (auto index : chunk_store_->verified_chunks(session.file_id)) {
        if (index < session.total_chunks) {
            session.chunk_presence.insert(index);
        }
    }

    session.status = SessionStatus::UPLOADING;
    session.detail.clear();
    session.final_path.clear();
    session.updated_at = TimeUtils::now();

    auto result = metadata_->replace_session(session);
    if (!result) {
        return result;
    }

    handle.file_id = session.file_id;
    handle.status = session.status;
    handle.total_chunks = session.total_chunks;
    handle.uploaded_count = session.uploaded_count();
    handle.suggested_chunk_size = network_monitor_->suggest_chunk_size(session.file_id);
    handle.resumed = true;

    LOG_INFO("Reopened failed upload {} with {} retained chunk(s)", session.file_id, handle.uploaded_count);

    UploadEvent event{UploadEventType::SESSION_STARTED, session.file_id, session.owner_id};
    event.reason = "reopened";
    emit(std::move(event));
    return UploadResult();
}

UploadResult SessionManager::get_status(const core::Principal& principal,
                                        const std::string& file_id,
                                        SessionStatusReport& report) {
    auto result = validate_file_id(file_id);
    if (!result) return result;

    UploadSession session;
    result = load_owned(principal, file_id, session);
    if (!result) return result;

    report.file_id = session.file_id;
    report.filename = session.filename;
    report.status = session.status;
    report.uploaded_count = session.uploaded_count();
    report.total_chunks = session.total_chunks;
    report.missing_indices = session.missing_chunks(settings_.status_preview_limit);
    report.missing_truncated = session.total_chunks - report.uploaded_count > report.missing_indices.size();
    report.progress_percent = session.progress_percent();
    report.suggested_chunk_size = network_monitor_->suggest_chunk_size(file_id);
    report.recommended_concurrency = network_monitor_->recommended_concurrency(file_id);
    report.detail = session.detail;
    report.final_path = session.final_path;
    return UploadResult();
}

UploadResult SessionManager::ingest_chunk(const core::Principal& principal,
                                          const ChunkUpload& upload,
                                          ChunkReceipt& receipt) {
    auto started = std::chrono::steady_clock::now();

    auto result = validate_file_id(upload.file_id);
    if (!result) return result;

    result = validate_hash(upload.claimed_hash, "chunk hash");
    if (!result) return result;

    UploadSession session;
    result = load_owned(principal, upload.file_id, session);
    if (!result) return result;

    if (session.status != SessionStatus::UPLOADING) {
        return UploadResult(UploadError::INVALID_STATE,
                            std::string("Upload is ") + storage::to_string(session.status));
    }
    if (upload.chunk_number < 0 || upload.chunk_number >= session.total_chunks) {
        return UploadResult(UploadError::INVALID_ARGUMENT,
                            "chunk_number " + std::to_string(upload.chunk_number) +
                            " outside [0, " + std::to_string(session.total_chunks) + ")");
    }
    if (upload.payload.empty() && session.declared_size > 0) {
        return UploadResult(UploadError::INVALID_ARGUMENT, "Chunk payload is empty");
    }

    auto chunk_number = static_cast<uint32_t>(upload.chunk_number);

    // Integrity gate, before anything touches storage
    auto computed_hash = crypto::hash_utils::hex_digest(upload.payload);
    if (!crypto::hash_utils::digests_equal(computed_hash, upload.claimed_hash)) {
        LOG_WARN("Chunk {} of {} failed integrity check (attempt {})",
                 chunk_number, upload.file_id, upload.attempt);

        UploadEvent event{UploadEventType::CHUNK_REJECTED, upload.file_id, session.owner_id, chunk_number};
        event.reason = "hash mismatch";
        emit(std::move(event));

        UploadResult rejected(UploadError::CHUNK_INTEGRITY, "Chunk content does not match its hash");
        rejected.retry = retry_.advise(upload.attempt);
        rejected.suggested_chunk_size = network_monitor_->suggest_chunk_size(upload.file_id);
        return rejected;
    }

    {
        auto guard = locks_.acquire(upload.file_id);

        result = metadata_->get_session(upload.file_id, session);
        if (!result) return result;
        if (session.status != SessionStatus::UPLOADING) {
            return UploadResult(UploadError::INVALID_STATE,
                                std::string("Upload is ") + storage::to_string(session.status));
        }

        if (session.chunk_presence.count(chunk_number) > 0) {
            storage::ChunkRecord existing;
            auto lookup = chunk_store_->get_record(upload.file_id, chunk_number, existing);
            if (lookup && crypto::hash_utils::digests_equal(existing.content_hash, computed_hash)) {
                result = metadata_->update_progress(upload.file_id, session.chunk_presence, TimeUtils::now());
                if (!result) return result;

                receipt.chunk_number = chunk_number;
                receipt.duplicate = true;
                receipt.uploaded_count = session.uploaded_count();
                receipt.total_chunks = session.total_chunks;
                receipt.progress_percent = session.progress_percent();
                receipt.suggested_chunk_size = network_monitor_->suggest_chunk_size(upload.file_id);

                LOG_DEBUG("Chunk {} of {} already stored", chunk_number, upload.file_id);
                return UploadResult();
            }
            LOG_INFO("Replacing chunk {} of {} with different content", chunk_number, upload.file_id);
        }
    }

    // Serializes writers of one index so the file on disk and its record come from the same payload
    auto chunk_guard = chunk_locks_.acquire(upload.file_id + "#" + std::to_string(chunk_number));

    storage::ChunkRecord record;
    auto write_started = std::chrono::steady_clock::now();
    result = chunk_store_->write(upload.file_id, chunk_number, upload.payload, computed_hash, record);
    if (!result) {
        // A cancel can remove the chunk directory under an in-flight write
        UploadSession current;
        if (metadata_->get_session(upload.file_id, current) && current.status != SessionStatus::UPLOADING) {
            return UploadResult(UploadError::INVALID_STATE,
                                std::string("Upload is ") + storage::to_string(current.status));
        }
        return storage_failure(upload, session.owner_id, result);
    }
    auto write_finished = std::chrono::steady_clock::now();

    {
        auto guard = locks_.acquire(upload.file_id);

        result = metadata_->get_session(upload.file_id, session);
        if (!result) return result;

        if (session.status != SessionStatus::UPLOADING) {
            // Ended while this chunk was in flight
            if (session.status == SessionStatus::FAILED) {
                chunk_store_->remove_chunk(upload.file_id, chunk_number);
            } else {
                chunk_store_->delete_all(upload.file_id);
            }
            return UploadResult(UploadError::INVALID_STATE,
                                std::string("Upload is ") + storage::to_string(session.status));
        }

        session.chunk_presence.insert(chunk_number);
        result = metadata_->update_progress(upload.file_id, session.chunk_presence, TimeUtils::now());
        if (!result) {
            chunk_store_->remove_chunk(upload.file_id, chunk_number);
            return result;
        }
    }
    chunk_guard.release();

    auto elapsed = upload.transfer_time.count() > 0
        ? upload.transfer_time
        : std::chrono::duration_cast<std::chrono::milliseconds>(write_finished - started);
    network_monitor_->record(upload.file_id, PerformanceSample{upload.payload.size(), elapsed, true});

    receipt.chunk_number = chunk_number;
    receipt.duplicate = false;
    receipt.uploaded_count = session.uploaded_count();
    receipt.total_chunks = session.total_chunks;
    receipt.progress_percent = session.progress_percent();
    receipt.suggested_chunk_size = network_monitor_->suggest_chunk_size(upload.file_id);

    LOG_DEBUG("Accepted chunk {} of {} ({}/{}, write {}ms)", chunk_number, upload.file_id,
              receipt.uploaded_count, receipt.total_chunks,
              std::chrono::duration_cast<std::chrono::milliseconds>(write_finished - write_started).count());

    UploadEvent event{UploadEventType::CHUNK_ACCEPTED, upload.file_id, session.owner_id, chunk_number};
    emit(std::move(event));
    return UploadResult();
}

UploadResult SessionManager::storage_failure(const ChunkUpload& upload, const std::string& owner_id,
                                             const UploadResult& cause) {
    auto elapsed = upload.transfer_time.count() > 0 ? upload.transfer_time : std::chrono::milliseconds(0);
    network_monitor_->record(upload.file_id, PerformanceSample{upload.payload.size(), elapsed, false});

    auto advice = retry_.advise(upload.attempt);

    UploadResult result(advice.exhausted ? UploadError::RETRY_BUDGET_EXHAUSTED : UploadError::TRANSIENT_STORAGE,
                        cause.message);
    result.retry = advice;
    result.suggested_chunk_size = network_monitor_->suggest_chunk_size(upload.file_id);

    if (advice.exhausted) {
        LOG_WARN("Chunk {} of {} failed on final attempt {}/{}: {}",
                 upload.chunk_number, upload.file_id, advice.attempt, advice.max_attempts, cause.message);
    } else {
        LOG_WARN("Chunk {} of {} failed (attempt {}/{}), retry after {}ms: {}",
                 upload.chunk_number, upload.file_id, advice.attempt, advice.max_attempts,
                 advice.retry_after.count(), cause.message);
    }

    UploadEvent event{UploadEventType::CHUNK_REJECTED, upload.file_id, owner_id,
                      static_cast<uint32_t>(upload.chunk_number)};
    event.reason = cause.message;
    emit(std::move(event));
    return result;
}

UploadResult SessionManager::complete(const core::Principal& principal,
                                      const std::string& file_id,
                                      const std::string& expected_hash,
                                      FinalLocation& location) {
    auto result = validate_file_id(file_id);
    if (!result) return result;

    result = validate_hash(expected_hash, "expected_hash");
    if (!result) return result;

    auto guard = locks_.acquire(file_id);

    UploadSession session;
    result = load_owned(principal, file_id, session);
    if (!result) return result;

    if (!crypto::hash_utils::digests_equal(expected_hash, session.expected_hash)) {
        return UploadResult(UploadError::HASH_MISMATCH,
                            "Provided hash differs from the hash declared at session start");
    }

    if (session.status == SessionStatus::COMPLETED) {
        location.path = session.final_path;
        location.final_size = core::utils::FileUtils::file_size(session.final_path).value_or(session.declared_size);
        location.final_hash = session.expected_hash;
        return UploadResult();
    }
    if (session.status != SessionStatus::UPLOADING) {
        return UploadResult(UploadError::INVALID_STATE,
                            std::string("Upload is ") + storage::to_string(session.status));
    }
    if (!session.is_complete()) {
        return UploadResult(UploadError::INCOMPLETE, describe_missing(session));
    }

    UploadEvent started{UploadEventType::MERGE_STARTED, file_id, session.owner_id};
    emit(std::move(started));

    MergeOutcome outcome;
    result = merge_engine_->merge(session, outcome);

    if (result.error == UploadError::HASH_MISMATCH) {
        auto transition = metadata_->transition_status(file_id, SessionStatus::UPLOADING, SessionStatus::FAILED,
                                                       result.message, "", TimeUtils::now());
        if (!transition) {
            LOG_ERROR("Could not mark {} as failed: {}", file_id, transition.message);
            return transition;
        }

        UploadEvent failed{UploadEventType::SESSION_FAILED, file_id, session.owner_id};
        failed.reason = result.message;
        emit(std::move(failed));

        guard.release();
        finish_session(file_id);
        return result;
    }

    if (result.error == UploadError::INCOMPLETE) {
        // Presence said complete but storage disagrees: trust storage
        auto stored = chunk_store_->list_chunks(file_id);
        session.chunk_presence = std::set<uint32_t>(stored.begin(), stored.end());
        for (auto it = session.chunk_presence.begin(); it != session.chunk_presence.end();) {
            it = *it >= session.total_chunks ? session.chunk_presence.erase(it) : std::next(it);
        }
        auto update = metadata_->update_progress(file_id, session.chunk_presence, TimeUtils::now());
        if (!update) return update;

        LOG_WARN("Chunk data of {} was incomplete at merge, {}", file_id, describe_missing(session));
        return UploadResult(UploadError::INCOMPLETE, describe_missing(session));
    }

    if (!result) {
        result.retry = retry_.advise(1);
        return result;
    }

    auto transition = metadata_->transition_status(file_id, SessionStatus::UPLOADING, SessionStatus::COMPLETED,
                                                   "", outcome.final_path.string(), TimeUtils::now());
    if (!transition) {
        LOG_ERROR("Could not mark {} as completed: {}", file_id, transition.message);
        return transition;
    }

    chunk_store_->delete_all(file_id);

    location.path = outcome.final_path;
    location.final_size = outcome.final_size;
    location.final_hash = outcome.final_hash;

    LOG_INFO("Upload {} completed at {}", file_id, outcome.final_path.string());

    UploadEvent completed{UploadEventType::SESSION_COMPLETED, file_id, session.owner_id};
    completed.final_size = outcome.final_size;
    completed.final_hash = outcome.final_hash;
    emit(std::move(completed));

    guard.release();
    finish_session(file_id);
    return UploadResult();
}

UploadResult SessionManager::cancel(const core::Principal& principal, const std::string& file_id) {
    auto result = validate_file_id(file_id);
    if (!result) return result;

    auto guard = locks_.acquire(file_id);

    UploadSession session;
    result = load_owned(principal, file_id, session);
    if (!result) return result;

    switch (session.status) {
        case SessionStatus::CANCELLED:
            return UploadResult();
        case SessionStatus::COMPLETED:
            return UploadResult(UploadError::INVALID_STATE, "Upload already completed");
        case SessionStatus::FAILED:
            chunk_store_->delete_all(file_id);
            LOG_INFO("Released retained chunks of failed upload {}", file_id);
            return UploadResult();
        case SessionStatus::UPLOADING:
            break;
    }

    result = metadata_->transition_status(file_id, SessionStatus::UPLOADING, SessionStatus::CANCELLED,
                                          "cancelled by owner", "", TimeUtils::now());
    if (!result) return result;

    chunk_store_->delete_all(file_id);
    LOG_INFO("Upload {} cancelled by {}", file_id, principal.user_id);

    UploadEvent event{UploadEventType::SESSION_CANCELLED, file_id, session.owner_id};
    event.reason = "cancelled by owner";
    emit(std::move(event));

    guard.release();
    finish_session(file_id);
    return UploadResult();
}

UploadResult SessionManager::expire_if_stale(const std::string& file_id,
                                             std::chrono::system_clock::time_point cutoff,
                                             bool& expired) {
    expired = false;
    auto guard = locks_.acquire(file_id);

    UploadSession session;
    auto result = metadata_->get_session(file_id, session);
    if (!result) return result;

    if (session.status != SessionStatus::UPLOADING || session.updated_at >= cutoff) {
        return UploadResult();
    }

    result = metadata_->transition_status(file_id, SessionStatus::UPLOADING, SessionStatus::CANCELLED,
                                          "expired", "", TimeUtils::now());
    if (!result) return result;

    chunk_store_->delete_all(file_id);
    expired = true;
    LOG_INFO("Expired idle upload {} (last activity {})", file_id, TimeUtils::to_iso_string(session.updated_at));

    UploadEvent event{UploadEventType::SESSION_CANCELLED, file_id, session.owner_id};
    event.reason = "expired";
    emit(std::move(event));

    guard.release();
    finish_session(file_id);
    return UploadResult();
}

UploadResult SessionManager::release_failed_if_stale(const std::string& file_id,
                                                     std::chrono::system_clock::time_point cutoff,
                                                     bool& released) {
    released = false;
    auto guard = locks_.acquire(file_id);

    UploadSession session;
    auto result = metadata_->get_session(file_id, session);
    if (!result) return result;

    if (session.status == SessionStatus::FAILED && session.updated_at < cutoff) {
        chunk_store_->delete_all(file_id);
        released = true;
        LOG_INFO("Released retained chunks of failed upload {}", file_id);
    }

    return UploadResult();
}

UploadResult SessionManager::remove_orphan_chunks(const std::string& file_id,
                                                  std::chrono::system_clock::time_point cutoff,
                                                  bool& removed) {
    removed = false;
    auto guard = locks_.acquire(file_id);

    UploadSession session;
    auto result = metadata_->get_session(file_id, session);
    if (result) {
        if (session.status == SessionStatus::UPLOADING || session.status == SessionStatus::FAILED) {
            return UploadResult();
        }
    } else if (result.error != UploadError::NOT_FOUND) {
        return result;
    }

    auto modified = chunk_store_->last_modified(file_id);
    if (modified && *modified < cutoff) {
        chunk_store_->delete_all(file_id);
        removed = true;
        LOG_INFO("Removed orphaned chunk data for {}", file_id);
    }

    return UploadResult();
}

UploadResult SessionManager::load_owned(const core::Principal& principal,
                                        const std::string& file_id,
                                        UploadSession& session) {
    auto result = metadata_->get_session(file_id, session);
    if (!result) return result;

    if (session.owner_id != principal.user_id) {
        LOG_WARN("{} denied access to upload {}", principal.user_id, file_id);
        return UploadResult(UploadError::UNAUTHORIZED, "Not authorized for this upload");
    }
    return UploadResult();
}

void SessionManager::finish_session(const std::string& file_id) {
    network_monitor_->end_session(file_id);
}

void SessionManager::emit(UploadEvent event) {
    if (events_) {
        events_->publish(event);
    }
}

}
