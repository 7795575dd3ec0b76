#include "chunkvault/transfer/merge_engine.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace chunkvault::transfer {

using core::UploadError;
using core::UploadResult;

namespace {
    // Closes and unlinks the partial output unless released.
    class PartialFile {
    public:
        explicit PartialFile(std::filesystem::path path)
            : path_(std::move(path))
            , fd_(::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)) {}

        ~PartialFile() {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            if (!published_) {
                ::unlink(path_.c_str());
            }
        }

        PartialFile(const PartialFile&) = delete;
        PartialFile& operator=(const PartialFile&) = delete;

        bool is_open() const { return fd_ >= 0; }

        bool append(const std::vector<uint8_t>& data) {
            const uint8_t* cursor = data.data();
            size_t remaining = data.size();
            while (remaining > 0) {
                ssize_t written = ::write(fd_, cursor, remaining);
                if (written < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                cursor += written;
                remaining -= static_cast<size_t>(written);
            }
            return true;
        }

        bool sync_and_close() {
            bool ok = ::fsync(fd_) == 0;
            ok = (::close(fd_) == 0) && ok;
            fd_ = -1;
            return ok;
        }

        bool publish(const std::filesystem::path& target) {
            if (::rename(path_.c_str(), target.c_str()) != 0) {
                return false;
            }
            published_ = true;
            return true;
        }

    private:
        std::filesystem::path path_;
        int fd_;
        bool published_ = false;
    };
}

MergeEngine::MergeEngine(const storage::StorageConfig& config,
                         std::shared_ptr<storage::ChunkStore> chunk_store)
    : config_(config), chunk_store_(std::move(chunk_store)) {
}

std::filesystem::path MergeEngine::final_path_for(const storage::UploadSession& session) const {
    return config_.get_upload_path(session.file_id) / session.filename;
}

UploadResult MergeEngine::merge(const storage::UploadSession& session, MergeOutcome& outcome) {
    auto target = final_path_for(session);
    auto directory = target.parent_path();

    if (!core::utils::FileUtils::create_directories(directory)) {
        LOG_ERROR("Cannot create upload directory {}", directory.string());
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Cannot create upload directory");
    }

    // Fixed-length name; a filename at NAME_MAX leaves no room for affixes.
    auto partial_path = directory / fmt::format(".merge.{}.partial", ::getpid());
    PartialFile output(partial_path);
    if (!output.is_open()) {
        LOG_ERROR("Cannot open {} for merge: {}", partial_path.string(), std::strerror(errno));
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Cannot open merge output");
    }

    LOG_INFO("Merging {} chunks of {} into {}", session.total_chunks, session.file_id, target.string());

    crypto::Sha256Hasher hasher;
    uint32_t expected_index = 0;

    try {
        for (const auto& entry : chunk_store_->read_ordered(session.file_id)) {
            if (entry.chunk_number >= session.total_chunks) {
                LOG_WARN("Ignoring chunk {} beyond total of {} for {}",
                         entry.chunk_number, session.total_chunks, session.file_id);
                continue;
            }
            if (entry.chunk_number != expected_index) {
                return UploadResult(UploadError::INCOMPLETE,
                                    "Chunk " + std::to_string(expected_index) + " is missing from storage");
            }

            hasher.update(entry.data);
            if (!output.append(entry.data)) {
                LOG_ERROR("Write failed while merging {}: {}", session.file_id, std::strerror(errno));
                return UploadResult(UploadError::TRANSIENT_STORAGE, "Write failed during merge");
            }
            ++expected_index;
        }
    } catch (const storage::ChunkReadError& e) {
        LOG_ERROR("Merge of {} could not read chunk {}: {}", session.file_id, e.chunk_number(), e.what());
        return UploadResult(UploadError::TRANSIENT_STORAGE,
                            "Chunk " + std::to_string(e.chunk_number()) + " unreadable during merge");
    }

    if (expected_index != session.total_chunks) {
        return UploadResult(UploadError::INCOMPLETE,
                            "Chunk " + std::to_string(expected_index) + " is missing from storage");
    }

    if (!output.sync_and_close()) {
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Failed to flush merged file");
    }

    auto final_size = hasher.bytes_processed();
    auto final_hash = hasher.finalize_hex();

    if (!crypto::hash_utils::digests_equal(final_hash, session.expected_hash)) {
        LOG_WARN("Merged content of {} hashes to {}, expected {}",
                 session.file_id, final_hash, session.expected_hash);
        return UploadResult(UploadError::HASH_MISMATCH, "Merged file hash does not match the expected hash");
    }

    if (!output.publish(target)) {
        LOG_ERROR("Cannot publish {}: {}", target.string(), std::strerror(errno));
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Failed to publish merged file");
    }
    if (!core::utils::FileUtils::sync_directory(directory)) {
        LOG_WARN("Directory sync failed after publishing {}", target.string());
    }

    if (final_size != session.declared_size) {
        LOG_WARN("{} declared {} bytes but merged {}", session.file_id, session.declared_size, final_size);
    }

    outcome.final_path = target;
    outcome.final_size = final_size;
    outcome.final_hash = final_hash;

    LOG_INFO("Merged {} ({} bytes, sha256 {})", session.file_id, final_size, final_hash);
    return UploadResult();
}

}
