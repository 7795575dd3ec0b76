#include "chunkvault/transfer/file_uploader.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include <algorithm>
#include <fstream>
#include <thread>
#include <vector>

namespace chunkvault::transfer {

using core::UploadError;
using core::UploadResult;

FileUploader::FileUploader(UploadTransport& transport)
    : transport_(transport)
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
}

UploadResult FileUploader::upload(const std::filesystem::path& path, const UploadOptions& options,
                                  UploadReport& report) {
    if (options.chunk_size == 0) {
        return UploadResult(UploadError::INVALID_ARGUMENT, "chunk size must be positive");
    }

    auto size = core::utils::FileUtils::file_size(path);
    if (!size) {
        return UploadResult(UploadError::NOT_FOUND, "Cannot read " + path.string());
    }

    auto file_hash = crypto::hash_utils::hex_digest_file(path);
    if (!file_hash) {
        return UploadResult(UploadError::NOT_FOUND, "Cannot hash " + path.string());
    }

    report.file_id = options.file_id.empty() ? file_hash->substr(0, 32) : options.file_id;
    report.file_hash = *file_hash;
    report.file_size = *size;
    report.total_chunks = static_cast<uint32_t>(std::max<uint64_t>(1, (*size + options.chunk_size - 1) / options.chunk_size));

    StartSessionRequest request;
    request.file_id = report.file_id;
    request.filename = path.filename().string();
    request.total_chunks = report.total_chunks;
    request.declared_size = static_cast<int64_t>(*size);
    request.expected_hash = *file_hash;

    SessionHandle handle;
    auto result = transport_.start_session(request, handle);
    if (!result) {
        return result;
    }
    report.resumed = handle.resumed;
    report.suggested_chunk_size = handle.suggested_chunk_size;

    LOG_INFO("{} upload {} ({} in {} chunks)", handle.resumed ? "Resuming" : "Starting",
             report.file_id, core::utils::StringUtils::format_bytes(*size), report.total_chunks);

    while (true) {
        SessionStatusReport status;
        result = transport_.get_status(report.file_id, status);
        if (!result) {
            return result;
        }
        if (status.missing_indices.empty()) {
            break;
        }

        for (auto chunk_number : status.missing_indices) {
            result = send_chunk(path, options, chunk_number, report);
            if (!result) {
                return result;
            }
        }
    }

    result = transport_.complete(report.file_id, report.file_hash, report.location);
    if (result) {
        LOG_INFO("Upload {} stored at {}", report.file_id, report.location.path.string());
    }
    return result;
}

UploadResult FileUploader::send_chunk(const std::filesystem::path& path, const UploadOptions& options,
                                      uint32_t chunk_number, UploadReport& report) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return UploadResult(UploadError::NOT_FOUND, "Cannot reopen " + path.string());
    }

    uint64_t offset = static_cast<uint64_t>(chunk_number) * options.chunk_size;
    uint64_t length = std::min<uint64_t>(options.chunk_size, report.file_size - std::min(offset, report.file_size));

    std::vector<uint8_t> payload(length);
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(file.gcount()) != length) {
        return UploadResult(UploadError::INVALID_STATE, "File changed while uploading: " + path.string());
    }

    auto chunk_hash = crypto::hash_utils::hex_digest(payload);

    for (uint32_t attempt = 1;; ++attempt) {
        ChunkReceipt receipt;
        auto result = transport_.ingest_chunk(report.file_id, chunk_number, payload, chunk_hash, attempt, receipt);

        if (result) {
            ++report.chunks_sent;
            report.suggested_chunk_size = receipt.suggested_chunk_size;
            if (progress_) {
                progress_(receipt);
            }
            return result;
        }

        if (result.suggested_chunk_size) {
            report.suggested_chunk_size = *result.suggested_chunk_size;
        }

        bool advised_stop = result.retry && result.retry->exhausted;
        if (!result.retryable() || advised_stop || attempt >= options.max_attempts) {
            LOG_ERROR("Chunk {} of {} failed after {} attempt(s): {}",
                      chunk_number, report.file_id, attempt, result.message);
            return result;
        }

        auto delay = result.retry ? result.retry->retry_after : std::chrono::milliseconds(0);
        LOG_WARN("Chunk {} of {} rejected ({}), retrying in {}ms",
                 chunk_number, report.file_id, core::to_string(result.error), delay.count());
        ++report.retries;
        sleeper_(delay);
    }
}

}
