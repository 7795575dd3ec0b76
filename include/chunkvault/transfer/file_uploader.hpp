#pragma once

#include "chunkvault/core/result.hpp"
#include "chunkvault/transfer/upload_transport.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace chunkvault::transfer {

struct UploadOptions {
    std::string file_id;
    uint64_t chunk_size = 1048576;
    // Client-side ceiling; the server's retry advice can end retries sooner.
    uint32_t max_attempts = 3;
};

struct UploadReport {
    std::string file_id;
    std::string file_hash;
    uint64_t file_size = 0;
    uint32_t total_chunks = 0;
    uint32_t chunks_sent = 0;
    uint32_t retries = 0;
    bool resumed = false;
    uint64_t suggested_chunk_size = 0;
    FinalLocation location;
};

// Splits a local file into fixed-size chunks and drives one upload session to completion.
class FileUploader {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using ProgressCallback = std::function<void(const ChunkReceipt&)>;

    explicit FileUploader(UploadTransport& transport);

    // Defaults to std::this_thread::sleep_for.
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    core::UploadResult upload(const std::filesystem::path& path, const UploadOptions& options,
                              UploadReport& report);

private:
    core::UploadResult send_chunk(const std::filesystem::path& path, const UploadOptions& options,
                                  uint32_t chunk_number, UploadReport& report);

    UploadTransport& transport_;
    Sleeper sleeper_;
    ProgressCallback progress_;
};

}
