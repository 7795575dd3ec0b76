#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string_view>
#include <fcntl.h>
#include <unistd.h>

namespace chunkvault::storage {

using core::UploadError;
using core::UploadResult;
using core::utils::FileUtils;

namespace {
    constexpr const char* CHUNK_PREFIX = "chunk.";

    std::string temp_suffix() {
        static std::atomic<uint64_t> counter{0};
        return fmt::format(".tmp.{}.{}", ::getpid(), counter.fetch_add(1));
    }

    bool write_fully(int fd, const uint8_t* data, size_t size) {
        while (size > 0) {
            ssize_t written = ::write(fd, data, size);
            if (written < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += written;
            size -= static_cast<size_t>(written);
        }
        return true;
    }
}

ChunkSequence::iterator::iterator(const ChunkSequence* sequence,
                                  std::shared_ptr<const std::vector<uint32_t>> order)
    : sequence_(sequence), order_(std::move(order)), position_(0) {
    load();
}

ChunkSequence::iterator& ChunkSequence::iterator::operator++() {
    ++position_;
    load();
    return *this;
}

bool ChunkSequence::iterator::operator==(const iterator& other) const {
    if (sequence_ == nullptr || other.sequence_ == nullptr) {
        return sequence_ == other.sequence_;
    }
    return sequence_ == other.sequence_ && position_ == other.position_;
}

void ChunkSequence::iterator::load() {
    if (!sequence_ || position_ >= order_->size()) {
        sequence_ = nullptr;
        current_ = Entry();
        return;
    }

    current_.chunk_number = (*order_)[position_];
    sequence_->load_chunk(current_.chunk_number, current_.data);
}

ChunkSequence::iterator ChunkSequence::begin() const {
    auto order = std::make_shared<const std::vector<uint32_t>>(store_->list_chunks(file_id_));
    return iterator(this, std::move(order));
}

void ChunkSequence::load_chunk(uint32_t chunk_number, std::vector<uint8_t>& data) const {
    auto path = store_->chunk_path(file_id_, chunk_number);
    if (!store_->read_back(path, data)) {
        throw ChunkReadError(chunk_number, "Failed to read " + path.string());
    }
}

ChunkStore::ChunkStore(const StorageConfig& config, std::shared_ptr<MetadataStore> metadata)
    : config_(config), metadata_(std::move(metadata)) {
}

UploadResult ChunkStore::initialize() {
    if (!FileUtils::create_directories(config_.chunk_directory)) {
        return UploadResult(UploadError::INTERNAL,
                            "Cannot create chunk directory " + config_.chunk_directory.string());
    }
    return UploadResult();
}

UploadResult ChunkStore::write(const std::string& file_id, uint32_t chunk_number,
                               std::span<const uint8_t> payload, const std::string& content_hash,
                               ChunkRecord& record) {
    auto directory = chunk_directory(file_id);
    if (!FileUtils::create_directories(directory)) {
        LOG_ERROR("Cannot create chunk directory {}", directory.string());
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Cannot create chunk directory");
    }

    auto target = chunk_path(file_id, chunk_number);
    std::string error;
    if (!persist(target, payload, error)) {
        LOG_WARN("Chunk {} of {} not persisted: {}", chunk_number, file_id, error);
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Chunk write failed: " + error);
    }

    // Post-write verification against what actually landed on disk
    std::vector<uint8_t> stored;
    bool readable = read_back(target, stored);
    if (!readable || stored.size() != payload.size() ||
        !crypto::hash_utils::digests_equal(crypto::hash_utils::hex_digest(stored), content_hash)) {
        LOG_ERROR("Post-write verification failed for chunk {} of {}", chunk_number, file_id);
        std::error_code ec;
        std::filesystem::remove(target, ec);
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Chunk verification after write failed");
    }

    record.file_id = file_id;
    record.chunk_number = chunk_number;
    record.byte_length = payload.size();
    record.content_hash = core::utils::StringUtils::to_lower(content_hash);
    record.written_at = core::utils::TimeUtils::now();

    auto result = metadata_->put_chunk_record(record);
    if (!result) {
        std::error_code ec;
        std::filesystem::remove(target, ec);
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Chunk record not stored: " + result.message);
    }

    LOG_DEBUG("Stored chunk {} of {} ({} bytes)", chunk_number, file_id, payload.size());
    return UploadResult();
}

bool ChunkStore::exists(const std::string& file_id, uint32_t chunk_number) const {
    return FileUtils::exists(chunk_path(file_id, chunk_number));
}

UploadResult ChunkStore::read(const std::string& file_id, uint32_t chunk_number,
                              std::vector<uint8_t>& data) const {
    auto path = chunk_path(file_id, chunk_number);
    if (!FileUtils::exists(path)) {
        return UploadResult(UploadError::NOT_FOUND, "Chunk not stored: " + path.filename().string());
    }
    if (!read_back(path, data)) {
        return UploadResult(UploadError::TRANSIENT_STORAGE, "Failed to read " + path.string());
    }
    return UploadResult();
}

UploadResult ChunkStore::get_record(const std::string& file_id, uint32_t chunk_number,
                                    ChunkRecord& record) const {
    return metadata_->get_chunk_record(file_id, chunk_number, record);
}

std::vector<uint32_t> ChunkStore::verified_chunks(const std::string& file_id) const {
    std::vector<uint32_t> verified;

    std::vector<ChunkRecord> records;
    auto result = metadata_->list_chunk_records(file_id, records);
    if (!result) {
        LOG_WARN("Cannot list chunk records for {}: {}", file_id, result.message);
        return verified;
    }

    for (const auto& record : records) {
        std::vector<uint8_t> data;
        if (!read_back(chunk_path(file_id, record.chunk_number), data)) {
            continue;
        }
        if (data.size() == record.byte_length &&
            crypto::hash_utils::digests_equal(crypto::hash_utils::hex_digest(data), record.content_hash)) {
            verified.push_back(record.chunk_number);
        } else {
            LOG_WARN("Retained chunk {} of {} no longer matches its record", record.chunk_number, file_id);
        }
    }

    return verified;
}

ChunkSequence ChunkStore::read_ordered(const std::string& file_id) const {
    return ChunkSequence(this, file_id);
}

std::vector<uint32_t> ChunkStore::list_chunks(const std::string& file_id) const {
    std::vector<uint32_t> chunks;

    std::error_code ec;
    std::filesystem::directory_iterator it(chunk_directory(file_id), ec);
    if (ec) {
        return chunks;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto index = parse_chunk_filename(entry.path().filename().string());
        if (index) {
            chunks.push_back(*index);
        }
    }

    std::sort(chunks.begin(), chunks.end());
    return chunks;
}

std::vector<std::string> ChunkStore::list_file_ids() const {
    std::vector<std::string> file_ids;

    std::error_code ec;
    std::filesystem::directory_iterator it(config_.chunk_directory, ec);
    if (ec) {
        return file_ids;
    }

    for (const auto& entry : it) {
        if (entry.is_directory(ec)) {
            file_ids.push_back(entry.path().filename().string());
        }
    }

    std::sort(file_ids.begin(), file_ids.end());
    return file_ids;
}

std::optional<std::chrono::system_clock::time_point> ChunkStore::last_modified(const std::string& file_id) const {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(chunk_directory(file_id), ec);
    if (ec) {
        return std::nullopt;
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(time));
}

void ChunkStore::delete_all(const std::string& file_id) {
    std::error_code ec;
    auto directory = chunk_directory(file_id);
    auto removed = std::filesystem::remove_all(directory, ec);
    if (ec) {
        LOG_WARN("Failed to delete chunk data for {}: {}", file_id, ec.message());
    } else if (removed > 0) {
        LOG_DEBUG("Deleted {} chunk entries for {}", removed, file_id);
    }

    auto result = metadata_->remove_chunk_records(file_id);
    if (!result) {
        LOG_WARN("Failed to delete chunk records for {}: {}", file_id, result.message);
    }
}

void ChunkStore::remove_chunk(const std::string& file_id, uint32_t chunk_number) {
    std::error_code ec;
    std::filesystem::remove(chunk_path(file_id, chunk_number), ec);
    if (ec) {
        LOG_WARN("Failed to remove chunk {} of {}: {}", chunk_number, file_id, ec.message());
    }

    auto result = metadata_->remove_chunk_record(file_id, chunk_number);
    if (!result) {
        LOG_WARN("Failed to remove chunk record {} of {}: {}", chunk_number, file_id, result.message);
    }
}

std::filesystem::path ChunkStore::chunk_directory(const std::string& file_id) const {
    return config_.get_chunk_path(file_id);
}

std::filesystem::path ChunkStore::chunk_path(const std::string& file_id, uint32_t chunk_number) const {
    return chunk_directory(file_id) / fmt::format("{}{:06}", CHUNK_PREFIX, chunk_number);
}

std::optional<uint32_t> ChunkStore::parse_chunk_filename(const std::string& filename) {
    std::string_view name(filename);
    if (!name.starts_with(CHUNK_PREFIX)) {
        return std::nullopt;
    }

    auto digits = name.substr(std::strlen(CHUNK_PREFIX));
    if (digits.empty() || digits.size() > 10 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : digits) {
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

bool ChunkStore::persist(const std::filesystem::path& target, std::span<const uint8_t> payload,
                         std::string& error) {
    auto temp = target;
    temp += temp_suffix();

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = std::string("open: ") + std::strerror(errno);
        return false;
    }

    bool ok = write_fully(fd, payload.data(), payload.size());
    if (!ok) {
        error = std::string("write: ") + std::strerror(errno);
    } else if (::fsync(fd) != 0) {
        error = std::string("fsync: ") + std::strerror(errno);
        ok = false;
    }

    if (::close(fd) != 0 && ok) {
        error = std::string("close: ") + std::strerror(errno);
        ok = false;
    }

    if (ok && ::rename(temp.c_str(), target.c_str()) != 0) {
        error = std::string("rename: ") + std::strerror(errno);
        ok = false;
    }

    if (!ok) {
        ::unlink(temp.c_str());
        return false;
    }

    if (!FileUtils::sync_directory(target.parent_path())) {
        error = "directory fsync failed";
        ::unlink(target.c_str());
        return false;
    }

    return true;
}

bool ChunkStore::read_back(const std::filesystem::path& path, std::vector<uint8_t>& data) const {
    auto content = FileUtils::read_binary(path);
    if (!content) {
        return false;
    }
    data = std::move(*content);
    return true;
}

}
