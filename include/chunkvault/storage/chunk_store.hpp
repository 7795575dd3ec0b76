#pragma once

#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/metadata_store.hpp"
#include "chunkvault/storage/storage_config.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkvault::storage {

// Thrown by ChunkSequence iteration when a listed chunk cannot be read.
class ChunkReadError : public std::runtime_error {
public:
    ChunkReadError(uint32_t chunk_number, const std::string& what)
        : std::runtime_error(what), chunk_number_(chunk_number) {}

    uint32_t chunk_number() const { return chunk_number_; }

private:
    uint32_t chunk_number_;
};

class ChunkStore;

// Lazy, ascending (chunk_number, bytes) view over one file's chunks.
// Each begin() lists the directory again, so the sequence is restartable.
// Only one chunk payload is held in memory per iterator.
class ChunkSequence {
public:
    struct Entry {
        uint32_t chunk_number = 0;
        std::vector<uint8_t> data;
    };

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const Entry*;
        using reference = const Entry&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const;

    private:
        friend class ChunkSequence;

        iterator(const ChunkSequence* sequence, std::shared_ptr<const std::vector<uint32_t>> order);

        void load();

        const ChunkSequence* sequence_ = nullptr;
        std::shared_ptr<const std::vector<uint32_t>> order_;
        size_t position_ = 0;
        Entry current_;
    };

    iterator begin() const;
    iterator end() const { return iterator(); }

private:
    friend class ChunkStore;

    ChunkSequence(const ChunkStore* store, std::string file_id)
        : store_(store), file_id_(std::move(file_id)) {}

    void load_chunk(uint32_t chunk_number, std::vector<uint8_t>& data) const;

    const ChunkStore* store_;
    std::string file_id_;
};

// Durable per-chunk persistence. Owns chunk bytes on disk and the chunk record rows.
class ChunkStore {
public:
    ChunkStore(const StorageConfig& config, std::shared_ptr<MetadataStore> metadata);
    virtual ~ChunkStore() = default;

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    core::UploadResult initialize();

    // Atomic publish (temp file, fsync, rename, directory fsync) followed by a
    // re-read and re-hash. Any fault leaves no visible chunk and reports TRANSIENT_STORAGE.
    core::UploadResult write(const std::string& file_id, uint32_t chunk_number,
                             std::span<const uint8_t> payload, const std::string& content_hash,
                             ChunkRecord& record);

    bool exists(const std::string& file_id, uint32_t chunk_number) const;

    core::UploadResult read(const std::string& file_id, uint32_t chunk_number,
                            std::vector<uint8_t>& data) const;

    core::UploadResult get_record(const std::string& file_id, uint32_t chunk_number,
                                  ChunkRecord& record) const;

    // Re-hashes every recorded chunk and returns the indices whose bytes still match.
    std::vector<uint32_t> verified_chunks(const std::string& file_id) const;

    ChunkSequence read_ordered(const std::string& file_id) const;

    std::vector<uint32_t> list_chunks(const std::string& file_id) const;

    std::vector<std::string> list_file_ids() const;

    std::optional<std::chrono::system_clock::time_point> last_modified(const std::string& file_id) const;

    // Best effort. Failures are logged, never propagated.
    void delete_all(const std::string& file_id);

    void remove_chunk(const std::string& file_id, uint32_t chunk_number);

    std::filesystem::path chunk_directory(const std::string& file_id) const;
    std::filesystem::path chunk_path(const std::string& file_id, uint32_t chunk_number) const;

    static std::optional<uint32_t> parse_chunk_filename(const std::string& filename);

protected:
    virtual bool persist(const std::filesystem::path& target, std::span<const uint8_t> payload,
                         std::string& error);
    virtual bool read_back(const std::filesystem::path& path, std::vector<uint8_t>& data) const;

private:
    friend class ChunkSequence;

    StorageConfig config_;
    std::shared_ptr<MetadataStore> metadata_;
};

}
