#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace chunkvault::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

// Must be called once before hashing. Safe to call repeatedly.
bool initialize();

// Incremental SHA-256. Reusable after finalize() via reset().
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void update(std::span<const std::uint8_t> data);
    Sha256Hash finalize();
    std::string finalize_hex();
    void reset();

    uint64_t bytes_processed() const { return bytes_processed_; }

    static Sha256Hash hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    uint64_t bytes_processed_;
};

namespace hash_utils {

std::string hash_to_hex(const Sha256Hash& hash);

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string);

// Lowercase hex SHA-256 of the bytes.
std::string hex_digest(std::span<const std::uint8_t> data);

std::optional<std::string> hex_digest_file(const std::filesystem::path& file_path);

// Hex digests compare case-insensitively.
bool digests_equal(const std::string& a, const std::string& b);

bool is_hex_digest(const std::string& value);

}

}
