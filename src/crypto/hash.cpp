#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/core/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace chunkvault::crypto {

bool initialize() {
    if (sodium_init() < 0) {
        LOG_CRITICAL("libsodium initialization failed");
        return false;
    }
    return true;
}

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , bytes_processed_(0) {
    crypto_hash_sha256_init(&impl_->state);
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::update(std::span<const std::uint8_t> data) {
    crypto_hash_sha256_update(&impl_->state, data.data(), data.size());
    bytes_processed_ += data.size();
}

Sha256Hash Sha256Hasher::finalize() {
    Sha256Hash result;
    crypto_hash_sha256_final(&impl_->state, result.data());
    return result;
}

std::string Sha256Hasher::finalize_hex() {
    return hash_utils::hash_to_hex(finalize());
}

void Sha256Hasher::reset() {
    crypto_hash_sha256_init(&impl_->state);
    bytes_processed_ = 0;
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

namespace hash_utils {

std::string hash_to_hex(const Sha256Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string) {
    if (!is_hex_digest(hex_string)) {
        return std::nullopt;
    }

    Sha256Hash hash;
    for (size_t i = 0; i < SHA256_HASH_SIZE; ++i) {
        hash[i] = static_cast<std::uint8_t>(std::stoul(hex_string.substr(i * 2, 2), nullptr, 16));
    }
    return hash;
}

std::string hex_digest(std::span<const std::uint8_t> data) {
    return hash_to_hex(Sha256Hasher::hash(data));
}

std::optional<std::string> hex_digest_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Sha256Hasher hasher;
    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());
        if (bytes_read > 0) {
            hasher.update(std::span(buffer.data(), bytes_read));
        }
    }

    if (file.bad()) {
        return std::nullopt;
    }
    return hasher.finalize_hex();
}

bool digests_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

bool is_hex_digest(const std::string& value) {
    return value.size() == SHA256_HASH_SIZE * 2 &&
           std::all_of(value.begin(), value.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

}

}
