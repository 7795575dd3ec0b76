#include <gtest/gtest.h>
#include "chunkvault/crypto/hash.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace chunkvault::crypto;
using chunkvault::test::bytes;

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(initialize());
    }

    static constexpr const char* EMPTY_SHA256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
    static constexpr const char* ABC_SHA256 =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
};

TEST_F(HashTest, KnownVectors) {
    EXPECT_EQ(hash_utils::hex_digest({}), EMPTY_SHA256);
    EXPECT_EQ(hash_utils::hex_digest(bytes("abc")), ABC_SHA256);
}

TEST_F(HashTest, IncrementalMatchesOneShot) {
    auto data = chunkvault::test::make_payload(200000, 7);

    Sha256Hasher hasher;
    std::span<const std::uint8_t> view(data);
    hasher.update(view.subspan(0, 1));
    hasher.update(view.subspan(1, 65535));
    hasher.update(view.subspan(65536));

    EXPECT_EQ(hasher.bytes_processed(), data.size());
    EXPECT_EQ(hasher.finalize_hex(), hash_utils::hex_digest(data));
}

TEST_F(HashTest, ResetStartsOver) {
    Sha256Hasher hasher;
    hasher.update(bytes("discarded"));
    hasher.reset();
    hasher.update(bytes("abc"));

    EXPECT_EQ(hasher.finalize_hex(), ABC_SHA256);
}

TEST_F(HashTest, HexConversion) {
    auto hash = Sha256Hasher::hash(bytes("abc"));
    auto hex = hash_utils::hash_to_hex(hash);

    auto parsed = hash_utils::hash_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, hash);

    EXPECT_FALSE(hash_utils::hash_from_hex("abc").has_value());
    EXPECT_FALSE(hash_utils::hash_from_hex(std::string(64, 'g')).has_value());
}

TEST_F(HashTest, DigestComparisonIgnoresCase) {
    std::string upper = ABC_SHA256;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    EXPECT_TRUE(hash_utils::digests_equal(ABC_SHA256, upper));
    EXPECT_FALSE(hash_utils::digests_equal(ABC_SHA256, EMPTY_SHA256));
    EXPECT_FALSE(hash_utils::digests_equal(ABC_SHA256, "ba78"));

    EXPECT_TRUE(hash_utils::is_hex_digest(upper));
    EXPECT_FALSE(hash_utils::is_hex_digest(upper.substr(1)));
}

TEST_F(HashTest, FileDigest) {
    auto dir = chunkvault::test::fresh_directory("chunkvault_hash_test");
    auto path = dir / "payload.bin";
    auto data = chunkvault::test::make_payload(150000, 3);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    auto digest = hash_utils::hex_digest_file(path);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, hash_utils::hex_digest(data));

    EXPECT_FALSE(hash_utils::hex_digest_file(dir / "missing.bin").has_value());
    std::filesystem::remove_all(dir);
}
