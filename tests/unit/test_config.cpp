#include <gtest/gtest.h>
#include "chunkvault/core/config.hpp"
#include "chunkvault/transfer/upload_settings.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace chunkvault::core;
using chunkvault::transfer::UploadSettings;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = (std::filesystem::temp_directory_path() / "chunkvault_test_config.conf").string();
    }

    void TearDown() override {
        Config::instance().clear();
        unsetenv("CHUNKVAULT_PORT");
        unsetenv("CHUNKVAULT_MAX_RETRIES");
        std::filesystem::remove(test_file);
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
    EXPECT_FALSE(config.get("nonexistent.key").has_value());
}

TEST_F(ConfigTest, TypedValuesAndFallbacks) {
    auto& config = Config::instance();

    config.set("bool.true", "yes");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("int.garbage", "42abc");
    config.set("size.value", "2097152");
    config.set("size.negative", "-1");
    config.set("ratio", "0.75");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_int("int.garbage", 7), 7);
    EXPECT_EQ(config.get_uint64("size.value"), 2097152u);
    EXPECT_EQ(config.get_uint64("size.negative", 9), 9u);
    EXPECT_DOUBLE_EQ(config.get_double("ratio"), 0.75);
    EXPECT_EQ(config.get_string("missing", "default"), "default");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "upload.max_retries=5\n";
    file << "storage.data_dir = /var/lib/chunkvault \n";
    file << "not a setting\n";
    file.close();

    auto& config = Config::instance();
    config.set_defaults();
    ASSERT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_int("upload.max_retries"), 5);
    EXPECT_EQ(config.get_string("storage.data_dir"), "/var/lib/chunkvault");
    EXPECT_EQ(config.get_int("server.port"), 9400);
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("/nonexistent/chunkvault.conf"));
}

TEST_F(ConfigTest, SaveAndReload) {
    auto& config = Config::instance();
    config.set("auth.tokens", "alice:secret");
    config.set("server.port", "9500");
    ASSERT_TRUE(config.save_to_file(test_file));

    config.clear();
    ASSERT_TRUE(config.load_from_file(test_file));
    EXPECT_EQ(config.get_string("auth.tokens"), "alice:secret");
    EXPECT_EQ(config.get_int("server.port"), 9500);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    std::ofstream file(test_file);
    file << "server.port=9100\n";
    file.close();

    auto& config = Config::instance();
    config.set_defaults();
    ASSERT_TRUE(config.load_from_file(test_file));

    setenv("CHUNKVAULT_PORT", "9200", 1);
    setenv("CHUNKVAULT_MAX_RETRIES", " 6 ", 1);
    EXPECT_EQ(config.load_from_environment(), 2u);

    EXPECT_EQ(config.get_int("server.port"), 9200);
    EXPECT_EQ(config.get_int("upload.max_retries"), 6);
}

TEST_F(ConfigTest, DefaultsMatchUploadSettings) {
    auto& config = Config::instance();
    config.set_defaults();

    auto settings = UploadSettings::from_config(config);
    UploadSettings expected;

    EXPECT_EQ(settings.min_chunk_size, expected.min_chunk_size);
    EXPECT_EQ(settings.default_chunk_size, expected.default_chunk_size);
    EXPECT_EQ(settings.max_chunk_size, expected.max_chunk_size);
    EXPECT_EQ(settings.max_attempts, expected.max_attempts);
    EXPECT_EQ(settings.retry_base_delay, expected.retry_base_delay);
    EXPECT_EQ(settings.retry_max_delay, expected.retry_max_delay);
    EXPECT_EQ(settings.session_ttl, expected.session_ttl);
    EXPECT_EQ(settings.reaper_interval, expected.reaper_interval);
    EXPECT_EQ(settings.status_preview_limit, expected.status_preview_limit);
    EXPECT_DOUBLE_EQ(settings.success_threshold, expected.success_threshold);

    std::string error;
    EXPECT_TRUE(settings.validate(error)) << error;
}

TEST_F(ConfigTest, InvalidChunkBoundsRejected) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("upload.min_chunk_size", "4194304");

    auto settings = UploadSettings::from_config(config);
    std::string error;
    EXPECT_FALSE(settings.validate(error));
    EXPECT_FALSE(error.empty());
}
