#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string format_bytes(uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);

    // [A-Za-z0-9._-]{1,max_length}, excluding "." and ".."
    static bool is_safe_identifier(const std::string& str, size_t max_length = 128);

    // A single path component without separators or control characters.
    static bool is_safe_filename(const std::string& str, size_t max_length = 255);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::optional<std::vector<uint8_t>> read_binary(const std::filesystem::path& path);
    static bool write_binary(const std::filesystem::path& path, const std::vector<uint8_t>& data);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();

    // fsync on a directory so that a rename inside it is durable.
    static bool sync_directory(const std::filesystem::path& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static int64_t to_epoch_ms(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

}
