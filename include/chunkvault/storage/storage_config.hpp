#pragma once

#include <filesystem>
#include <string>

namespace chunkvault::storage {

struct StorageConfig {
    std::filesystem::path chunk_directory;
    std::filesystem::path upload_directory;
    std::filesystem::path database_path;

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& base_dir);

    bool validate() const;

    bool create_directories() const;

    // <chunk_directory>/<file_id>
    std::filesystem::path get_chunk_path(const std::string& file_id) const;

    // <upload_directory>/<file_id>
    std::filesystem::path get_upload_path(const std::string& file_id) const;

    void set_base_directory(const std::filesystem::path& base_dir);
};

}
