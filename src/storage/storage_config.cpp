#include "chunkvault/storage/storage_config.hpp"
#include "chunkvault/core/logger.hpp"

namespace chunkvault::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

bool StorageConfig::validate() const {
    if (chunk_directory.empty() || upload_directory.empty() || database_path.empty()) {
        return false;
    }

    // Chunks and final files must not share a directory tree
    if (chunk_directory == upload_directory) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(chunk_directory);
        std::filesystem::create_directories(upload_directory);

        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }

        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Failed to create storage directories: {}", e.what());
        return false;
    }
}

std::filesystem::path StorageConfig::get_chunk_path(const std::string& file_id) const {
    return chunk_directory / file_id;
}

std::filesystem::path StorageConfig::get_upload_path(const std::string& file_id) const {
    return upload_directory / file_id;
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    chunk_directory = base_dir / "chunks";
    upload_directory = base_dir / "uploads";
    database_path = base_dir / "chunkvault.db";
}

}
