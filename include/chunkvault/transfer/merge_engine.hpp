#pragma once

#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/storage/storage_config.hpp"
#include "chunkvault/storage/upload_session.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace chunkvault::transfer {

struct MergeOutcome {
    std::filesystem::path final_path;
    uint64_t final_size = 0;
    std::string final_hash;
};

// Concatenates a session's chunks in index order into the final file.
// The caller owns the session state; this only reports the outcome.
class MergeEngine {
public:
    MergeEngine(const storage::StorageConfig& config, std::shared_ptr<storage::ChunkStore> chunk_store);

    // INCOMPLETE on a gap in the stored chunks, HASH_MISMATCH when the assembled
    // bytes do not match session.expected_hash (nothing is published), and
    // TRANSIENT_STORAGE on I/O faults.
    core::UploadResult merge(const storage::UploadSession& session, MergeOutcome& outcome);

    std::filesystem::path final_path_for(const storage::UploadSession& session) const;

private:
    storage::StorageConfig config_;
    std::shared_ptr<storage::ChunkStore> chunk_store_;
};

}
