#pragma once

#include "session_registry.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace shuttle {

// fsync on a directory, so entries created in it survive a crash
void sync_directory(const std::filesystem::path& dir);

// Offset-addressed writes into one blob file per session.
class ChunkStore {
public:
    ChunkStore(SessionRegistry& registry, std::filesystem::path root);

    // Writes the chunk at index * chunk_size, syncs it, then commits the
    // chunk record. Returns false when the chunk was already UPLOADED and
    // nothing was written. declared_total, when non-zero, must match the
    // session's chunk count.
    bool write_chunk(const std::string& session_id,
                     uint32_t chunk_index,
                     const uint8_t* data,
                     size_t len,
                     uint32_t declared_total = 0);

    std::filesystem::path blob_path(const std::string& session_id) const;

    // Tolerates a blob that is already gone
    bool remove_blob(const std::string& session_id);

private:
    SessionRegistry& registry_;
    std::filesystem::path root_;
};

} // namespace shuttle
