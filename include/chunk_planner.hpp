#pragma once

#include "config.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace shuttle {

// Byte range [offset, offset + length) of one chunk
struct ChunkSpan {
    uint64_t offset;
    uint64_t length;
};

uint32_t chunk_count(uint64_t total_size, uint32_t chunk_size);
ChunkSpan chunk_span(uint32_t index, uint64_t total_size, uint32_t chunk_size);

// Resume key: hex SHA-256 of the content prefix, a dash, then the exact size.
// Two files with equal size and equal first FINGERPRINT_PREFIX_SIZE bytes
// share a fingerprint and would resume into the same session.
std::string make_fingerprint(const void* prefix, size_t prefix_len, uint64_t file_size);
std::string make_fingerprint(const std::string& prefix_digest, uint64_t file_size);

struct FilePlan {
    std::string file_path;
    std::string name;
    uint64_t file_size = 0;
    uint32_t chunk_size = CHUNK_SIZE;
    uint32_t total_chunks = 0;
    std::string fingerprint;

    ChunkSpan span(uint32_t index) const { return chunk_span(index, file_size, chunk_size); }
};

class ChunkPlanner {
public:
    explicit ChunkPlanner(uint32_t chunk_size = CHUNK_SIZE);

    // Computes boundaries and fingerprint; reads only the prefix
    FilePlan plan(const std::string& file_path) const;

    // Reads one chunk from the planned file
    std::vector<uint8_t> read_chunk(const FilePlan& plan, uint32_t chunk_index) const;

private:
    uint32_t chunk_size_;
};

} // namespace shuttle
