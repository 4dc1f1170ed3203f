#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace shuttle {

struct HandshakeRequest {
    std::string fingerprint;
    uint64_t total_size = 0;
    uint32_t total_chunks = 0;
    std::string name;
};

struct HandshakeResult {
    std::string session_id;
    std::vector<uint32_t> uploaded_chunks; // ascending
};

struct ChunkUpload {
    std::string session_id;
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 0;
    std::vector<uint8_t> payload;
};

struct FinalizeResult {
    std::string final_hash;
    std::vector<std::string> preview_entries;
};

} // namespace shuttle
