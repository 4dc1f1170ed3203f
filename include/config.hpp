#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace shuttle {

// Fixed by the protocol: both sides must agree on these.
const uint32_t CHUNK_SIZE = 5 * 1024 * 1024;
const uint64_t FINGERPRINT_PREFIX_SIZE = 10 * 1024 * 1024;
const size_t PREVIEW_LIMIT = 5;

// Largest frame either side accepts: one chunk plus message overhead.
const uint32_t MAX_FRAME_SIZE = CHUNK_SIZE + 64 * 1024;

struct ServerConfig {
    unsigned short port = 9090;
    std::string storage_dir = "uploads";
    std::string db_path = "shuttle.db";
    unsigned int io_threads = 4;
    uint32_t chunk_size = CHUNK_SIZE;
    std::chrono::seconds reaper_interval{3600};
    std::chrono::seconds retention{24 * 3600};
    size_t preview_limit = PREVIEW_LIMIT;
};

struct CoordinatorOptions {
    uint32_t chunk_size = CHUNK_SIZE;
    size_t concurrency = 3;
    // Retries after the first failed attempt; delays are base * 2^attempt.
    int max_retries = 3;
    std::chrono::milliseconds backoff_base{2000};
    std::chrono::milliseconds progress_interval{1000};
};

} // namespace shuttle
