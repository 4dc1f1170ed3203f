#include "chunk_planner.hpp"
#include "shuttle/digest.hpp"
#include "shuttle/error.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>

namespace shuttle {

uint32_t chunk_count(uint64_t total_size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw UploadError(errc::invalid_argument, "chunk size must be positive");
    }
    uint64_t count = (total_size + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw UploadError(errc::invalid_argument, "file has too many chunks");
    }
    return static_cast<uint32_t>(count);
}

ChunkSpan chunk_span(uint32_t index, uint64_t total_size, uint32_t chunk_size) {
    uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    if (offset >= total_size) {
        throw UploadError(errc::out_of_range, "chunk " + std::to_string(index) + " is past the end");
    }
    return {offset, std::min<uint64_t>(chunk_size, total_size - offset)};
}

std::string make_fingerprint(const void* prefix, size_t prefix_len, uint64_t file_size) {
    return make_fingerprint(sha256_hex(prefix, prefix_len), file_size);
}

std::string make_fingerprint(const std::string& prefix_digest, uint64_t file_size) {
    return prefix_digest + "-" + std::to_string(file_size);
}

ChunkPlanner::ChunkPlanner(uint32_t chunk_size) : chunk_size_(chunk_size) {}

FilePlan ChunkPlanner::plan(const std::string& file_path) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw UploadError(errc::not_found, "cannot open " + file_path);
    }

    FilePlan plan;
    plan.file_path = file_path;
    plan.name = std::filesystem::path(file_path).filename().string();
    plan.chunk_size = chunk_size_;

    file.seekg(0, std::ios::end);
    plan.file_size = static_cast<uint64_t>(file.tellg());
    file.seekg(0, std::ios::beg);
    plan.total_chunks = chunk_count(plan.file_size, chunk_size_);

    // Hash the prefix in chunk-sized pieces so memory stays bounded
    Sha256 sha;
    std::vector<char> buffer(std::min<uint64_t>(chunk_size_, FINGERPRINT_PREFIX_SIZE));
    uint64_t remaining = std::min<uint64_t>(plan.file_size, FINGERPRINT_PREFIX_SIZE);
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buffer.size()));
        file.read(buffer.data(), want);
        if (file.gcount() != want) {
            throw UploadError(errc::storage_failure, "short read while fingerprinting " + file_path);
        }
        sha.update(buffer.data(), static_cast<size_t>(want));
        remaining -= static_cast<uint64_t>(want);
    }
    plan.fingerprint = make_fingerprint(sha.hex_digest(), plan.file_size);
    return plan;
}

std::vector<uint8_t> ChunkPlanner::read_chunk(const FilePlan& plan, uint32_t chunk_index) const {
    ChunkSpan span = plan.span(chunk_index);

    std::ifstream file(plan.file_path, std::ios::binary);
    if (!file.is_open()) {
        throw UploadError(errc::storage_failure, "cannot open " + plan.file_path);
    }

    file.seekg(static_cast<std::streamoff>(span.offset));
    std::vector<uint8_t> data(span.length);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(span.length));
    if (static_cast<uint64_t>(file.gcount()) != span.length) {
        throw UploadError(errc::storage_failure, "short read of chunk " + std::to_string(chunk_index));
    }
    return data;
}

} // namespace shuttle
