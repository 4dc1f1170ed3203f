#include "chunk_store.hpp"
#include "chunk_planner.hpp"
#include "shuttle/error.hpp"
#include "shuttle/unique_fd.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>

namespace shuttle {

namespace {

UploadError io_error(const std::string& what) {
    return UploadError(errc::storage_failure, what + ": " + std::strerror(errno));
}

} // namespace

void sync_directory(const std::filesystem::path& dir) {
    UniqueFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.valid()) {
        throw io_error("open " + dir.string());
    }
    if (::fsync(fd.get()) != 0) {
        throw io_error("fsync " + dir.string());
    }
}

ChunkStore::ChunkStore(SessionRegistry& registry, std::filesystem::path root)
    : registry_(registry), root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::filesystem::path ChunkStore::blob_path(const std::string& session_id) const {
    return root_ / (session_id + ".bin");
}

bool ChunkStore::write_chunk(const std::string& session_id,
                             uint32_t chunk_index,
                             const uint8_t* data,
                             size_t len,
                             uint32_t declared_total) {
    SessionRecord session = registry_.get(session_id);

    if (declared_total != 0 && declared_total != session.total_chunks) {
        throw UploadError(errc::invalid_argument, "totalChunks does not match session");
    }
    if (chunk_index >= session.total_chunks) {
        throw UploadError(errc::out_of_range,
            "chunk " + std::to_string(chunk_index) + " >= " + std::to_string(session.total_chunks));
    }
    ChunkSpan span = chunk_span(chunk_index, session.total_size, registry_.chunk_size());
    if (len != span.length) {
        throw UploadError(errc::invalid_argument,
            "chunk " + std::to_string(chunk_index) + " carries " + std::to_string(len) +
            " bytes, expected " + std::to_string(span.length));
    }

    if (registry_.store().is_chunk_uploaded(session_id, chunk_index)) {
        std::cout << "[ChunkStore] Chunk " << chunk_index << " of " << session_id << " already uploaded, skipping" << std::endl;
        return false;
    }
    if (session.status != SessionStatus::UPLOADING) {
        throw UploadError(errc::invalid_state,
            "session " + session_id + " is " + to_string(session.status) + ", not accepting chunks");
    }

    auto path = blob_path(session_id);
    UniqueFd fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600));
    if (!fd.valid()) {
        throw io_error("open " + path.string());
    }

    // Size the blob once; concurrent writers all truncate to the same length
    struct stat st;
    if (::fstat(fd.get(), &st) != 0) {
        throw io_error("fstat " + path.string());
    }
    if (static_cast<uint64_t>(st.st_size) < session.total_size &&
        ::ftruncate(fd.get(), static_cast<off_t>(session.total_size)) != 0) {
        throw io_error("ftruncate " + path.string());
    }

    size_t written = 0;
    while (written < len) {
        ssize_t n = ::pwrite(fd.get(), data + written, len - written,
                             static_cast<off_t>(span.offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw io_error("pwrite " + path.string());
        }
        written += static_cast<size_t>(n);
    }

    // Bytes must be durable before the record says UPLOADED
    if (::fdatasync(fd.get()) != 0) {
        throw io_error("fdatasync " + path.string());
    }
    fd.reset();
    // The blob's directory entry must be durable too. A concurrent writer may
    // have created the file without having synced the directory yet.
    sync_directory(root_);

    registry_.store().commit_chunk(session_id, chunk_index, registry_.now());
    std::cout << "[ChunkStore] Committed chunk " << chunk_index << "/" << session.total_chunks
              << " of " << session_id << " (" << len << " bytes)" << std::endl;
    return true;
}

bool ChunkStore::remove_blob(const std::string& session_id) {
    std::error_code ec;
    bool removed = std::filesystem::remove(blob_path(session_id), ec);
    if (ec) {
        std::cerr << "[ChunkStore] Failed to remove blob of " << session_id << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

} // namespace shuttle
