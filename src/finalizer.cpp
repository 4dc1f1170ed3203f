#include "finalizer.hpp"
#include "archive_preview.hpp"
#include "shuttle/digest.hpp"
#include "shuttle/error.hpp"
#include "shuttle/unique_fd.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

namespace shuttle {

namespace {

const size_t READ_BUFFER_SIZE = 64 * 1024;

} // namespace

Finalizer::Finalizer(SessionRegistry& registry, ChunkStore& chunks, size_t preview_limit)
    : registry_(registry), chunks_(chunks), preview_limit_(preview_limit) {}

FinalizeResult Finalizer::finalize(const std::string& session_id) {
    SessionRecord session = registry_.get(session_id);

    if (session.status == SessionStatus::COMPLETED) {
        return FinalizeResult{session.final_hash.value_or(std::string()), session.preview_entries};
    }
    if (session.status == SessionStatus::PROCESSING) {
        throw UploadError(errc::busy, "session " + session_id + " is already being finalized");
    }
    if (session.status == SessionStatus::FAILED) {
        throw UploadError(errc::invalid_state, "session " + session_id + " failed, handshake again to restart");
    }

    uint32_t uploaded = registry_.store().count_uploaded(session_id);
    if (uploaded != session.total_chunks) {
        throw UploadError(errc::incomplete,
            std::to_string(uploaded) + " of " + std::to_string(session.total_chunks) + " chunks uploaded");
    }

    if (!registry_.store().compare_and_set_status(session_id, SessionStatus::UPLOADING, SessionStatus::PROCESSING)) {
        // Somebody else moved it first; answer from whatever state they left
        auto current = registry_.get(session_id);
        if (current.status == SessionStatus::COMPLETED) {
            return FinalizeResult{current.final_hash.value_or(std::string()), current.preview_entries};
        }
        throw UploadError(errc::busy, "session " + session_id + " is " + to_string(current.status));
    }

    std::cout << "[Finalizer] Processing session " << session_id << std::endl;
    FinalizeResult result;
    try {
        result = process(session);
    } catch (const std::exception& e) {
        std::cerr << "[Finalizer] Session " << session_id << " failed: " << e.what() << std::endl;
        registry_.store().compare_and_set_status(session_id, SessionStatus::PROCESSING, SessionStatus::FAILED);
        throw;
    }

    if (!registry_.store().compare_and_set_status(session_id, SessionStatus::PROCESSING, SessionStatus::COMPLETED,
                                                  &result.final_hash, &result.preview_entries)) {
        throw UploadError(errc::not_found, "session " + session_id + " was removed while processing");
    }
    std::cout << "[Finalizer] Session " << session_id << " completed, sha256 " << result.final_hash << std::endl;
    return result;
}

FinalizeResult Finalizer::process(const SessionRecord& session) {
    auto path = chunks_.blob_path(session.id);
    UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        throw UploadError(errc::storage_failure, "open " + path.string() + ": " + std::strerror(errno));
    }

    struct stat st;
    if (::fstat(fd.get(), &st) != 0) {
        throw UploadError(errc::storage_failure, "fstat " + path.string() + ": " + std::strerror(errno));
    }
    if (static_cast<uint64_t>(st.st_size) != session.total_size) {
        throw UploadError(errc::integrity_failure,
            "blob holds " + std::to_string(st.st_size) + " bytes, expected " + std::to_string(session.total_size));
    }

    Sha256 sha;
    std::vector<uint8_t> buffer(READ_BUFFER_SIZE);
    uint64_t offset = 0;
    while (offset < session.total_size) {
        ssize_t n = ::pread(fd.get(), buffer.data(), buffer.size(), static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw UploadError(errc::storage_failure, "read " + path.string() + ": " + std::strerror(errno));
        }
        if (n == 0) {
            throw UploadError(errc::integrity_failure, "blob ended early at offset " + std::to_string(offset));
        }
        sha.update(buffer.data(), static_cast<size_t>(n));
        offset += static_cast<uint64_t>(n);
    }

    FinalizeResult result;
    result.final_hash = sha.hex_digest();
    result.preview_entries = list_zip_entries(fd.get(), preview_limit_);
    return result;
}

} // namespace shuttle
