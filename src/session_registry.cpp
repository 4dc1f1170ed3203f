#include "session_registry.hpp"
#include "chunk_planner.hpp"
#include "shuttle/error.hpp"
#include "shuttle/hex.hpp"
#include <iostream>

namespace shuttle {

SessionRegistry::SessionRegistry(SessionStore& store, uint32_t chunk_size, Clock clock)
    : store_(store), chunk_size_(chunk_size), clock_(std::move(clock)) {}

int64_t SessionRegistry::now() const {
    return std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
}

void SessionRegistry::validate(const HandshakeRequest& req) const {
    if (req.fingerprint.empty()) {
        throw UploadError(errc::invalid_argument, "fingerprint is empty");
    }
    if (req.total_size == 0 || req.total_chunks == 0) {
        throw UploadError(errc::invalid_argument, "totalSize and totalChunks must be positive");
    }
    if (chunk_count(req.total_size, chunk_size_) != req.total_chunks) {
        throw UploadError(errc::invalid_argument,
            "totalChunks " + std::to_string(req.total_chunks) + " does not match totalSize " +
            std::to_string(req.total_size));
    }
}

HandshakeResult SessionRegistry::resume(const SessionRecord& record, const HandshakeRequest& req) {
    if (record.total_size != req.total_size || record.total_chunks != req.total_chunks) {
        throw UploadError(errc::invalid_argument, "fingerprint matches a session of a different size");
    }
    HandshakeResult result;
    result.session_id = record.id;
    result.uploaded_chunks = store_.uploaded_chunks(record.id);
    return result;
}

HandshakeResult SessionRegistry::handshake(const HandshakeRequest& req) {
    validate(req);

    if (auto existing = store_.find_by_fingerprint(req.fingerprint)) {
        auto result = resume(*existing, req);
        std::cout << "[Registry] Resuming session " << existing->id << " (" << result.uploaded_chunks.size()
                  << "/" << existing->total_chunks << " chunks, " << to_string(existing->status) << ")" << std::endl;
        return result;
    }

    SessionRecord record;
    record.id = util::random_id();
    record.fingerprint = req.fingerprint;
    record.name = req.name;
    record.total_size = req.total_size;
    record.total_chunks = req.total_chunks;
    record.created_at = now();

    if (store_.insert_if_absent(record)) {
        std::cout << "[Registry] Created session " << record.id << " for " << req.name << " (" << req.total_size
                  << " bytes, " << req.total_chunks << " chunks)" << std::endl;
        return HandshakeResult{record.id, {}};
    }

    // Lost the race to a concurrent handshake: the winner's row is now there
    auto winner = store_.find_by_fingerprint(req.fingerprint);
    if (!winner) {
        throw UploadError(errc::storage_failure, "session for fingerprint vanished during handshake");
    }
    return resume(*winner, req);
}

SessionRecord SessionRegistry::get(const std::string& session_id) {
    auto record = store_.find_by_id(session_id);
    if (!record) {
        throw UploadError(errc::not_found, "unknown session " + session_id);
    }
    return *record;
}

bool SessionRegistry::discard(const std::string& session_id) {
    return store_.delete_if_incomplete(session_id);
}

} // namespace shuttle
