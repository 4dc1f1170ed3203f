#pragma once

#include "protocol.hpp"
#include "session_store.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace shuttle {

using Clock = std::function<std::chrono::system_clock::time_point()>;

inline std::chrono::system_clock::time_point system_now() {
    return std::chrono::system_clock::now();
}

// Create-or-resume handshake on top of the session store.
class SessionRegistry {
public:
    SessionRegistry(SessionStore& store, uint32_t chunk_size, Clock clock = system_now);

    // Returns the session for req.fingerprint, creating it if needed.
    // Concurrent callers with the same fingerprint all get the same id.
    HandshakeResult handshake(const HandshakeRequest& req);

    // Throws not_found
    SessionRecord get(const std::string& session_id);

    // Drops a session record outright (used to restart a FAILED transfer)
    bool discard(const std::string& session_id);

    SessionStore& store() { return store_; }
    uint32_t chunk_size() const { return chunk_size_; }
    int64_t now() const;

private:
    void validate(const HandshakeRequest& req) const;
    HandshakeResult resume(const SessionRecord& record, const HandshakeRequest& req);

    SessionStore& store_;
    uint32_t chunk_size_;
    Clock clock_;
};

} // namespace shuttle
