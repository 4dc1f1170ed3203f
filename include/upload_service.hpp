#pragma once

#include "chunk_store.hpp"
#include "config.hpp"
#include "finalizer.hpp"
#include "protocol.hpp"
#include "session_registry.hpp"
#include "session_store.hpp"

namespace shuttle {

// The three protocol operations over one store, registry, chunk store and finalizer.
class UploadService {
public:
    explicit UploadService(const ServerConfig& config, Clock clock = system_now);

    HandshakeResult handshake(const HandshakeRequest& req);
    bool upload_chunk(const std::string& session_id,
                      uint32_t chunk_index,
                      uint32_t total_chunks,
                      const uint8_t* data,
                      size_t len);
    FinalizeResult finalize(const std::string& session_id);

    const ServerConfig& config() const { return config_; }
    SessionStore& store() { return store_; }
    SessionRegistry& registry() { return registry_; }
    ChunkStore& chunks() { return chunks_; }

private:
    ServerConfig config_;
    SessionStore store_;
    SessionRegistry registry_;
    ChunkStore chunks_;
    Finalizer finalizer_;
};

} // namespace shuttle
