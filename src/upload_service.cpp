#include "upload_service.hpp"
#include <iostream>

namespace shuttle {

UploadService::UploadService(const ServerConfig& config, Clock clock)
    : config_(config),
      store_(config.db_path),
      registry_(store_, config.chunk_size, std::move(clock)),
      chunks_(registry_, config.storage_dir),
      finalizer_(registry_, chunks_, config.preview_limit) {}

HandshakeResult UploadService::handshake(const HandshakeRequest& req) {
    HandshakeResult result = registry_.handshake(req);

    // A FAILED session's bytes are not trusted: start the transfer over
    SessionRecord session = registry_.get(result.session_id);
    if (session.status == SessionStatus::FAILED) {
        std::cout << "[Service] Restarting failed session " << session.id << std::endl;
        if (registry_.discard(session.id)) {
            chunks_.remove_blob(session.id);
        }
        result = registry_.handshake(req);
    }
    return result;
}

bool UploadService::upload_chunk(const std::string& session_id,
                                 uint32_t chunk_index,
                                 uint32_t total_chunks,
                                 const uint8_t* data,
                                 size_t len) {
    chunks_.write_chunk(session_id, chunk_index, data, len, total_chunks);
    return true;
}

FinalizeResult UploadService::finalize(const std::string& session_id) {
    return finalizer_.finalize(session_id);
}

} // namespace shuttle
