#pragma once

#include "chunk_store.hpp"
#include "protocol.hpp"
#include "session_registry.hpp"
#include <cstddef>
#include <string>

namespace shuttle {

// Completeness check, whole-blob digest and the terminal status transition.
// Only the caller that wins UPLOADING -> PROCESSING reads the blob; a
// COMPLETED session answers from its stored hash and preview.
class Finalizer {
public:
    Finalizer(SessionRegistry& registry, ChunkStore& chunks, size_t preview_limit);

    FinalizeResult finalize(const std::string& session_id);

private:
    FinalizeResult process(const SessionRecord& session);

    SessionRegistry& registry_;
    ChunkStore& chunks_;
    size_t preview_limit_;
};

} // namespace shuttle
