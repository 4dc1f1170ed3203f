#pragma once

#include "protocol.hpp"
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>

namespace shuttle {

// Asynchronous view of the three protocol operations. Handlers run on the
// implementation's io_context.
class UploadClient {
public:
    using HandshakeHandler = std::function<void(const boost::system::error_code&, HandshakeResult)>;
    using ChunkHandler = std::function<void(const boost::system::error_code&, bool accepted)>;
    using FinalizeHandler = std::function<void(const boost::system::error_code&, FinalizeResult)>;

    virtual ~UploadClient() = default;

    virtual void async_handshake(const HandshakeRequest& req, HandshakeHandler handler) = 0;
    virtual void async_upload_chunk(ChunkUpload chunk, ChunkHandler handler) = 0;
    virtual void async_finalize(const std::string& session_id, FinalizeHandler handler) = 0;
};

} // namespace shuttle
