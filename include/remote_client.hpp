#pragma once

#include "shuttle.pb.h"
#include "upload_client.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace shuttle {

// UploadClient over TCP. Every call opens its own connection, so several
// chunk uploads can be in flight at once.
class RemoteClient : public UploadClient {
public:
    RemoteClient(boost::asio::io_context& io_context,
                 std::string host,
                 std::string port,
                 std::chrono::seconds request_timeout = std::chrono::seconds(120));

    void async_handshake(const HandshakeRequest& req, HandshakeHandler handler) override;
    void async_upload_chunk(ChunkUpload chunk, ChunkHandler handler) override;
    void async_finalize(const std::string& session_id, FinalizeHandler handler) override;

private:
    using ResponseHandler = std::function<void(const boost::system::error_code&, const pb::MessageWrapper&)>;
    void call(const pb::MessageWrapper& request, ResponseHandler handler);

    boost::asio::io_context& io_context_;
    std::string host_;
    std::string port_;
    std::chrono::seconds request_timeout_;
};

} // namespace shuttle
