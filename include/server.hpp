#pragma once

#include "connection.hpp"
#include "upload_service.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace shuttle {

class Server {
public:
    Server(boost::asio::io_context& io_context, UploadService& service);

    // Port 0 binds an ephemeral port; see port()
    void listen(unsigned short port);
    unsigned short port() const;
    void stop();

    UploadService& service() { return service_; }

private:
    void do_accept();
    void remove_connection(const std::shared_ptr<Connection>& connection);

    boost::asio::io_context& io_context_;
    UploadService& service_;
    std::unique_ptr<tcp::acceptor> acceptor_;

    std::mutex connections_mutex_;
    std::unordered_set<std::shared_ptr<Connection>> connections_;

    friend class Connection; // Connection removes itself on close
};

} // namespace shuttle
