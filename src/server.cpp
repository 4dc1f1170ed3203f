#include "server.hpp"
#include <iostream>

namespace shuttle {

Server::Server(boost::asio::io_context& io_context, UploadService& service)
    : io_context_(io_context), service_(service) {}

void Server::listen(unsigned short port) {
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, tcp::endpoint(tcp::v4(), port));
    std::cout << "[Server] Listening on TCP port " << acceptor_->local_endpoint().port() << std::endl;
    do_accept();
}

unsigned short Server::port() const {
    return acceptor_ ? acceptor_->local_endpoint().port() : 0;
}

void Server::stop() {
    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
    std::unordered_set<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.swap(connections_);
    }
    for (const auto& connection : open) {
        connection->stop();
    }
}

void Server::do_accept() {
    // Each connection gets its own strand, so stop() never races a handler
    acceptor_->async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    std::cerr << "[Server] Accept error: " << ec.message() << std::endl;
                    do_accept();
                }
                return;
            }
            auto connection = std::make_shared<Connection>(std::move(socket), *this);
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_.insert(connection);
            }
            connection->start();
            do_accept();
        });
}

void Server::remove_connection(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection);
}

} // namespace shuttle
