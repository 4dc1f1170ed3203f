#pragma once

#include "shuttle.pb.h"
#include <boost/asio.hpp>
#include <array>
#include <memory>
#include <vector>

namespace shuttle {

using tcp = boost::asio::ip::tcp;

class Server; // Forward declaration

// One accepted client socket. Requests on a connection are served one at a
// time: read a frame, dispatch it, write the reply, read the next.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket, Server& server);

    void start();
    void stop();

private:
    void do_read_header();
    void do_read_body(uint32_t length);
    void do_write(const pb::MessageWrapper& msg, bool close_after);
    pb::MessageWrapper dispatch(const pb::MessageWrapper& msg);

    tcp::socket socket_;
    std::array<uint8_t, 4> header_{};
    std::vector<uint8_t> body_;
    Server& server_;
    bool stopped_ = false;
};

} // namespace shuttle
