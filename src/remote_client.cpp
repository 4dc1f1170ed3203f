#include "remote_client.hpp"
#include "config.hpp"
#include "shuttle/error.hpp"
#include "wire.hpp"
#include <array>
#include <memory>
#include <vector>

namespace shuttle {

namespace {

using tcp = boost::asio::ip::tcp;

// One request/response round trip on a fresh connection
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    using Handler = std::function<void(const boost::system::error_code&, const pb::MessageWrapper&)>;

    Exchange(boost::asio::io_context& io_context, std::string frame, std::chrono::seconds timeout, Handler handler)
        : resolver_(io_context),
          socket_(io_context),
          deadline_(io_context),
          frame_(std::move(frame)),
          timeout_(timeout),
          handler_(std::move(handler)) {}

    void start(const std::string& host, const std::string& port) {
        auto self(shared_from_this());
        deadline_.expires_after(timeout_);
        deadline_.async_wait([this, self](const boost::system::error_code& ec) {
            if (!ec) {
                finish(boost::asio::error::timed_out);
            }
        });

        resolver_.async_resolve(host, port,
            [this, self](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    finish(ec);
                    return;
                }
                boost::asio::async_connect(socket_, endpoints,
                    [this, self](const boost::system::error_code& ec, const tcp::endpoint& /*endpoint*/) {
                        if (ec) {
                            finish(ec);
                            return;
                        }
                        do_write();
                    });
            });
    }

private:
    void do_write() {
        auto self(shared_from_this());
        boost::asio::async_write(socket_, boost::asio::buffer(frame_),
            [this, self](const boost::system::error_code& ec, std::size_t /*length*/) {
                if (ec) {
                    finish(ec);
                    return;
                }
                // The request frame may be a whole chunk; drop it now
                std::string().swap(frame_);
                do_read_header();
            });
    }

    void do_read_header() {
        auto self(shared_from_this());
        boost::asio::async_read(socket_, boost::asio::buffer(header_),
            [this, self](const boost::system::error_code& ec, std::size_t /*length*/) {
                if (ec) {
                    finish(ec);
                    return;
                }
                uint32_t length = wire::decode_length(header_);
                if (length > MAX_FRAME_SIZE) {
                    finish(make_error_code(errc::protocol_error));
                    return;
                }
                body_.resize(length);
                do_read_body();
            });
    }

    void do_read_body() {
        auto self(shared_from_this());
        boost::asio::async_read(socket_, boost::asio::buffer(body_),
            [this, self](const boost::system::error_code& ec, std::size_t length) {
                if (ec) {
                    finish(ec);
                    return;
                }
                if (!response_.ParseFromArray(body_.data(), static_cast<int>(length))) {
                    finish(make_error_code(errc::protocol_error));
                    return;
                }
                finish(boost::system::error_code());
            });
    }

    void finish(const boost::system::error_code& ec) {
        if (done_) {
            return;
        }
        done_ = true;
        deadline_.cancel();
        resolver_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);
        handler_(ec, response_);
    }

    tcp::resolver resolver_;
    tcp::socket socket_;
    boost::asio::steady_timer deadline_;
    std::string frame_;
    std::chrono::seconds timeout_;
    Handler handler_;
    std::array<uint8_t, wire::HEADER_SIZE> header_{};
    std::vector<uint8_t> body_;
    pb::MessageWrapper response_;
    bool done_ = false;
};

} // namespace

RemoteClient::RemoteClient(boost::asio::io_context& io_context,
                           std::string host,
                           std::string port,
                           std::chrono::seconds request_timeout)
    : io_context_(io_context),
      host_(std::move(host)),
      port_(std::move(port)),
      request_timeout_(request_timeout) {}

void RemoteClient::call(const pb::MessageWrapper& request, ResponseHandler handler) {
    auto exchange = std::make_shared<Exchange>(io_context_, wire::encode_frame(request), request_timeout_,
        [handler](const boost::system::error_code& ec, const pb::MessageWrapper& response) {
            if (!ec && response.has_error()) {
                handler(wire::error_from_message(response.error()), response);
                return;
            }
            handler(ec, response);
        });
    exchange->start(host_, port_);
}

void RemoteClient::async_handshake(const HandshakeRequest& req, HandshakeHandler handler) {
    call(wire::to_message(req), [handler](const boost::system::error_code& ec, const pb::MessageWrapper& res) {
        if (ec) {
            handler(ec, HandshakeResult{});
        } else if (!res.has_handshake_res()) {
            handler(make_error_code(errc::protocol_error), HandshakeResult{});
        } else {
            handler(ec, wire::from_message(res.handshake_res()));
        }
    });
}

void RemoteClient::async_upload_chunk(ChunkUpload chunk, ChunkHandler handler) {
    pb::MessageWrapper msg = wire::to_message(chunk);
    // The protobuf copy is what goes out; free ours before the network wait
    std::vector<uint8_t>().swap(chunk.payload);

    call(msg, [handler](const boost::system::error_code& ec, const pb::MessageWrapper& res) {
        if (ec) {
            handler(ec, false);
        } else if (!res.has_chunk_ack()) {
            handler(make_error_code(errc::protocol_error), false);
        } else {
            handler(ec, res.chunk_ack().accepted());
        }
    });
}

void RemoteClient::async_finalize(const std::string& session_id, FinalizeHandler handler) {
    call(wire::finalize_request(session_id), [handler](const boost::system::error_code& ec, const pb::MessageWrapper& res) {
        if (ec) {
            handler(ec, FinalizeResult{});
        } else if (!res.has_finalize_res()) {
            handler(make_error_code(errc::protocol_error), FinalizeResult{});
        } else {
            handler(ec, wire::from_message(res.finalize_res()));
        }
    });
}

} // namespace shuttle
