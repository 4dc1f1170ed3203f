#include "connection.hpp"
#include "server.hpp"
#include "config.hpp"
#include "shuttle/error.hpp"
#include "wire.hpp"
#include <iostream>

namespace shuttle {

Connection::Connection(tcp::socket socket, Server& server)
    : socket_(std::move(socket)), server_(server) {}

void Connection::start() {
    do_read_header();
}

void Connection::stop() {
    auto self(shared_from_this());
    boost::asio::post(socket_.get_executor(), [this, self]() {
        if (stopped_) {
            return;
        }
        stopped_ = true;
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        server_.remove_connection(self);
    });
}

void Connection::do_read_header() {
    auto self(shared_from_this());
    boost::asio::async_read(socket_, boost::asio::buffer(header_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                    std::cerr << "[Server] Read error: " << ec.message() << std::endl;
                }
                stop();
                return;
            }
            uint32_t length = wire::decode_length(header_);
            uint32_t limit = server_.service().config().chunk_size + (MAX_FRAME_SIZE - CHUNK_SIZE);
            if (length > limit) {
                std::cerr << "[Server] Rejecting oversized frame of " << length << " bytes" << std::endl;
                do_write(wire::error_message(make_error_code(errc::protocol_error), "frame too large"), true);
                return;
            }
            do_read_body(length);
        });
}

void Connection::do_read_body(uint32_t length) {
    auto self(shared_from_this());
    body_.resize(length);
    boost::asio::async_read(socket_, boost::asio::buffer(body_),
        [this, self](boost::system::error_code ec, std::size_t length) {
            if (ec) {
                std::cerr << "[Server] Read error: " << ec.message() << std::endl;
                stop();
                return;
            }
            pb::MessageWrapper msg;
            if (!msg.ParseFromArray(body_.data(), static_cast<int>(length))) {
                std::cerr << "[Server] Failed to parse message." << std::endl;
                do_write(wire::error_message(make_error_code(errc::protocol_error), "malformed message"), true);
                return;
            }
            // Release the chunk bytes before the next read
            std::vector<uint8_t>().swap(body_);
            do_write(dispatch(msg), false);
        });
}

pb::MessageWrapper Connection::dispatch(const pb::MessageWrapper& msg) {
    UploadService& service = server_.service();
    try {
        if (msg.has_handshake_req()) {
            return wire::to_message(service.handshake(wire::from_message(msg.handshake_req())));
        }
        if (msg.has_chunk_upload()) {
            const auto& up = msg.chunk_upload();
            bool accepted = service.upload_chunk(up.session_id(), up.chunk_index(), up.total_chunks(),
                                                 reinterpret_cast<const uint8_t*>(up.payload().data()),
                                                 up.payload().size());
            return wire::chunk_ack(accepted);
        }
        if (msg.has_finalize_req()) {
            return wire::to_message(service.finalize(msg.finalize_req().session_id()));
        }
        throw UploadError(errc::protocol_error, "unexpected message type");
    } catch (const UploadError& e) {
        std::cerr << "[Server] Request failed: " << e.what() << std::endl;
        return wire::error_message(e.code(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[Server] Request failed: " << e.what() << std::endl;
        return wire::error_message(make_error_code(errc::storage_failure), e.what());
    }
}

void Connection::do_write(const pb::MessageWrapper& msg, bool close_after) {
    auto self(shared_from_this());
    // Use a shared_ptr for the buffer so it lives until the write is complete
    auto frame = std::make_shared<std::string>(wire::encode_frame(msg));

    boost::asio::async_write(socket_, boost::asio::buffer(*frame),
        [this, self, frame, close_after](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                std::cerr << "[Server] Write error: " << ec.message() << std::endl;
                stop();
                return;
            }
            if (close_after) {
                stop();
                return;
            }
            do_read_header();
        });
}

} // namespace shuttle
