#include "wire.hpp"
#include "shuttle/error.hpp"

namespace shuttle {
namespace wire {

std::string encode_frame(const pb::MessageWrapper& msg) {
    std::string body;
    if (!msg.SerializeToString(&body)) {
        throw UploadError(errc::protocol_error, "failed to serialize message");
    }
    uint32_t len = static_cast<uint32_t>(body.size());
    std::string frame;
    frame.reserve(HEADER_SIZE + body.size());
    frame.push_back(static_cast<char>((len >> 24) & 0xff));
    frame.push_back(static_cast<char>((len >> 16) & 0xff));
    frame.push_back(static_cast<char>((len >> 8) & 0xff));
    frame.push_back(static_cast<char>(len & 0xff));
    frame += body;
    return frame;
}

uint32_t decode_length(const std::array<uint8_t, HEADER_SIZE>& header) {
    return (static_cast<uint32_t>(header[0]) << 24) |
           (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) |
           static_cast<uint32_t>(header[3]);
}

pb::MessageWrapper to_message(const HandshakeRequest& req) {
    pb::MessageWrapper msg;
    auto* hs = msg.mutable_handshake_req();
    hs->set_fingerprint(req.fingerprint);
    hs->set_total_size(req.total_size);
    hs->set_total_chunks(req.total_chunks);
    hs->set_name(req.name);
    return msg;
}

pb::MessageWrapper to_message(const HandshakeResult& res) {
    pb::MessageWrapper msg;
    auto* hs = msg.mutable_handshake_res();
    hs->set_session_id(res.session_id);
    for (uint32_t idx : res.uploaded_chunks) {
        hs->add_uploaded_chunks(idx);
    }
    return msg;
}

pb::MessageWrapper to_message(const ChunkUpload& chunk) {
    pb::MessageWrapper msg;
    auto* up = msg.mutable_chunk_upload();
    up->set_session_id(chunk.session_id);
    up->set_chunk_index(chunk.chunk_index);
    up->set_total_chunks(chunk.total_chunks);
    up->set_payload(chunk.payload.data(), chunk.payload.size());
    return msg;
}

pb::MessageWrapper to_message(const FinalizeResult& res) {
    pb::MessageWrapper msg;
    auto* fin = msg.mutable_finalize_res();
    fin->set_final_hash(res.final_hash);
    for (const auto& entry : res.preview_entries) {
        fin->add_preview_entries(entry);
    }
    return msg;
}

pb::MessageWrapper finalize_request(const std::string& session_id) {
    pb::MessageWrapper msg;
    msg.mutable_finalize_req()->set_session_id(session_id);
    return msg;
}

pb::MessageWrapper chunk_ack(bool accepted) {
    pb::MessageWrapper msg;
    msg.mutable_chunk_ack()->set_accepted(accepted);
    return msg;
}

pb::MessageWrapper error_message(const boost::system::error_code& ec, const std::string& what) {
    pb::MessageWrapper msg;
    auto* err = msg.mutable_error();
    // Only shuttle errors keep their code across the wire
    err->set_code(ec.category() == upload_category() ? ec.value() : static_cast<int>(errc::storage_failure));
    err->set_message(what);
    return msg;
}

HandshakeRequest from_message(const pb::HandshakeRequest& msg) {
    HandshakeRequest req;
    req.fingerprint = msg.fingerprint();
    req.total_size = msg.total_size();
    req.total_chunks = msg.total_chunks();
    req.name = msg.name();
    return req;
}

HandshakeResult from_message(const pb::HandshakeResponse& msg) {
    HandshakeResult res;
    res.session_id = msg.session_id();
    res.uploaded_chunks.assign(msg.uploaded_chunks().begin(), msg.uploaded_chunks().end());
    return res;
}

FinalizeResult from_message(const pb::FinalizeResponse& msg) {
    FinalizeResult res;
    res.final_hash = msg.final_hash();
    res.preview_entries.assign(msg.preview_entries().begin(), msg.preview_entries().end());
    return res;
}

boost::system::error_code error_from_message(const pb::ErrorResponse& msg) {
    int code = msg.code();
    if (code < static_cast<int>(errc::invalid_argument) || code > static_cast<int>(errc::protocol_error)) {
        return make_error_code(errc::protocol_error);
    }
    return make_error_code(static_cast<errc>(code));
}

} // namespace wire
} // namespace shuttle
