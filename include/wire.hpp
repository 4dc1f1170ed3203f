#pragma once

#include "protocol.hpp"
#include "shuttle.pb.h"
#include <boost/system/error_code.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace shuttle {
namespace wire {

const size_t HEADER_SIZE = 4;

// Frame = 4-byte big-endian body length, then the serialized MessageWrapper
std::string encode_frame(const pb::MessageWrapper& msg);
uint32_t decode_length(const std::array<uint8_t, HEADER_SIZE>& header);

pb::MessageWrapper to_message(const HandshakeRequest& req);
pb::MessageWrapper to_message(const HandshakeResult& res);
pb::MessageWrapper to_message(const ChunkUpload& chunk);
pb::MessageWrapper to_message(const FinalizeResult& res);
pb::MessageWrapper finalize_request(const std::string& session_id);
pb::MessageWrapper chunk_ack(bool accepted);
pb::MessageWrapper error_message(const boost::system::error_code& ec, const std::string& what);

HandshakeRequest from_message(const pb::HandshakeRequest& msg);
HandshakeResult from_message(const pb::HandshakeResponse& msg);
FinalizeResult from_message(const pb::FinalizeResponse& msg);

// Error carried by an ErrorResponse, mapped back into the shuttle category
boost::system::error_code error_from_message(const pb::ErrorResponse& msg);

} // namespace wire
} // namespace shuttle
