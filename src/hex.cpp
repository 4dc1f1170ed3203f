#include "shuttle/hex.hpp"
#include "shuttle/error.hpp"
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace shuttle {
namespace util {

std::string to_hex(const unsigned char* data, size_t len) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

std::string random_id() {
    unsigned char raw[16];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        throw UploadError(errc::storage_failure, "RAND_bytes failed");
    }
    return to_hex(raw, sizeof(raw));
}

} // namespace util
} // namespace shuttle
