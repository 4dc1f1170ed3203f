#pragma once

#include <string>
#include <cstddef>

namespace shuttle {
namespace util {

// --- Functions for rendering binary ids and digests ---
std::string to_hex(const unsigned char* data, size_t len);

// Fresh 128-bit random id, hex encoded
std::string random_id();

} // namespace util
} // namespace shuttle
