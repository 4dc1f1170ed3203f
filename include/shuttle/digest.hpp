#pragma once

#include <openssl/evp.h>
#include <memory>
#include <string>
#include <cstddef>

namespace shuttle {

// Incremental SHA-256 over EVP. Feed it in pieces, read the hex digest once.
class Sha256 {
public:
    Sha256();
    void update(const void* data, size_t len);
    std::string hex_digest();

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

std::string sha256_hex(const void* data, size_t len);

} // namespace shuttle
