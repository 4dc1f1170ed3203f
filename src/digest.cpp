#include "shuttle/digest.hpp"
#include "shuttle/error.hpp"
#include "shuttle/hex.hpp"

namespace shuttle {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw UploadError(errc::storage_failure, "EVP_DigestInit_ex failed");
    }
}

void Sha256::update(const void* data, size_t len) {
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw UploadError(errc::storage_failure, "EVP_DigestUpdate failed");
    }
}

std::string Sha256::hex_digest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
        throw UploadError(errc::storage_failure, "EVP_DigestFinal_ex failed");
    }
    return util::to_hex(hash, hash_len);
}

std::string sha256_hex(const void* data, size_t len) {
    Sha256 sha;
    sha.update(data, len);
    return sha.hex_digest();
}

} // namespace shuttle
