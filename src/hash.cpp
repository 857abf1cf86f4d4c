// =============================================================================
// hash.cpp - SHA3-256 Digests
// =============================================================================

#include "xbridge/hash.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace xbridge {
namespace hash {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

Bytes32 sha3_256(const uint8_t* data, size_t len) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("sha3_256: EVP_MD_CTX_new failed");
    }

    Bytes32 out = {};
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 ||
        out_len != out.size()) {
        throw std::runtime_error("sha3_256: digest failed");
    }
    return out;
}

Bytes32 sha3_256(const Bytes& data) {
    return sha3_256(data.data(), data.size());
}

Bytes32 sha3_256(std::string_view text) {
    return sha3_256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace hash
} // namespace xbridge
