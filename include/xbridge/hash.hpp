#ifndef XBRIDGE_HASH_HPP
#define XBRIDGE_HASH_HPP

#include "types.hpp"
#include <string_view>

namespace xbridge {
namespace hash {

// SHA3-256 through OpenSSL EVP; throws std::runtime_error if the digest is unavailable
Bytes32 sha3_256(const uint8_t* data, size_t len);
Bytes32 sha3_256(const Bytes& data);
Bytes32 sha3_256(std::string_view text);

} // namespace hash
} // namespace xbridge

#endif // XBRIDGE_HASH_HPP
