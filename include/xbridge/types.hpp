#ifndef XBRIDGE_TYPES_HPP
#define XBRIDGE_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace xbridge {

// =============================================================================
// Primitive Types (EVM-shaped)
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Bytes32 = std::array<uint8_t, 32>;
using Bytes = std::vector<uint8_t>;

using I128 = __int128;
using U128 = unsigned __int128;

// Canonical chain id (EIP-155), distinct from any bridge's own domain id
using ChainId = uint64_t;

constexpr Address ZERO_ADDRESS{};
constexpr Bytes32 ZERO_BYTES32{};
constexpr U128 U128_MAX = ~static_cast<U128>(0);

// =============================================================================
// Address Helpers
// =============================================================================

namespace addresses {

// Build an address whose low 8 bytes hold `value` (externally owned accounts in tests/tools)
constexpr Address from_u64(uint64_t value) {
    Address addr = {};
    for (int i = 19; i >= 12; --i) {
        addr[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Left-pad to a 32-byte word (bytes32(uint256(uint160(addr))))
constexpr Bytes32 to_bytes32(const Address& addr) {
    Bytes32 out = {};
    for (size_t i = 0; i < 20; ++i) out[12 + i] = addr[i];
    return out;
}

// Take the low 20 bytes of a word
constexpr Address from_bytes32(const Bytes32& word) {
    Address addr = {};
    for (size_t i = 0; i < 20; ++i) addr[i] = word[12 + i];
    return addr;
}

std::string to_hex(const Address& addr);

// Parses "0x" + 40 hex chars; throws std::invalid_argument on malformed input
Address from_hex(std::string_view hex);

} // namespace addresses

// =============================================================================
// Fee Constants (1% == 1000 units everywhere)
// =============================================================================

namespace fees {
constexpr uint32_t FEE_DECIMALS = 100000;       // adapter protocol fee denominator
constexpr uint32_t RATE_DENOMINATOR = 100000;   // wrapper / collector denominator
constexpr uint32_t MAX_FEE_RATE = 5000;         // 5.00% wrapper ceiling (flat, tier and premium)
constexpr uint32_t MAX_FEE_BPS = 5000;          // 5.00% fee collector ceiling
constexpr size_t MAX_FEE_TIERS = 3;
}

// =============================================================================
// Formatting
// =============================================================================

std::string to_hex(const Bytes& data);
std::string to_hex(const Bytes32& word);

// Throws std::invalid_argument on malformed input or odd length
Bytes bytes_from_hex(std::string_view hex);
Bytes32 bytes32_from_hex(std::string_view hex);

Bytes32 bytes32_from_u64(uint64_t value);

std::string u128_to_string(U128 value);

// Decimal only; throws std::invalid_argument / std::out_of_range
U128 parse_u128(std::string_view text);

} // namespace xbridge

#endif // XBRIDGE_TYPES_HPP
