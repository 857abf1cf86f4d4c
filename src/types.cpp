// =============================================================================
// types.cpp - Address / Hex / U128 Formatting
// =============================================================================

#include "xbridge/types.hpp"
#include <stdexcept>
#include <algorithm>

namespace xbridge {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string encode_hex(const uint8_t* data, size_t len) {
    std::string out = "0x";
    out.reserve(2 + len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string_view strip_prefix(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    return hex;
}

void decode_hex(std::string_view hex, uint8_t* out, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in: " + std::string(hex));
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    return encode_hex(addr.data(), addr.size());
}

Address from_hex(std::string_view hex) {
    hex = strip_prefix(hex);
    if (hex.size() != 40) {
        throw std::invalid_argument("address must be 20 bytes: " + std::string(hex));
    }
    Address addr = {};
    decode_hex(hex, addr.data(), addr.size());
    return addr;
}

} // namespace addresses

// =============================================================================
// Hex
// =============================================================================

std::string to_hex(const Bytes& data) {
    return encode_hex(data.data(), data.size());
}

std::string to_hex(const Bytes32& word) {
    return encode_hex(word.data(), word.size());
}

Bytes bytes_from_hex(std::string_view hex) {
    hex = strip_prefix(hex);
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("odd-length hex string");
    }
    Bytes out(hex.size() / 2);
    decode_hex(hex, out.data(), out.size());
    return out;
}

Bytes32 bytes32_from_hex(std::string_view hex) {
    hex = strip_prefix(hex);
    if (hex.size() != 64) {
        throw std::invalid_argument("bytes32 must be 32 bytes: " + std::string(hex));
    }
    Bytes32 out = {};
    decode_hex(hex, out.data(), out.size());
    return out;
}

Bytes32 bytes32_from_u64(uint64_t value) {
    Bytes32 out = {};
    for (int i = 31; i >= 24; --i) {
        out[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

// =============================================================================
// U128
// =============================================================================

std::string u128_to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty integer");
    }
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("not a decimal integer: " + std::string(text));
        }
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) {
            throw std::out_of_range("integer exceeds 128 bits: " + std::string(text));
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace xbridge
