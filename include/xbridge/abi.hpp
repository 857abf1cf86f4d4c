#ifndef XBRIDGE_ABI_HPP
#define XBRIDGE_ABI_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace xbridge {
namespace abi {

// =============================================================================
// Word Helpers (32-byte big-endian slots)
// =============================================================================

constexpr size_t WORD = 32;

uint32_t decode_uint32(const uint8_t* data);
uint64_t decode_uint64(const uint8_t* data);
void encode_uint32(uint8_t* out, uint32_t value);
void encode_uint64(uint8_t* out, uint64_t value);

// Values wider than 128 bits revert with AbiDecodeError
U128 decode_uint(const uint8_t* word);
void encode_uint(uint8_t* word, U128 value);

// Non-zero padding reverts with AbiDecodeError
Address decode_address(const uint8_t* word);
void encode_address(uint8_t* word, const Address& addr);

// =============================================================================
// Encoder - abi.encode(...) for static words and dynamic bytes/string
// =============================================================================

class Encoder {
public:
    Encoder& add_uint(U128 value);
    Encoder& add_address(const Address& addr);
    Encoder& add_bytes32(const Bytes32& word);
    Encoder& add_bool(bool value);
    Encoder& add_bytes(const Bytes& data);
    Encoder& add_string(std::string_view text);

    Bytes finish() const;

private:
    struct Slot {
        bool dynamic;
        Bytes data;     // one word for static slots, raw payload for dynamic ones
    };
    std::vector<Slot> slots_;
};

// =============================================================================
// Decoder - reads fields in declaration order; malformed input reverts
// =============================================================================

class Decoder {
public:
    explicit Decoder(const Bytes& data) : data_(data) {}

    U128 read_uint();
    uint64_t read_uint64();
    Address read_address();
    Bytes32 read_bytes32();
    bool read_bool();
    Bytes read_bytes();
    std::string read_string();

private:
    const uint8_t* next_word();

    const Bytes& data_;
    size_t head_ = 0;
};

} // namespace abi
} // namespace xbridge

#endif // XBRIDGE_ABI_HPP
