// =============================================================================
// abi.cpp - Solidity ABI Encoding
// =============================================================================

#include "xbridge/abi.hpp"
#include "xbridge/errors.hpp"
#include <cstring>
#include <limits>

namespace xbridge {
namespace abi {

namespace {

size_t padded_length(size_t len) {
    return (len + WORD - 1) / WORD * WORD;
}

} // namespace

// =============================================================================
// Word Helpers
// =============================================================================

uint32_t decode_uint32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

uint64_t decode_uint64(const uint8_t* data) {
    uint64_t result = 0;
    for (int i = 0; i < 8; ++i) {
        result = (result << 8) | data[i];
    }
    return result;
}

void encode_uint32(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(value & 0xFF);
}

void encode_uint64(uint8_t* out, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

U128 decode_uint(const uint8_t* word) {
    for (int i = 0; i < 16; ++i) {
        if (word[i] != 0) revert(errors::ABI_DECODE_ERROR, "uint exceeds 128 bits");
    }
    U128 result = 0;
    for (int i = 16; i < 32; ++i) {
        result = (result << 8) | word[i];
    }
    return result;
}

void encode_uint(uint8_t* word, U128 value) {
    std::memset(word, 0, 16);
    for (int i = 31; i >= 16; --i) {
        word[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

Address decode_address(const uint8_t* word) {
    for (int i = 0; i < 12; ++i) {
        if (word[i] != 0) revert(errors::ABI_DECODE_ERROR, "dirty address padding");
    }
    Address addr;
    std::memcpy(addr.data(), word + 12, 20);
    return addr;
}

void encode_address(uint8_t* word, const Address& addr) {
    std::memset(word, 0, 12);
    std::memcpy(word + 12, addr.data(), 20);
}

// =============================================================================
// Encoder
// =============================================================================

Encoder& Encoder::add_uint(U128 value) {
    Bytes word(WORD);
    encode_uint(word.data(), value);
    slots_.push_back(Slot{false, std::move(word)});
    return *this;
}

Encoder& Encoder::add_address(const Address& addr) {
    Bytes word(WORD);
    encode_address(word.data(), addr);
    slots_.push_back(Slot{false, std::move(word)});
    return *this;
}

Encoder& Encoder::add_bytes32(const Bytes32& word) {
    slots_.push_back(Slot{false, Bytes(word.begin(), word.end())});
    return *this;
}

Encoder& Encoder::add_bool(bool value) {
    Bytes word(WORD, 0);
    word[31] = value ? 1 : 0;
    slots_.push_back(Slot{false, std::move(word)});
    return *this;
}

Encoder& Encoder::add_bytes(const Bytes& data) {
    slots_.push_back(Slot{true, data});
    return *this;
}

Encoder& Encoder::add_string(std::string_view text) {
    slots_.push_back(Slot{true, Bytes(text.begin(), text.end())});
    return *this;
}

Bytes Encoder::finish() const {
    const size_t head_size = slots_.size() * WORD;
    Bytes head(head_size, 0);
    Bytes tail;

    for (size_t i = 0; i < slots_.size(); ++i) {
        const auto& slot = slots_[i];
        uint8_t* word = head.data() + i * WORD;
        if (!slot.dynamic) {
            std::memcpy(word, slot.data.data(), WORD);
            continue;
        }
        encode_uint(word, static_cast<U128>(head_size + tail.size()));

        size_t at = tail.size();
        tail.resize(at + WORD + padded_length(slot.data.size()), 0);
        encode_uint(tail.data() + at, static_cast<U128>(slot.data.size()));
        if (!slot.data.empty()) {
            std::memcpy(tail.data() + at + WORD, slot.data.data(), slot.data.size());
        }
    }

    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

// =============================================================================
// Decoder
// =============================================================================

const uint8_t* Decoder::next_word() {
    if (head_ + WORD > data_.size()) {
        revert(errors::ABI_DECODE_ERROR, "read past end of data");
    }
    const uint8_t* word = data_.data() + head_;
    head_ += WORD;
    return word;
}

U128 Decoder::read_uint() {
    return decode_uint(next_word());
}

uint64_t Decoder::read_uint64() {
    U128 value = read_uint();
    if (value > std::numeric_limits<uint64_t>::max()) {
        revert(errors::ABI_DECODE_ERROR, "uint exceeds 64 bits");
    }
    return static_cast<uint64_t>(value);
}

Address Decoder::read_address() {
    return decode_address(next_word());
}

Bytes32 Decoder::read_bytes32() {
    const uint8_t* word = next_word();
    Bytes32 out;
    std::memcpy(out.data(), word, WORD);
    return out;
}

bool Decoder::read_bool() {
    U128 value = read_uint();
    if (value > 1) revert(errors::ABI_DECODE_ERROR, "bool out of range");
    return value == 1;
}

Bytes Decoder::read_bytes() {
    U128 offset = read_uint();
    if (offset > data_.size() || data_.size() - static_cast<size_t>(offset) < WORD) {
        revert(errors::ABI_DECODE_ERROR, "dynamic offset out of range");
    }
    const size_t at = static_cast<size_t>(offset);
    U128 length = decode_uint(data_.data() + at);
    if (length > data_.size() - at - WORD) {
        revert(errors::ABI_DECODE_ERROR, "dynamic length out of range");
    }
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(at + WORD);
    return Bytes(begin, begin + static_cast<std::ptrdiff_t>(length));
}

std::string Decoder::read_string() {
    Bytes raw = read_bytes();
    return std::string(raw.begin(), raw.end());
}

} // namespace abi
} // namespace xbridge
