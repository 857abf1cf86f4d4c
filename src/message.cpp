// =============================================================================
// message.cpp - Envelope and Option Codecs
// =============================================================================

#include "xbridge/message.hpp"
#include "xbridge/abi.hpp"

namespace xbridge {

namespace envelope {

Bytes encode(const BridgedMessage& msg) {
    return abi::Encoder()
        .add_bytes(msg.message)
        .add_address(msg.origin_sender)
        .add_address(msg.destination)
        .finish();
}

BridgedMessage decode(const Bytes& payload) {
    abi::Decoder dec(payload);
    BridgedMessage msg;
    msg.message = dec.read_bytes();
    msg.origin_sender = dec.read_address();
    msg.destination = dec.read_address();
    return msg;
}

} // namespace envelope

namespace options {

Bytes encode(const RefundOptions& opts) {
    return abi::Encoder().add_address(opts.refund_address).finish();
}

Bytes encode(const GasOptions& opts) {
    return abi::Encoder()
        .add_address(opts.refund_address)
        .add_uint(opts.gas_limit)
        .finish();
}

Bytes encode(const WormholeOptions& opts) {
    return abi::Encoder()
        .add_address(opts.refund_address)
        .add_uint(opts.refund_chain_id)
        .add_uint(opts.gas_limit)
        .finish();
}

RefundOptions decode_refund(const Bytes& data) {
    abi::Decoder dec(data);
    return RefundOptions{dec.read_address()};
}

GasOptions decode_gas(const Bytes& data) {
    abi::Decoder dec(data);
    GasOptions opts;
    opts.refund_address = dec.read_address();
    opts.gas_limit = dec.read_uint();
    return opts;
}

WormholeOptions decode_wormhole(const Bytes& data) {
    abi::Decoder dec(data);
    WormholeOptions opts;
    opts.refund_address = dec.read_address();
    opts.refund_chain_id = dec.read_uint64();
    opts.gas_limit = dec.read_uint();
    return opts;
}

} // namespace options

} // namespace xbridge
