#ifndef XBRIDGE_MESSAGE_HPP
#define XBRIDGE_MESSAGE_HPP

#include "types.hpp"

namespace xbridge {

// =============================================================================
// BridgedMessage - transport-agnostic envelope, abi (bytes, address, address)
// =============================================================================

struct BridgedMessage {
    Bytes message;
    Address origin_sender;
    Address destination;

    bool operator==(const BridgedMessage& other) const {
        return message == other.message &&
               origin_sender == other.origin_sender &&
               destination == other.destination;
    }
};

namespace envelope {
Bytes encode(const BridgedMessage& msg);
BridgedMessage decode(const Bytes& payload);    // reverts AbiDecodeError
}

// =============================================================================
// Relay Options (per-transport option blobs)
// =============================================================================

// Axelar, CCIP, Connext, Optimism, Polymer
struct RefundOptions {
    Address refund_address;
};

// Hyperlane, LayerZero
struct GasOptions {
    Address refund_address;
    U128 gas_limit;
};

// Wormhole
struct WormholeOptions {
    Address refund_address;
    ChainId refund_chain_id;
    U128 gas_limit;
};

namespace options {
Bytes encode(const RefundOptions& opts);
Bytes encode(const GasOptions& opts);
Bytes encode(const WormholeOptions& opts);

RefundOptions decode_refund(const Bytes& data);
GasOptions decode_gas(const Bytes& data);
WormholeOptions decode_wormhole(const Bytes& data);
}

} // namespace xbridge

#endif // XBRIDGE_MESSAGE_HPP
