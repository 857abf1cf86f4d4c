// =============================================================================
// wormhole.cpp - Wormhole Relayer Adapter
// =============================================================================

#include "xbridge/adapters/wormhole.hpp"

namespace xbridge {

WormholeAdapter::WormholeAdapter(Chain& chain, const Address& relayer, const AdapterConfig& config)
    : BaseAdapter(chain, relayer, config, FeeModel::Quoted)
    , deliveries_(*this) {}

Address WormholeAdapter::refund_address(const Bytes& options) const {
    WormholeOptions opts = options::decode_wormhole(options);
    if (!domain_for_chain(opts.refund_chain_id)) {
        revert(errors::UNKNOWN_REFUND_CHAIN_ID, std::to_string(opts.refund_chain_id));
    }
    return opts.refund_address;
}

U128 WormholeAdapter::transport_quote(const Outbound& out) const {
    const WormholeOptions opts = options::decode_wormhole(out.options);
    const auto target = static_cast<uint16_t>(require_domain(out.dest_chain_id));
    auto& wh = chain().require_contract<IWormholeRelayer>(relayer());
    return wh.quote_evm_delivery_price(target, 0, opts.gas_limit);
}

Bytes32 WormholeAdapter::transport_send(const Outbound& out, U128 fee) {
    const WormholeOptions opts = options::decode_wormhole(out.options);
    const auto target = static_cast<uint16_t>(require_domain(out.dest_chain_id));
    const auto refund_chain = static_cast<uint16_t>(require_domain(opts.refund_chain_id));

    auto& wh = chain().require_contract<IWormholeRelayer>(relayer());
    uint64_t sequence = chain().call(address(), relayer(), fee, [&] {
        return wh.send_payload_to_evm(target, out.trusted_adapter, out.payload, 0, opts.gas_limit,
                                      refund_chain, opts.refund_address);
    });
    return bytes32_from_u64(sequence);
}

void WormholeAdapter::receive_wormhole_messages(const Bytes& payload, const std::vector<Bytes>&,
                                                const Bytes32& source_address, uint16_t source_chain,
                                                const Bytes32& delivery_hash) {
    ReentrancyGuard guard(reentrancy_lock_);
    only_bridge(errors::UNAUTHORISED);

    if (is_delivery_processed(delivery_hash)) {
        revert(errors::ALREADY_PROCESSED, to_hex(delivery_hash));
    }
    deliveries_->insert(delivery_hash);

    ChainId origin_chain = chain_for_domain(source_chain).value_or(0);
    dispatch_inbound(origin_chain, addresses::from_bytes32(source_address), payload);
}

bool WormholeAdapter::is_delivery_processed(const Bytes32& delivery_hash) const {
    return deliveries_->count(delivery_hash) > 0;
}

} // namespace xbridge
