// =============================================================================
// hyperlane.cpp - Hyperlane Mailbox Adapter
// =============================================================================

#include "xbridge/adapters/hyperlane.hpp"
#include "xbridge/abi.hpp"
#include <cstring>

namespace xbridge {

HyperlaneAdapter::HyperlaneAdapter(Chain& chain, const Address& mailbox, const AdapterConfig& config)
    : BaseAdapter(chain, mailbox, config, FeeModel::Quoted) {}

Bytes HyperlaneAdapter::hook_metadata(U128 gas_limit, const Address& refund) {
    Bytes out(2 + abi::WORD + abi::WORD + 20, 0);
    out[1] = 1;
    abi::encode_uint(out.data() + 2, 0);
    abi::encode_uint(out.data() + 2 + abi::WORD, gas_limit);
    std::memcpy(out.data() + 2 + 2 * abi::WORD, refund.data(), refund.size());
    return out;
}

Address HyperlaneAdapter::refund_address(const Bytes& options) const {
    return options::decode_gas(options).refund_address;
}

U128 HyperlaneAdapter::transport_quote(const Outbound& out) const {
    GasOptions opts = options::decode_gas(out.options);
    auto& mb = chain().require_contract<IMailbox>(mailbox());
    return mb.quote_dispatch(static_cast<uint32_t>(require_domain(out.dest_chain_id)),
                             addresses::to_bytes32(out.trusted_adapter), out.payload,
                             hook_metadata(opts.gas_limit, opts.refund_address));
}

Bytes32 HyperlaneAdapter::transport_send(const Outbound& out, U128 fee) {
    GasOptions opts = options::decode_gas(out.options);
    const auto destination = static_cast<uint32_t>(require_domain(out.dest_chain_id));
    const Bytes metadata = hook_metadata(opts.gas_limit, opts.refund_address);
    auto& mb = chain().require_contract<IMailbox>(mailbox());
    return chain().call(address(), mailbox(), fee, [&] {
        return mb.dispatch(destination, addresses::to_bytes32(out.trusted_adapter), out.payload, metadata);
    });
}

void HyperlaneAdapter::handle(uint32_t origin, const Bytes32& sender, const Bytes& body) {
    ReentrancyGuard guard(reentrancy_lock_);
    only_bridge(errors::UNAUTHORISED);

    ChainId origin_chain = chain_for_domain(origin).value_or(0);
    dispatch_inbound(origin_chain, addresses::from_bytes32(sender), body);
}

} // namespace xbridge
