// =============================================================================
// connext.cpp - Connext Adapter
// =============================================================================

#include "xbridge/adapters/connext.hpp"

namespace xbridge {

ConnextAdapter::ConnextAdapter(Chain& chain, const Address& connext, const AdapterConfig& config)
    : BaseAdapter(chain, connext, config, FeeModel::Unquoted) {}

Address ConnextAdapter::refund_address(const Bytes& options) const {
    return options::decode_refund(options).refund_address;
}

Bytes32 ConnextAdapter::transport_send(const Outbound& out, U128 fee) {
    const auto destination = static_cast<uint32_t>(require_domain(out.dest_chain_id));
    const Address delegate = refund_address(out.options);
    auto& endpoint = chain().require_contract<IConnext>(connext());
    return chain().call(address(), connext(), fee, [&] {
        return endpoint.xcall(destination, out.trusted_adapter, ZERO_ADDRESS, delegate, 0, 0, out.payload);
    });
}

Bytes ConnextAdapter::x_receive(const Bytes32&, U128, const Address&,
                                const Address& origin_sender, uint32_t origin, const Bytes& call_data) {
    ReentrancyGuard guard(reentrancy_lock_);
    only_bridge(errors::UNAUTHORISED);

    ChainId origin_chain = chain_for_domain(origin).value_or(0);
    dispatch_inbound(origin_chain, origin_sender, call_data);
    return Bytes{};
}

} // namespace xbridge
