// =============================================================================
// ccip.cpp - Chainlink CCIP Adapter
// =============================================================================

#include "xbridge/adapters/ccip.hpp"
#include "xbridge/abi.hpp"

namespace xbridge {

namespace {

const Address& checked_router(const Address& router) {
    if (addresses::is_zero(router)) revert(errors::INVALID_ROUTER, "zero router");
    return router;
}

} // namespace

CCIPAdapter::CCIPAdapter(Chain& chain, const Address& router, const AdapterConfig& config)
    : BaseAdapter(chain, checked_router(router), config, FeeModel::Quoted) {}

Address CCIPAdapter::refund_address(const Bytes& options) const {
    return options::decode_refund(options).refund_address;
}

Evm2AnyMessage CCIPAdapter::build_message(const Outbound& out) const {
    Evm2AnyMessage msg;
    msg.receiver = abi::Encoder().add_address(out.trusted_adapter).finish();
    msg.data = out.payload;
    msg.fee_token = ZERO_ADDRESS;
    return msg;
}

U128 CCIPAdapter::transport_quote(const Outbound& out) const {
    auto& r = chain().require_contract<ICcipRouter>(router());
    return r.get_fee(require_domain(out.dest_chain_id), build_message(out));
}

Bytes32 CCIPAdapter::transport_send(const Outbound& out, U128 fee) {
    const uint64_t selector = require_domain(out.dest_chain_id);
    Evm2AnyMessage msg = build_message(out);
    auto& r = chain().require_contract<ICcipRouter>(router());
    return chain().call(address(), router(), fee, [&] {
        return r.ccip_send(selector, msg);
    });
}

void CCIPAdapter::ccip_receive(const Any2EvmMessage& message) {
    ReentrancyGuard guard(reentrancy_lock_);
    only_bridge(errors::INVALID_ROUTER);

    abi::Decoder dec(message.sender);
    Address origin_adapter = dec.read_address();
    ChainId origin_chain = chain_for_domain(message.source_chain_selector).value_or(0);
    dispatch_inbound(origin_chain, origin_adapter, message.data);
}

} // namespace xbridge
