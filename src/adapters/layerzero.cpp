// =============================================================================
// layerzero.cpp - LayerZero v2 Adapter
// =============================================================================

#include "xbridge/adapters/layerzero.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

namespace {

constexpr uint16_t OPTIONS_TYPE_3 = 3;
constexpr uint8_t WORKER_EXECUTOR = 1;
constexpr uint8_t OPTION_LZ_RECEIVE = 1;

} // namespace

LayerZeroAdapter::LayerZeroAdapter(Chain& chain, const Address& endpoint, const AdapterConfig& config)
    : BaseAdapter(chain, endpoint, config, FeeModel::Quoted)
    , peers_(*this) {}

Bytes LayerZeroAdapter::executor_options(U128 gas_limit) {
    // type(2) | worker(1) | size(2) | option type(1) | gas(16)
    Bytes out;
    out.push_back(static_cast<uint8_t>(OPTIONS_TYPE_3 >> 8));
    out.push_back(static_cast<uint8_t>(OPTIONS_TYPE_3 & 0xFF));
    out.push_back(WORKER_EXECUTOR);
    const uint16_t size = 1 + 16;
    out.push_back(static_cast<uint8_t>(size >> 8));
    out.push_back(static_cast<uint8_t>(size & 0xFF));
    out.push_back(OPTION_LZ_RECEIVE);
    for (int shift = 120; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((gas_limit >> shift) & 0xFF));
    }
    return out;
}

Address LayerZeroAdapter::refund_address(const Bytes& options) const {
    return options::decode_gas(options).refund_address;
}

MessagingParams LayerZeroAdapter::build_params(const Outbound& out) const {
    GasOptions opts = options::decode_gas(out.options);
    MessagingParams params;
    params.dst_eid = static_cast<uint32_t>(require_domain(out.dest_chain_id));
    params.receiver = addresses::to_bytes32(out.trusted_adapter);
    params.message = out.payload;
    params.options = executor_options(opts.gas_limit);
    params.pay_in_lz_token = false;
    return params;
}

U128 LayerZeroAdapter::transport_quote(const Outbound& out) const {
    auto& ep = chain().require_contract<ILayerZeroEndpoint>(endpoint());
    return ep.quote(build_params(out), address()).native_fee;
}

Bytes32 LayerZeroAdapter::transport_send(const Outbound& out, U128 fee) {
    MessagingParams params = build_params(out);
    const Address refund = refund_address(out.options);
    auto& ep = chain().require_contract<ILayerZeroEndpoint>(endpoint());
    MessagingReceipt receipt = chain().call(address(), endpoint(), fee, [&] {
        return ep.send(params, refund);
    });
    return receipt.guid;
}

void LayerZeroAdapter::lz_receive(const LzOrigin& origin, const Bytes32&, const Bytes& payload,
                                  const Address&, const Bytes&) {
    ReentrancyGuard guard(reentrancy_lock_);
    only_bridge(errors::UNAUTHORISED);

    Bytes32 expected = peer(origin.src_eid);
    if (expected == ZERO_BYTES32 || expected != origin.sender) {
        revert(errors::ONLY_PEER, "eid " + std::to_string(origin.src_eid));
    }

    ChainId origin_chain = chain_for_domain(origin.src_eid).value_or(0);
    dispatch_inbound(origin_chain, addresses::from_bytes32(origin.sender), payload);
}

void LayerZeroAdapter::set_peer(uint32_t eid, const Bytes32& peer) {
    access_.only_role(Role::DefaultAdmin);
    (*peers_)[eid] = peer;
    emit("PeerSet", {{"eid", eid}, {"peer", to_hex(peer)}});
    XB_INFO(adapter_name() << " peer for eid " << eid << " set to " << to_hex(peer));
}

Bytes32 LayerZeroAdapter::peer(uint32_t eid) const {
    auto it = peers_->find(eid);
    return it == peers_->end() ? ZERO_BYTES32 : it->second;
}

} // namespace xbridge
