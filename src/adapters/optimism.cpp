// =============================================================================
// optimism.cpp - Optimism L2 Native Messaging Adapter
// =============================================================================

#include "xbridge/adapters/optimism.hpp"
#include "xbridge/abi.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

OptimismL2Adapter::OptimismL2Adapter(Chain& chain, const Address& messenger, const AdapterConfig& config)
    : BaseAdapter(chain, messenger, strip_domains(config), FeeModel::Flat) {
    require(config.domain_ids.empty(), errors::INVALID_PARAMS, "optimism is keyed by chain id");
    for (ChainId id : config.chain_ids) {
        set_chain_supported(id, true);
    }
}

Address OptimismL2Adapter::refund_address(const Bytes& options) const {
    return options::decode_refund(options).refund_address;
}

Bytes32 OptimismL2Adapter::transport_send(const Outbound& out, U128) {
    abi::Encoder enc;
    enc.add_uint(chain().id());
    enc.add_bytes(out.payload);
    const Bytes call_data = enc.finish();

    auto& xdm = chain().require_contract<ICrossDomainMessenger>(messenger());
    chain().call(address(), messenger(), [&] {
        xdm.send_message(out.trusted_adapter, call_data, MESSAGE_GAS_LIMIT);
    });
    return ZERO_BYTES32;
}

void OptimismL2Adapter::receive_message(const Bytes& call_data) {
    ReentrancyGuard guard(reentrancy_lock_);
    only_bridge(errors::UNAUTHORISED);

    abi::Decoder dec(call_data);
    const ChainId origin = dec.read_uint64();
    const Bytes payload = dec.read_bytes();

    const Address origin_adapter = chain().require_contract<ICrossDomainMessenger>(messenger())
                                       .x_domain_message_sender();
    dispatch_inbound(origin, origin_adapter, payload);
}

void OptimismL2Adapter::set_domain_id(const std::vector<ChainId>& chain_ids, bool status) {
    access_.only_role(Role::DefaultAdmin);
    for (ChainId id : chain_ids) {
        set_chain_supported(id, status);
    }
    XB_INFO(adapter_name() << (status ? " enabled " : " disabled ") << chain_ids.size() << " chains");
}

} // namespace xbridge
