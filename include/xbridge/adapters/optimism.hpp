#ifndef XBRIDGE_ADAPTERS_OPTIMISM_HPP
#define XBRIDGE_ADAPTERS_OPTIMISM_HPP

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// OptimismL2Adapter - native L2-to-L2 messenger, flat min_gas fee
// =============================================================================

class OptimismL2Adapter : public BaseAdapter {
public:
    // config.chain_ids are enabled; config.domain_ids must be empty
    OptimismL2Adapter(Chain& chain, const Address& messenger, const AdapterConfig& config);

    // Messenger only; call_data is abi(uint256 origin_chain_id, bytes envelope)
    void receive_message(const Bytes& call_data);

    // DefaultAdmin; emits ChainIdSet per chain
    void set_domain_id(const std::vector<ChainId>& chain_ids, bool status);

    const Address& messenger() const { return bridge(); }

    static constexpr uint32_t MESSAGE_GAS_LIMIT = 200000;

protected:
    Address refund_address(const Bytes& options) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_OPTIMISM_HPP
