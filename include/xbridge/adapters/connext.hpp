#ifndef XBRIDGE_ADAPTERS_CONNEXT_HPP
#define XBRIDGE_ADAPTERS_CONNEXT_HPP

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// ConnextAdapter - xcall with the relayer fee paid in native value
// =============================================================================

class ConnextAdapter : public BaseAdapter {
public:
    ConnextAdapter(Chain& chain, const Address& connext, const AdapterConfig& config);

    // Connext only
    Bytes x_receive(const Bytes32& transfer_id, U128 amount, const Address& asset,
                    const Address& origin_sender, uint32_t origin, const Bytes& call_data);

    const Address& connext() const { return bridge(); }

protected:
    Address refund_address(const Bytes& options) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_CONNEXT_HPP
