#ifndef XBRIDGE_ADAPTERS_CCIP_HPP
#define XBRIDGE_ADAPTERS_CCIP_HPP

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// CCIPAdapter - Chainlink CCIP router, domains are chain selectors
// =============================================================================

class CCIPAdapter : public BaseAdapter {
public:
    CCIPAdapter(Chain& chain, const Address& router, const AdapterConfig& config);

    // Router only
    void ccip_receive(const Any2EvmMessage& message);

    const Address& router() const { return bridge(); }

protected:
    Address refund_address(const Bytes& options) const override;
    U128 transport_quote(const Outbound& out) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;

private:
    Evm2AnyMessage build_message(const Outbound& out) const;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_CCIP_HPP
