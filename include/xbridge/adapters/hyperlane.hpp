#ifndef XBRIDGE_ADAPTERS_HYPERLANE_HPP
#define XBRIDGE_ADAPTERS_HYPERLANE_HPP

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// HyperlaneAdapter - mailbox dispatch with StandardHookMetadata gas overrides
// =============================================================================

class HyperlaneAdapter : public BaseAdapter {
public:
    HyperlaneAdapter(Chain& chain, const Address& mailbox, const AdapterConfig& config);

    // Mailbox only
    void handle(uint32_t origin, const Bytes32& sender, const Bytes& body);

    const Address& mailbox() const { return bridge(); }

    // variant 1 | msg value | gas limit | refund address
    static Bytes hook_metadata(U128 gas_limit, const Address& refund);

protected:
    Address refund_address(const Bytes& options) const override;
    U128 transport_quote(const Outbound& out) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_HYPERLANE_HPP
