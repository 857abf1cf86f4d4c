#ifndef XBRIDGE_ADAPTERS_WORMHOLE_HPP
#define XBRIDGE_ADAPTERS_WORMHOLE_HPP

#include <set>

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// WormholeAdapter - automatic relayer delivery, domains are wormhole chain ids
// =============================================================================

class WormholeAdapter : public BaseAdapter {
public:
    WormholeAdapter(Chain& chain, const Address& relayer, const AdapterConfig& config);

    // Relayer only; each delivery hash is accepted once
    void receive_wormhole_messages(const Bytes& payload, const std::vector<Bytes>& additional_messages,
                                   const Bytes32& source_address, uint16_t source_chain,
                                   const Bytes32& delivery_hash);

    bool is_delivery_processed(const Bytes32& delivery_hash) const;
    const Address& relayer() const { return bridge(); }

protected:
    Address refund_address(const Bytes& options) const override;
    U128 transport_quote(const Outbound& out) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;

private:
    Journaled<std::set<Bytes32>> deliveries_;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_WORMHOLE_HPP
