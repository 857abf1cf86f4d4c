#ifndef XBRIDGE_ADAPTERS_LAYERZERO_HPP
#define XBRIDGE_ADAPTERS_LAYERZERO_HPP

#include <map>

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// LayerZeroAdapter - LayerZero v2 OApp; domains are endpoint ids
// =============================================================================

class LayerZeroAdapter : public BaseAdapter {
public:
    LayerZeroAdapter(Chain& chain, const Address& endpoint, const AdapterConfig& config);

    // Endpoint only; origin.sender must be the registered peer for origin.src_eid
    void lz_receive(const LzOrigin& origin, const Bytes32& guid, const Bytes& payload,
                    const Address& executor, const Bytes& extra_data);

    // DefaultAdmin
    void set_peer(uint32_t eid, const Bytes32& peer);

    Bytes32 peer(uint32_t eid) const;
    const Address& endpoint() const { return bridge(); }

    // Type-3 options carrying a single lzReceive executor gas option
    static Bytes executor_options(U128 gas_limit);

protected:
    Address refund_address(const Bytes& options) const override;
    U128 transport_quote(const Outbound& out) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;

private:
    MessagingParams build_params(const Outbound& out) const;

    Journaled<std::map<uint32_t, Bytes32>> peers_;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_LAYERZERO_HPP
