#ifndef XBRIDGE_ADAPTERS_POLYMER_HPP
#define XBRIDGE_ADAPTERS_POLYMER_HPP

#include <set>

#include "../adapter.hpp"
#include "../bridges.hpp"

namespace xbridge {

// =============================================================================
// PolymerAdapter - outbound is an event, inbound is a prover-validated copy of it
// =============================================================================
//
// RelayViaPolymer(uint256 indexed destChainId, address indexed destAdapter,
//                 bytes32 indexed transferId, bytes message)
//
// topics: [event hash | dest chain | dest adapter | transfer id], 128 bytes
// data:   abi(bytes message)

class PolymerAdapter : public BaseAdapter {
public:
    PolymerAdapter(Chain& chain, const Address& prover, const AdapterConfig& config);

    // Permissionless; the proof is the authentication
    void receive_message(const Bytes& proof);

    // DefaultAdmin; emits ChainIdSet per chain
    void set_domain_id(const std::vector<ChainId>& chain_ids, bool status);

    uint64_t nonce() const { return state_poly_->nonce; }
    bool is_transfer_processed(const Bytes32& transfer_id) const;
    const Address& prover() const { return bridge(); }

    // Id the next relay to dest_chain_id carrying `payload` will use
    Bytes32 calculate_transfer_id(ChainId dest_chain_id, const Bytes& payload) const;

    static Bytes32 relay_event_hash();
    static Bytes encode_topics(ChainId dest_chain_id, const Address& dest_adapter, const Bytes32& transfer_id);
    static Bytes encode_data(const Bytes& payload);

protected:
    Address refund_address(const Bytes& options) const override;
    Bytes32 transport_send(const Outbound& out, U128 fee) override;

private:
    struct PolymerState {
        uint64_t nonce = 0;
        std::set<Bytes32> processed;
    };

    Journaled<PolymerState> state_poly_;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTERS_POLYMER_HPP
