#ifndef XBRIDGE_REGISTRY_HPP
#define XBRIDGE_REGISTRY_HPP

#include <vector>

#include "access.hpp"
#include "chain.hpp"

namespace xbridge {

// =============================================================================
// Registry - which adapters on this chain are trusted locally
// =============================================================================

class Registry : public Contract {
public:
    Registry(Chain& chain, const std::vector<Address>& adapters, const Address& owner);

    // Owner only
    void set_adapters(const std::vector<Address>& adapters, const std::vector<bool>& statuses);

    bool is_local_adapter(const Address& adapter) const;

    // Enabled adapters whose is_chain_id_supported(chain_id) holds, in registration order
    std::vector<Address> supported_bridges_for_chain(ChainId chain_id) const;

    // Reverts NotAdapter unless `adapter` is enabled here
    std::vector<ChainId> supported_chains_for_adapter(const Address& adapter) const;

    const Address& owner() const { return ownable_.owner(); }

private:
    struct Entry {
        Address adapter;
        bool enabled;
    };

    Entry* find(const Address& adapter);
    const Entry* find(const Address& adapter) const;

    Ownable ownable_;
    Journaled<std::vector<Entry>> entries_;
};

} // namespace xbridge

#endif // XBRIDGE_REGISTRY_HPP
