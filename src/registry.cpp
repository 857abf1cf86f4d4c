// =============================================================================
// registry.cpp - Registry Implementation
// =============================================================================

#include "xbridge/registry.hpp"
#include "xbridge/adapter.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

Registry::Registry(Chain& chain, const std::vector<Address>& adapters, const Address& owner)
    : Contract(chain)
    , ownable_(*this, owner)
    , entries_(*this) {
    for (const Address& adapter : adapters) {
        if (Entry* entry = find(adapter)) {
            entry->enabled = true;
        } else {
            entries_->push_back(Entry{adapter, true});
        }
    }
}

Registry::Entry* Registry::find(const Address& adapter) {
    for (Entry& entry : *entries_) {
        if (entry.adapter == adapter) return &entry;
    }
    return nullptr;
}

const Registry::Entry* Registry::find(const Address& adapter) const {
    for (const Entry& entry : *entries_) {
        if (entry.adapter == adapter) return &entry;
    }
    return nullptr;
}

void Registry::set_adapters(const std::vector<Address>& adapters, const std::vector<bool>& statuses) {
    ownable_.only_owner();
    require(adapters.size() == statuses.size(), errors::INVALID_PARAMS, "length mismatch");

    for (size_t i = 0; i < adapters.size(); ++i) {
        const bool enabled = statuses[i];
        if (Entry* entry = find(adapters[i])) {
            entry->enabled = enabled;
        } else {
            entries_->push_back(Entry{adapters[i], enabled});
        }
        emit("AdapterSet", {{"adapter", addresses::to_hex(adapters[i])}, {"status", enabled}});
    }
    XB_INFO("registry updated " << adapters.size() << " adapters");
}

bool Registry::is_local_adapter(const Address& adapter) const {
    const Entry* entry = find(adapter);
    return entry != nullptr && entry->enabled;
}

std::vector<Address> Registry::supported_bridges_for_chain(ChainId chain_id) const {
    std::vector<Address> out;
    for (const Entry& entry : *entries_) {
        if (!entry.enabled) continue;
        const auto* adapter = chain().contract_at<IBaseAdapter>(entry.adapter);
        if (adapter != nullptr && adapter->is_chain_id_supported(chain_id)) {
            out.push_back(entry.adapter);
        }
    }
    return out;
}

std::vector<ChainId> Registry::supported_chains_for_adapter(const Address& adapter) const {
    if (!is_local_adapter(adapter)) revert(errors::NOT_ADAPTER, addresses::to_hex(adapter));
    const auto* bridge = chain().contract_at<IBaseAdapter>(adapter);
    if (bridge == nullptr) return {};
    return bridge->supported_chain_ids();
}

} // namespace xbridge
