#ifndef XBRIDGE_CONFIG_HPP
#define XBRIDGE_CONFIG_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "adapter.hpp"
#include "log.hpp"
#include "types.hpp"

namespace xbridge {

class ControllerWrapper;

// =============================================================================
// Deployment Description
// =============================================================================

struct ChainEntry {
    std::string name;
    ChainId chain_id = 0;
};

struct AdapterEntry {
    std::string kind;                   // axelar, ccip, connext, hyperlane, layerzero, optimism, polymer, wormhole
    AdapterConfig config;
};

struct FeeTierEntry {
    ChainId dest_chain_id = 0;
    std::vector<U128> thresholds;
    std::vector<uint32_t> rates;
};

struct FeeScheduleConfig {
    Address treasury{};
    uint32_t fee_rate = 0;
    std::map<ChainId, uint32_t> premiums;
    std::vector<FeeTierEntry> tiers;
};

// =============================================================================
// Config
// =============================================================================

class Config {
public:
    log::Level log_level = log::Level::Info;
    std::vector<ChainEntry> chains;
    std::vector<AdapterEntry> adapters;
    FeeScheduleConfig wrapper;

    // Throws std::runtime_error when the file is missing or malformed
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    // Chain id for a configured chain name
    ChainId chain_id(std::string_view name) const;

    // Pushes rate, premiums and `controller`'s tiers into `wrapper` as `manager`
    void apply_fee_schedule(ControllerWrapper& wrapper, const Address& controller, const Address& manager) const;
};

} // namespace xbridge

#endif // XBRIDGE_CONFIG_HPP
