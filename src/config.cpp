// =============================================================================
// config.cpp - Deployment Config (JSON)
// =============================================================================

#include "xbridge/config.hpp"
#include "xbridge/wrapper.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace xbridge {

namespace {

using json = nlohmann::json;

// Amounts may be written as decimal strings (full U128 range) or plain numbers
U128 read_amount(const json& value) {
    if (value.is_string()) return parse_u128(value.get<std::string>());
    if (value.is_number_unsigned()) return static_cast<U128>(value.get<uint64_t>());
    throw std::runtime_error("amount must be a decimal string or unsigned number: " + value.dump());
}

Address read_address(const json& value) {
    if (!value.is_string()) throw std::runtime_error("address must be a hex string: " + value.dump());
    return addresses::from_hex(value.get<std::string>());
}

uint32_t read_rate(const json& value) {
    const auto rate = value.get<uint64_t>();
    if (rate > fees::MAX_FEE_RATE) {
        throw std::runtime_error("fee rate " + std::to_string(rate) + " above maximum " +
                                 std::to_string(fees::MAX_FEE_RATE));
    }
    return static_cast<uint32_t>(rate);
}

AdapterEntry read_adapter(const json& j) {
    AdapterEntry entry;
    entry.kind = j.at("kind").get<std::string>();
    entry.config.name = j.value("name", entry.kind);
    if (j.contains("min_gas")) entry.config.min_gas = read_amount(j.at("min_gas"));
    if (j.contains("treasury")) entry.config.treasury = read_address(j.at("treasury"));
    if (j.contains("owner")) entry.config.owner = read_address(j.at("owner"));
    entry.config.protocol_fee = j.value("protocol_fee", 0u);

    for (const auto& route : j.value("chains", json::array())) {
        entry.config.chain_ids.push_back(route.at("chain_id").get<ChainId>());
        if (route.contains("domain_id")) {
            entry.config.domain_ids.push_back(route.at("domain_id").get<uint64_t>());
        }
    }
    if (!entry.config.domain_ids.empty() && entry.config.domain_ids.size() != entry.config.chain_ids.size()) {
        throw std::runtime_error("adapter " + entry.config.name + ": every chain needs a domain_id or none may");
    }
    return entry;
}

FeeScheduleConfig read_schedule(const json& j) {
    FeeScheduleConfig schedule;
    if (j.contains("treasury")) schedule.treasury = read_address(j.at("treasury"));
    schedule.fee_rate = read_rate(j.value("fee_rate", json(0)));

    for (const auto& premium : j.value("premiums", json::array())) {
        schedule.premiums[premium.at("chain_id").get<ChainId>()] = read_rate(premium.at("rate"));
    }

    for (const auto& tier : j.value("tiers", json::array())) {
        FeeTierEntry entry;
        entry.dest_chain_id = tier.at("dest_chain_id").get<ChainId>();
        for (const auto& t : tier.at("thresholds")) entry.thresholds.push_back(read_amount(t));
        for (const auto& r : tier.at("rates")) entry.rates.push_back(read_rate(r));
        if (entry.thresholds.size() != entry.rates.size() || entry.rates.size() > fees::MAX_FEE_TIERS) {
            throw std::runtime_error("tiers for chain " + std::to_string(entry.dest_chain_id) +
                                     ": thresholds and rates must pair up, at most 3");
        }
        schedule.tiers.push_back(std::move(entry));
    }
    return schedule;
}

} // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;
    try {
        const json root = json::parse(content);

        config.log_level = log::parse_level(root.value("log_level", std::string("info")));

        for (const auto& c : root.value("chains", json::array())) {
            config.chains.push_back(ChainEntry{c.at("name").get<std::string>(), c.at("chain_id").get<ChainId>()});
        }
        for (const auto& a : root.value("adapters", json::array())) {
            config.adapters.push_back(read_adapter(a));
        }
        if (root.contains("wrapper")) {
            config.wrapper = read_schedule(root.at("wrapper"));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw std::runtime_error(std::string("Config value out of range: ") + e.what());
    }

    if (config.wrapper.fee_rate > 0 && addresses::is_zero(config.wrapper.treasury)) {
        throw std::runtime_error("wrapper fee_rate is set but treasury is missing");
    }
    return config;
}

ChainId Config::chain_id(std::string_view name) const {
    for (const auto& c : chains) {
        if (c.name == name) return c.chain_id;
    }
    throw std::runtime_error("Unknown chain: " + std::string(name));
}

void Config::apply_fee_schedule(ControllerWrapper& wrapper, const Address& controller, const Address& manager) const {
    Chain& chain = wrapper.chain();
    chain.transact(manager, wrapper.address(), [&] {
        wrapper.set_fee_rate(this->wrapper.fee_rate);

        std::vector<ChainId> chain_ids;
        std::vector<uint32_t> rates;
        for (const auto& [chain_id, rate] : this->wrapper.premiums) {
            chain_ids.push_back(chain_id);
            rates.push_back(rate);
        }
        if (!chain_ids.empty()) wrapper.set_dest_chain_premium_rate(chain_ids, rates);

        for (const auto& tier : this->wrapper.tiers) {
            wrapper.set_controller_fee_tiers(controller, {tier.dest_chain_id}, tier.thresholds, tier.rates);
        }
    });
    XB_INFO("applied fee schedule: rate " << this->wrapper.fee_rate << ", " << this->wrapper.premiums.size()
            << " premiums, " << this->wrapper.tiers.size() << " tier sets");
}

} // namespace xbridge
