// =============================================================================
// axelar.cpp - Axelar General Message Passing Adapter
// =============================================================================

#include "xbridge/adapters/axelar.hpp"
#include "xbridge/hash.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

AxelarAdapter::AxelarAdapter(Chain& chain, const Address& gateway, const Address& gas_service,
                             const AdapterConfig& config, const std::vector<std::string>& domain_names)
    : BaseAdapter(chain, gateway, strip_domains(config), FeeModel::Unquoted)
    , gas_service_(gas_service)
    , names_(*this) {
    require(!addresses::is_zero(gas_service), errors::INVALID_PARAMS, "zero gas service");
    require(config.domain_ids.empty(), errors::INVALID_PARAMS, "axelar uses domain names");
    require(config.chain_ids.size() == domain_names.size(), errors::INVALID_PARAMS,
            "chain/domain length mismatch");
    for (size_t i = 0; i < domain_names.size(); ++i) {
        associate_name(domain_names[i], config.chain_ids[i]);
    }
}

// =============================================================================
// Outbound
// =============================================================================

Address AxelarAdapter::refund_address(const Bytes& options) const {
    return options::decode_refund(options).refund_address;
}

Bytes32 AxelarAdapter::transport_send(const Outbound& out, U128 fee) {
    const std::string destination_chain = *domain_name_for_chain(out.dest_chain_id);
    const std::string destination_address = addresses::to_hex(out.trusted_adapter);
    const Address refund = refund_address(out.options);

    auto& gas = chain().require_contract<IAxelarGasService>(gas_service_);
    chain().call(address(), gas_service_, fee, [&] {
        gas.pay_native_gas_for_contract_call(address(), destination_chain, destination_address,
                                             out.payload, refund);
    });

    auto& gw = chain().require_contract<IAxelarGateway>(gateway());
    chain().call(address(), gateway(), [&] {
        gw.call_contract(destination_chain, destination_address, out.payload);
    });

    return ZERO_BYTES32;
}

// =============================================================================
// Inbound
// =============================================================================

void AxelarAdapter::execute(const Bytes32& command_id, const std::string& source_chain,
                            const std::string& source_address, const Bytes& payload) {
    ReentrancyGuard guard(reentrancy_lock_);

    if (is_command_processed(command_id)) {
        revert(errors::ALREADY_PROCESSED, to_hex(command_id));
    }

    auto& gw = chain().require_contract<IAxelarGateway>(gateway());
    bool approved = chain().call(address(), gateway(), [&] {
        return gw.validate_contract_call(command_id, source_chain, source_address, hash::sha3_256(payload));
    });
    if (!approved) {
        revert(errors::NOT_APPROVED_BY_GATEWAY, to_hex(command_id));
    }
    names_->processed.insert(command_id);

    Address origin_adapter;
    try {
        origin_adapter = addresses::from_hex(source_address);
    } catch (const std::invalid_argument& e) {
        revert(errors::UNAUTHORISED, e.what());
    }

    // Unknown source names map to chain 0, which never has a trusted adapter
    ChainId origin_chain = chain_for_domain_name(source_chain).value_or(0);
    dispatch_inbound(origin_chain, origin_adapter, payload);
}

// =============================================================================
// Domain Names
// =============================================================================

void AxelarAdapter::associate_name(const std::string& name, ChainId chain_id) {
    names_->name_chains[name] = chain_id;
    names_->chain_names[chain_id] = name;
    emit("DomainIdAssociated", {{"chainId", chain_id}, {"domainId", name}});
}

void AxelarAdapter::set_domain_id(const std::vector<std::string>& domain_names,
                                  const std::vector<ChainId>& chain_ids) {
    access_.only_role(Role::DefaultAdmin);
    require(domain_names.size() == chain_ids.size(), errors::INVALID_PARAMS, "length mismatch");
    for (size_t i = 0; i < domain_names.size(); ++i) {
        associate_name(domain_names[i], chain_ids[i]);
    }
    XB_INFO(adapter_name() << " associated " << domain_names.size() << " domain names");
}

bool AxelarAdapter::is_chain_id_supported(ChainId chain_id) const {
    return names_->chain_names.count(chain_id) > 0;
}

std::vector<ChainId> AxelarAdapter::supported_chain_ids() const {
    std::vector<ChainId> out;
    for (const auto& [chain_id, name] : names_->chain_names) {
        out.push_back(chain_id);
    }
    return out;
}

std::optional<std::string> AxelarAdapter::domain_name_for_chain(ChainId chain_id) const {
    auto it = names_->chain_names.find(chain_id);
    if (it == names_->chain_names.end()) return std::nullopt;
    return it->second;
}

std::optional<ChainId> AxelarAdapter::chain_for_domain_name(const std::string& name) const {
    auto it = names_->name_chains.find(name);
    if (it == names_->name_chains.end()) return std::nullopt;
    return it->second;
}

bool AxelarAdapter::is_command_processed(const Bytes32& command_id) const {
    return names_->processed.count(command_id) > 0;
}

} // namespace xbridge
