// =============================================================================
// adapter.cpp - BaseAdapter Implementation
// =============================================================================

#include "xbridge/adapter.hpp"
#include "xbridge/fee_math.hpp"
#include "xbridge/log.hpp"
#include <algorithm>

namespace xbridge {

AdapterConfig strip_domains(AdapterConfig config) {
    config.chain_ids.clear();
    config.domain_ids.clear();
    return config;
}

BaseAdapter::BaseAdapter(Chain& chain, const Address& bridge, const AdapterConfig& config, FeeModel model)
    : Contract(chain)
    , state_(*this)
    , access_(*this)
    , pausable_(*this)
    , bridge_(bridge)
    , name_(config.name)
    , fee_model_(model) {
    require(!addresses::is_zero(bridge), errors::INVALID_PARAMS, "zero bridge");
    require(config.chain_ids.size() == config.domain_ids.size(), errors::INVALID_PARAMS,
            "chain/domain length mismatch");
    require(config.protocol_fee <= fees::FEE_DECIMALS, errors::INVALID_PARAMS, "protocol fee too high");
    require(!addresses::is_zero(config.treasury), errors::INVALID_PARAMS, "zero treasury");
    require(!addresses::is_zero(config.owner), errors::INVALID_PARAMS, "zero owner");

    state_->min_gas = config.min_gas;
    state_->protocol_fee = config.protocol_fee;
    state_->fee_recipient = config.treasury;
    for (size_t i = 0; i < config.chain_ids.size(); ++i) {
        associate_domain(config.domain_ids[i], config.chain_ids[i]);
    }

    access_.setup_role(Role::DefaultAdmin, config.owner);
    access_.setup_role(Role::Pauser, config.owner);
}

// =============================================================================
// Outbound
// =============================================================================

Bytes32 BaseAdapter::relay_message(ChainId dest_chain_id, const Address& destination,
                                   const Bytes& options, const Bytes& message) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();

    if (!is_chain_id_supported(dest_chain_id)) {
        revert(errors::INVALID_PARAMS, "unsupported chain " + std::to_string(dest_chain_id));
    }
    Address trusted = trusted_adapter(dest_chain_id);
    if (addresses::is_zero(trusted)) {
        revert(errors::INVALID_PARAMS, "no trusted adapter for " + std::to_string(dest_chain_id));
    }

    const Address refund = refund_address(options);
    Outbound out{
        dest_chain_id,
        trusted,
        envelope::encode(BridgedMessage{message, msg_sender(), destination}),
        options,
    };

    Bytes32 transfer_id = ZERO_BYTES32;
    switch (fee_model_) {
        case FeeModel::Quoted:
            transfer_id = relay_quoted(out, refund, msg_value());
            break;
        case FeeModel::Unquoted:
            transfer_id = relay_unquoted(out, msg_value());
            break;
        case FeeModel::Flat:
            transfer_id = relay_flat(out, refund, msg_value());
            break;
    }

    XB_DEBUG(name_ << " relayed " << out.payload.size() << " bytes to chain " << dest_chain_id
             << " id " << to_hex(transfer_id));
    return transfer_id;
}

Bytes32 BaseAdapter::relay_quoted(const Outbound& out, const Address& refund, U128 value) {
    if (value < state_->min_gas) {
        revert(errors::VALUE_IS_LESS_THAN_LIMIT,
               u128_to_string(value) + " < " + u128_to_string(state_->min_gas));
    }
    U128 transport_fee = transport_quote(out);
    U128 protocol = calculate_fee(transport_fee);
    U128 required = transport_fee + protocol;
    if (value < required) {
        revert(errors::FEE_TOO_LOW,
               "required=" + u128_to_string(required) + " supplied=" + u128_to_string(value));
    }

    pay(state_->fee_recipient, protocol);
    pay(refund, value - required);
    return transport_send(out, transport_fee);
}

Bytes32 BaseAdapter::relay_unquoted(const Outbound& out, U128 value) {
    if (value < state_->min_gas) {
        revert(errors::VALUE_IS_LESS_THAN_LIMIT,
               u128_to_string(value) + " < " + u128_to_string(state_->min_gas));
    }
    U128 protocol = calculate_fee(value);
    pay(state_->fee_recipient, protocol);
    return transport_send(out, value - protocol);
}

Bytes32 BaseAdapter::relay_flat(const Outbound& out, const Address& refund, U128 value) {
    U128 remainder = deduct_fee(value);
    Bytes32 transfer_id = transport_send(out, 0);
    pay(refund, remainder);
    return transfer_id;
}

U128 BaseAdapter::quote_message(ChainId dest_chain_id, const Address& destination,
                                const Bytes& options, const Bytes& message,
                                bool include_fee) const {
    if (!is_chain_id_supported(dest_chain_id)) {
        revert(errors::INVALID_PARAMS, "unsupported chain " + std::to_string(dest_chain_id));
    }
    const U128 floor = state_->min_gas;

    switch (fee_model_) {
        case FeeModel::Quoted: {
            // origin_sender does not change the encoded size, so zero quotes the same
            Outbound out{
                dest_chain_id,
                trusted_adapter(dest_chain_id),
                envelope::encode(BridgedMessage{message, ZERO_ADDRESS, destination}),
                options,
            };
            U128 transport_fee = transport_quote(out);
            if (!include_fee) return transport_fee;
            return std::max(transport_fee + calculate_fee(transport_fee), floor);
        }
        case FeeModel::Unquoted:
            return include_fee ? floor + calculate_fee(floor) : floor;
        case FeeModel::Flat:
            return floor;
    }
    return floor;
}

U128 BaseAdapter::transport_quote(const Outbound&) const {
    return 0;
}

// =============================================================================
// Inbound
// =============================================================================

void BaseAdapter::only_bridge(int32_t error_code) const {
    if (msg_sender() != bridge_) {
        revert(error_code, "caller " + addresses::to_hex(msg_sender()) + " is not the bridge");
    }
}

void BaseAdapter::dispatch_inbound(ChainId origin_chain, const Address& origin_adapter, const Bytes& payload) {
    pausable_.require_not_paused();

    Address trusted = trusted_adapter(origin_chain);
    if (addresses::is_zero(trusted) || trusted != origin_adapter) {
        revert(errors::UNAUTHORISED,
               "origin " + addresses::to_hex(origin_adapter) + " on chain " + std::to_string(origin_chain));
    }

    BridgedMessage msg = envelope::decode(payload);
    auto& receiver = chain().require_contract<IMessageReceiver>(msg.destination);
    chain().call(address(), msg.destination, [&] {
        receiver.receive_message(msg.message, origin_chain, msg.origin_sender);
    });

    XB_DEBUG(name_ << " delivered message from chain " << origin_chain
             << " to " << addresses::to_hex(msg.destination));
}

// =============================================================================
// Fees
// =============================================================================

U128 BaseAdapter::calculate_fee(U128 amount) const {
    return fee_math::proportional(amount, state_->protocol_fee, fees::FEE_DECIMALS);
}

void BaseAdapter::pay(const Address& to, U128 amount) {
    if (amount == 0) return;
    if (!chain().try_transfer_value(address(), to, amount)) {
        revert(errors::FEE_TRANSFER_FAILED,
               u128_to_string(amount) + " to " + addresses::to_hex(to));
    }
}

U128 BaseAdapter::deduct_fee(U128 value) {
    const U128 fee = state_->min_gas;
    if (value < fee) {
        revert(errors::VALUE_IS_LESS_THAN_LIMIT,
               u128_to_string(value) + " < " + u128_to_string(fee));
    }
    pay(state_->fee_recipient, fee);
    return value - fee;
}

// =============================================================================
// Domains and Trust
// =============================================================================

bool BaseAdapter::is_chain_id_supported(ChainId chain_id) const {
    return domain_for_chain(chain_id).has_value();
}

std::vector<ChainId> BaseAdapter::supported_chain_ids() const {
    std::vector<ChainId> out;
    for (const auto& [chain_id, domain] : state_->chain_domains) {
        out.push_back(chain_id);
    }
    return out;
}

std::optional<ChainId> BaseAdapter::chain_for_domain(uint64_t domain_id) const {
    auto it = state_->domain_chains.find(domain_id);
    if (it == state_->domain_chains.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> BaseAdapter::domain_for_chain(ChainId chain_id) const {
    auto it = state_->chain_domains.find(chain_id);
    if (it == state_->chain_domains.end()) return std::nullopt;
    return it->second;
}

uint64_t BaseAdapter::require_domain(ChainId chain_id) const {
    auto domain = domain_for_chain(chain_id);
    if (!domain) {
        revert(errors::INVALID_PARAMS, "no domain for chain " + std::to_string(chain_id));
    }
    return *domain;
}

Address BaseAdapter::trusted_adapter(ChainId chain_id) const {
    auto it = state_->trusted_adapters.find(chain_id);
    return it == state_->trusted_adapters.end() ? ZERO_ADDRESS : it->second;
}

void BaseAdapter::associate_domain(uint64_t domain_id, ChainId chain_id) {
    state_->domain_chains[domain_id] = chain_id;
    state_->chain_domains[chain_id] = domain_id;
    emit("DomainIdAssociated", {{"chainId", chain_id}, {"domainId", domain_id}});
}

void BaseAdapter::set_chain_supported(ChainId chain_id, bool status) {
    if (status) {
        state_->domain_chains[chain_id] = chain_id;
        state_->chain_domains[chain_id] = chain_id;
    } else {
        state_->domain_chains.erase(chain_id);
        state_->chain_domains.erase(chain_id);
    }
    emit("ChainIdSet", {{"chainId", chain_id}, {"status", status}});
}

// =============================================================================
// Admin
// =============================================================================

void BaseAdapter::set_domain_id(const std::vector<uint64_t>& domain_ids, const std::vector<ChainId>& chain_ids) {
    access_.only_role(Role::DefaultAdmin);
    require(domain_ids.size() == chain_ids.size(), errors::INVALID_PARAMS, "length mismatch");
    for (size_t i = 0; i < domain_ids.size(); ++i) {
        associate_domain(domain_ids[i], chain_ids[i]);
    }
    XB_INFO(name_ << " associated " << domain_ids.size() << " domains");
}

void BaseAdapter::set_trusted_adapter(ChainId chain_id, const Address& adapter) {
    access_.only_role(Role::DefaultAdmin);
    state_->trusted_adapters[chain_id] = adapter;
    emit("TrustedAdapterSet", {{"chainId", chain_id}, {"adapter", addresses::to_hex(adapter)}});
    XB_INFO(name_ << " trusts " << addresses::to_hex(adapter) << " on chain " << chain_id);
}

void BaseAdapter::set_min_gas(U128 min_gas) {
    access_.only_role(Role::DefaultAdmin);
    state_->min_gas = min_gas;
    emit("MinGasSet", {{"minGas", u128_to_string(min_gas)}});
}

void BaseAdapter::set_protocol_fee(uint32_t protocol_fee, const Address& recipient) {
    access_.only_role(Role::DefaultAdmin);
    require(protocol_fee <= fees::FEE_DECIMALS, errors::INVALID_PARAMS, "protocol fee too high");
    require(!addresses::is_zero(recipient), errors::INVALID_PARAMS, "zero fee recipient");
    state_->protocol_fee = protocol_fee;
    state_->fee_recipient = recipient;
    emit("ProtocolFeeSet", {{"fee", protocol_fee}, {"recipient", addresses::to_hex(recipient)}});
}

void BaseAdapter::pause() {
    access_.only_role(Role::Pauser);
    pausable_.pause();
}

void BaseAdapter::unpause() {
    access_.only_role(Role::DefaultAdmin);
    pausable_.unpause();
}

} // namespace xbridge
