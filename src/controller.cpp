// =============================================================================
// controller.cpp - AssetController Implementation
// =============================================================================

#include "xbridge/controller.hpp"
#include "xbridge/abi.hpp"
#include "xbridge/fee_collector.hpp"
#include "xbridge/hash.hpp"
#include "xbridge/log.hpp"
#include "xbridge/token.hpp"

#include <algorithm>
#include <limits>

namespace xbridge {

namespace {

// abi(bytes32 transfer_id, address recipient, uint256 amount, bool unwrap, uint256 threshold)
struct TransferPayload {
    Bytes32 transfer_id;
    Address recipient;
    U128 amount;
    bool unwrap;
    uint32_t threshold;
};

Bytes encode_payload(const Bytes32& transfer_id, const TransferRecord& record) {
    return abi::Encoder()
        .add_bytes32(transfer_id)
        .add_address(record.recipient)
        .add_uint(record.amount)
        .add_bool(record.unwrap)
        .add_uint(record.threshold)
        .finish();
}

TransferPayload decode_payload(const Bytes& data) {
    abi::Decoder dec(data);
    TransferPayload p;
    p.transfer_id = dec.read_bytes32();
    p.recipient = dec.read_address();
    p.amount = dec.read_uint();
    p.unwrap = dec.read_bool();
    const uint64_t threshold = dec.read_uint64();
    if (threshold == 0 || threshold > std::numeric_limits<uint32_t>::max()) {
        revert(errors::INVALID_PARAMS, "threshold " + std::to_string(threshold));
    }
    p.threshold = static_cast<uint32_t>(threshold);
    return p;
}

nlohmann::json transfer_created(const Bytes32& id, const TransferRecord& r, const Address& sender) {
    return {
        {"transferId", to_hex(id)},
        {"amount", u128_to_string(r.amount)},
        {"recipient", addresses::to_hex(r.recipient)},
        {"destChainId", r.dest_chain_id},
        {"sender", addresses::to_hex(sender)},
        {"threshold", r.threshold},
        {"unwrap", r.unwrap},
    };
}

} // namespace

AssetController::AssetController(Chain& chain, const ControllerConfig& config)
    : Contract(chain)
    , access_(*this)
    , pausable_(*this)
    , token_(config.token)
    , fee_collector_(config.fee_collector)
    , duration_(config.replenish_duration)
    , state_(*this) {
    require(!addresses::is_zero(config.token), errors::INVALID_PARAMS, "zero token");
    require(!addresses::is_zero(config.fee_collector), errors::INVALID_PARAMS, "zero fee collector");
    require(config.replenish_duration > 0, errors::INVALID_PARAMS, "zero duration");
    require(config.bridges.size() == config.minting_limits.size() &&
            config.bridges.size() == config.burning_limits.size(),
            errors::INVALID_PARAMS, "bridge/limit length mismatch");
    require(config.controller_chains.size() == config.controllers.size(), errors::INVALID_PARAMS,
            "controller length mismatch");

    access_.setup_role(Role::DefaultAdmin, config.admin);
    access_.setup_role(Role::Pauser, config.admin);
    access_.setup_role(Role::Pauser, config.pauser);

    state_->min_bridges = config.min_bridges;
    for (size_t i = 0; i < config.bridges.size(); ++i) {
        BridgeLimits& limits = state_->limits[config.bridges[i]];
        change_limit(limits.minting, config.minting_limits[i]);
        change_limit(limits.burning, config.burning_limits[i]);
    }
    for (const Address& adapter : config.multi_bridge_adapters) {
        state_->multi_bridge_adapters.insert(adapter);
    }
    for (size_t i = 0; i < config.controller_chains.size(); ++i) {
        state_->controllers[config.controller_chains[i]] = config.controllers[i];
    }
}

// =============================================================================
// Outbound
// =============================================================================

Bytes32 AssetController::transfer_to(const Address& recipient, U128 amount, bool unwrap, ChainId dest_chain_id,
                                     const Address& adapter, const Bytes& options) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();
    require_destination(dest_chain_id, amount);

    RateLimit& burning = state_->limits[adapter].burning;
    if (current_limit(burning) < amount) {
        revert(errors::NOT_HIGH_ENOUGH_LIMITS, "adapter " + addresses::to_hex(adapter));
    }
    use_limit(burning, amount);

    take_tokens(msg_sender(), amount);

    TransferRecord record{recipient, amount, unwrap, dest_chain_id, 1, false};
    Bytes32 transfer_id = create_transfer(record);
    relay(transfer_id, record, adapter, msg_value(), options);
    return transfer_id;
}

Bytes32 AssetController::transfer_to(const Address& recipient, U128 amount, bool unwrap, ChainId dest_chain_id,
                                     const std::vector<Address>& adapters, const std::vector<U128>& fees,
                                     const std::vector<Bytes>& options) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();
    require_destination(dest_chain_id, amount);
    if (adapters.size() < state_->min_bridges) {
        revert(errors::INVALID_PARAMS, "fewer adapters than min bridges");
    }
    check_multi_bridge(adapters, fees, options);

    RateLimit& burning = state_->limits[ZERO_ADDRESS].burning;
    if (current_limit(burning) < amount) {
        revert(errors::NOT_HIGH_ENOUGH_LIMITS, "multi-bridge limit");
    }
    use_limit(burning, amount);

    collect_multi_bridge_fee(msg_sender(), amount);
    take_tokens(msg_sender(), amount);

    TransferRecord record{recipient, amount, unwrap, dest_chain_id, state_->min_bridges, true};
    Bytes32 transfer_id = create_transfer(record);
    for (size_t i = 0; i < adapters.size(); ++i) {
        relay(transfer_id, record, adapters[i], fees[i], options[i]);
    }
    return transfer_id;
}

void AssetController::resend_transfer(const Bytes32& transfer_id, const Address& adapter, const Bytes& options) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();

    auto it = state_->relayed.find(transfer_id);
    if (it == state_->relayed.end()) revert(errors::UNKNOWN_TRANSFER, to_hex(transfer_id));
    const TransferRecord record = it->second;
    require(!record.multi_bridge, errors::INVALID_PARAMS, "multi-bridge transfer");
    if (burning_max_limit_of(adapter) == 0) {
        revert(errors::NOT_HIGH_ENOUGH_LIMITS, "adapter " + addresses::to_hex(adapter));
    }

    emit("TransferResent", {{"transferId", to_hex(transfer_id)}});
    relay(transfer_id, record, adapter, msg_value(), options);
}

void AssetController::resend_transfer(const Bytes32& transfer_id, const std::vector<Address>& adapters,
                                      const std::vector<U128>& fees, const std::vector<Bytes>& options) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();

    auto it = state_->relayed.find(transfer_id);
    if (it == state_->relayed.end()) revert(errors::UNKNOWN_TRANSFER, to_hex(transfer_id));
    const TransferRecord record = it->second;
    require(record.multi_bridge, errors::INVALID_PARAMS, "single-bridge transfer");
    check_multi_bridge(adapters, fees, options);

    emit("TransferResent", {{"transferId", to_hex(transfer_id)}});
    for (size_t i = 0; i < adapters.size(); ++i) {
        relay(transfer_id, record, adapters[i], fees[i], options[i]);
    }
}

Address AssetController::require_destination(ChainId dest_chain_id, U128 amount) const {
    require(amount > 0, errors::AMOUNT_ZERO);
    if (transfers_paused_to(dest_chain_id)) {
        revert(errors::TRANSFERS_PAUSED_TO_DESTINATION, std::to_string(dest_chain_id));
    }
    Address controller = controller_for_chain(dest_chain_id);
    if (addresses::is_zero(controller)) {
        revert(errors::CHAIN_NOT_SUPPORTED, std::to_string(dest_chain_id));
    }
    return controller;
}

void AssetController::check_multi_bridge(const std::vector<Address>& adapters, const std::vector<U128>& fees,
                                         const std::vector<Bytes>& options) const {
    if (state_->min_bridges == 0) revert(errors::MULTI_BRIDGE_TRANSFERS_DISABLED);
    require(adapters.size() == fees.size() && adapters.size() == options.size(), errors::INVALID_PARAMS,
            "adapter/fee/options length mismatch");

    U128 total = 0;
    for (U128 fee : fees) total += fee;
    if (total != msg_value()) {
        revert(errors::FEES_SUM_MISMATCH,
               "fees=" + u128_to_string(total) + " value=" + u128_to_string(msg_value()));
    }

    std::set<Address> seen;
    for (const Address& adapter : adapters) {
        if (!seen.insert(adapter).second) {
            revert(errors::DUPLICATE_ADAPTER, addresses::to_hex(adapter));
        }
        if (!is_multi_bridge_adapter(adapter)) {
            revert(errors::ADAPTER_NOT_SUPPORTED, addresses::to_hex(adapter));
        }
    }
}

Bytes32 AssetController::create_transfer(const TransferRecord& record) {
    Bytes32 transfer_id = calculate_transfer_id(record.dest_chain_id);
    state_->nonce += 1;
    state_->relayed[transfer_id] = record;
    emit("TransferCreated", transfer_created(transfer_id, record, msg_sender()));
    return transfer_id;
}

void AssetController::relay(const Bytes32& transfer_id, const TransferRecord& record, const Address& adapter,
                            U128 fee, const Bytes& options) {
    const Address destination = controller_for_chain(record.dest_chain_id);
    const Bytes payload = encode_payload(transfer_id, record);

    auto& bridge = chain().require_contract<IBaseAdapter>(adapter);
    chain().call(address(), adapter, fee, [&] {
        return bridge.relay_message(record.dest_chain_id, destination, options, payload);
    });

    emit("TransferRelayed", {{"transferId", to_hex(transfer_id)}, {"adapter", addresses::to_hex(adapter)}});
    XB_DEBUG("transfer " << to_hex(transfer_id) << " relayed via " << addresses::to_hex(adapter));
}

void AssetController::collect_multi_bridge_fee(const Address& payer, U128 amount) {
    auto& collector = chain().require_contract<FeeCollector>(fee_collector_);
    const U128 fee = collector.quote(amount);
    if (fee == 0) return;

    auto& erc20 = chain().require_contract<ERC20>(token_);
    chain().call(address(), token_, [&] { erc20.transfer_from(payer, address(), fee); });
    chain().call(address(), token_, [&] { erc20.approve(fee_collector_, fee); });
    chain().call(address(), fee_collector_, [&] { collector.collect(token_, amount); });
}

Bytes32 AssetController::calculate_transfer_id(ChainId dest_chain_id) const {
    return hash::sha3_256(abi::Encoder()
                              .add_uint(chain().id())
                              .add_address(address())
                              .add_uint(dest_chain_id)
                              .add_uint(state_->nonce)
                              .finish());
}

// =============================================================================
// Inbound
// =============================================================================

void AssetController::receive_message(const Bytes& message, ChainId origin_chain, const Address& origin_sender) {
    ReentrancyGuard guard(reentrancy_lock_);
    const Address adapter = msg_sender();

    Address expected = controller_for_chain(origin_chain);
    if (addresses::is_zero(expected) || expected != origin_sender) {
        revert(errors::INVALID_PARAMS, "unknown controller " + addresses::to_hex(origin_sender));
    }

    const TransferPayload p = decode_payload(message);
    auto [it, inserted] = state_->received.try_emplace(p.transfer_id);
    ReceivedTransfer& transfer = it->second;
    if (inserted) {
        transfer.recipient = p.recipient;
        transfer.amount = p.amount;
        transfer.unwrap = p.unwrap;
        transfer.origin_chain_id = origin_chain;
        transfer.threshold = p.threshold;
    }

    if (p.threshold == 1) {
        pausable_.require_not_paused();
        if (transfer.executed) revert(errors::TRANSFER_NOT_EXECUTABLE, to_hex(p.transfer_id));
        transfer.received += 1;
        emit("TransferReceived", {
            {"transferId", to_hex(p.transfer_id)},
            {"originChainId", origin_chain},
            {"adapter", addresses::to_hex(adapter)},
        });
        finish_transfer(p.transfer_id, transfer, adapter);
        return;
    }

    if (!is_multi_bridge_adapter(adapter)) {
        revert(errors::ADAPTER_NOT_SUPPORTED, addresses::to_hex(adapter));
    }
    if (!state_->deliveries.insert({p.transfer_id, adapter}).second) {
        revert(errors::TRANSFER_RESENT_BY_ADAPTER, addresses::to_hex(adapter));
    }
    transfer.received += 1;
    emit("TransferReceived", {
        {"transferId", to_hex(p.transfer_id)},
        {"originChainId", origin_chain},
        {"adapter", addresses::to_hex(adapter)},
    });
    if (transfer.received == transfer.threshold) {
        emit("TransferExecutable", {{"transferId", to_hex(p.transfer_id)}});
    }
    XB_DEBUG("transfer " << to_hex(p.transfer_id) << " receipt " << transfer.received << "/" << transfer.threshold);
}

void AssetController::execute(const Bytes32& transfer_id) {
    ReentrancyGuard guard(reentrancy_lock_);

    auto it = state_->received.find(transfer_id);
    if (it == state_->received.end()) revert(errors::UNKNOWN_TRANSFER, to_hex(transfer_id));
    pausable_.require_not_paused();

    ReceivedTransfer& transfer = it->second;
    if (transfer.received < transfer.threshold) {
        revert(errors::THRESHOLD_NOT_MET,
               std::to_string(transfer.received) + "/" + std::to_string(transfer.threshold));
    }
    if (transfer.executed) revert(errors::TRANSFER_NOT_EXECUTABLE, to_hex(transfer_id));

    finish_transfer(transfer_id, transfer, ZERO_ADDRESS);
}

void AssetController::finish_transfer(const Bytes32& transfer_id, ReceivedTransfer& transfer,
                                      const Address& limit_key) {
    RateLimit& minting = state_->limits[limit_key].minting;
    if (current_limit(minting) < transfer.amount) {
        revert(errors::NOT_HIGH_ENOUGH_LIMITS, "mint limit of " + addresses::to_hex(limit_key));
    }
    use_limit(minting, transfer.amount);
    transfer.executed = true;

    // Copy out: release_tokens calls other contracts
    const Address recipient = transfer.recipient;
    const U128 amount = transfer.amount;
    const bool unwrap = transfer.unwrap;
    release_tokens(recipient, amount, unwrap);

    emit("TransferExecuted", {{"transferId", to_hex(transfer_id)}});
    XB_DEBUG("transfer " << to_hex(transfer_id) << " executed for " << u128_to_string(amount));
}

// =============================================================================
// Token Effects
// =============================================================================

void AssetController::take_tokens(const Address& from, U128 amount) {
    auto& token = chain().require_contract<BridgeToken>(token_);
    try {
        chain().call(address(), token_, [&] { token.burn(from, amount); });
    } catch (const Revert& e) {
        revert(errors::TOKEN_BURN_FAILED, e.what());
    }
}

void AssetController::release_tokens(const Address& to, U128 amount, bool unwrap) {
    auto& token = chain().require_contract<BridgeToken>(token_);
    const Address lockbox = token.lockbox();

    if (!unwrap || !state_->allow_unwrapping || addresses::is_zero(lockbox)) {
        chain().call(address(), token_, [&] { token.mint(to, amount); });
        return;
    }

    auto& box = chain().require_contract<Lockbox>(lockbox);
    chain().call(address(), token_, [&] { token.mint(address(), amount); });
    chain().call(address(), token_, [&] { token.approve(lockbox, amount); });
    chain().call(address(), lockbox, [&] { box.withdraw_to(to, amount); });
}

// =============================================================================
// Rate Limits
// =============================================================================

U128 AssetController::current_limit(const RateLimit& limit) const {
    if (limit.current_limit == limit.max_limit) return limit.current_limit;
    const uint64_t now = block_timestamp();
    if (limit.timestamp + duration_ <= now) return limit.max_limit;

    const U128 replenished = limit.current_limit + limit.rate_per_second * (now - limit.timestamp);
    return std::min(replenished, limit.max_limit);
}

void AssetController::change_limit(RateLimit& limit, U128 new_max) {
    const U128 old_max = limit.max_limit;
    const U128 current = current_limit(limit);

    if (old_max > new_max) {
        const U128 difference = old_max - new_max;
        limit.current_limit = current > difference ? current - difference : 0;
    } else {
        limit.current_limit = current + (new_max - old_max);
    }
    limit.max_limit = new_max;
    limit.rate_per_second = new_max / duration_;
    limit.timestamp = block_timestamp();
}

void AssetController::use_limit(RateLimit& limit, U128 amount) {
    limit.current_limit = current_limit(limit) - amount;
    limit.timestamp = block_timestamp();
}

U128 AssetController::minting_max_limit_of(const Address& bridge) const {
    auto it = state_->limits.find(bridge);
    return it == state_->limits.end() ? 0 : it->second.minting.max_limit;
}

U128 AssetController::minting_current_limit_of(const Address& bridge) const {
    auto it = state_->limits.find(bridge);
    return it == state_->limits.end() ? 0 : current_limit(it->second.minting);
}

U128 AssetController::burning_max_limit_of(const Address& bridge) const {
    auto it = state_->limits.find(bridge);
    return it == state_->limits.end() ? 0 : it->second.burning.max_limit;
}

U128 AssetController::burning_current_limit_of(const Address& bridge) const {
    auto it = state_->limits.find(bridge);
    return it == state_->limits.end() ? 0 : current_limit(it->second.burning);
}

// =============================================================================
// Admin
// =============================================================================

void AssetController::set_controller_for_chain(const std::vector<ChainId>& chain_ids,
                                               const std::vector<Address>& controllers) {
    access_.only_role(Role::DefaultAdmin);
    require(chain_ids.size() == controllers.size(), errors::INVALID_PARAMS, "length mismatch");
    for (size_t i = 0; i < chain_ids.size(); ++i) {
        state_->controllers[chain_ids[i]] = controllers[i];
        emit("ControllerForChainSet", {
            {"controller", addresses::to_hex(controllers[i])},
            {"chainId", chain_ids[i]},
        });
    }
    XB_INFO("controller registered " << chain_ids.size() << " remote controllers");
}

void AssetController::set_min_bridges(uint32_t min_bridges) {
    access_.only_role(Role::DefaultAdmin);
    state_->min_bridges = min_bridges;
    emit("MinBridgesSet", {{"minBridges", min_bridges}});
}

void AssetController::set_limits(const Address& bridge, U128 minting_limit, U128 burning_limit) {
    access_.only_role(Role::DefaultAdmin);
    const U128 ceiling = U128_MAX / 2;
    if (minting_limit > ceiling || burning_limit > ceiling) {
        revert(errors::LIMITS_TOO_HIGH, addresses::to_hex(bridge));
    }

    BridgeLimits& limits = state_->limits[bridge];
    change_limit(limits.minting, minting_limit);
    change_limit(limits.burning, burning_limit);
    emit("BridgeLimitsSet", {
        {"mintingLimit", u128_to_string(minting_limit)},
        {"burningLimit", u128_to_string(burning_limit)},
        {"bridge", addresses::to_hex(bridge)},
    });
    XB_INFO("limits for " << addresses::to_hex(bridge) << " set to mint=" << u128_to_string(minting_limit)
            << " burn=" << u128_to_string(burning_limit));
}

void AssetController::set_multi_bridge_adapters(const std::vector<Address>& adapters,
                                                const std::vector<bool>& enabled) {
    access_.only_role(Role::DefaultAdmin);
    require(adapters.size() == enabled.size(), errors::INVALID_PARAMS, "length mismatch");
    for (size_t i = 0; i < adapters.size(); ++i) {
        if (enabled[i]) {
            state_->multi_bridge_adapters.insert(adapters[i]);
        } else {
            state_->multi_bridge_adapters.erase(adapters[i]);
        }
        emit("MultiBridgeAdapterSet", {{"adapter", addresses::to_hex(adapters[i])}, {"enabled", bool(enabled[i])}});
    }
}

void AssetController::set_token_unwrapping(bool allowed) {
    access_.only_role(Role::DefaultAdmin);
    state_->allow_unwrapping = allowed;
    emit("AllowTokenUnwrappingSet", {{"allowed", allowed}});
}

void AssetController::pause_transfers_to_chain(ChainId chain_id, bool paused) {
    access_.only_role(Role::DefaultAdmin);
    state_->paused_chains[chain_id] = paused;
    emit("TransfersPausedToChain", {{"chainId", chain_id}, {"paused", paused}});
    XB_INFO("transfers to chain " << chain_id << (paused ? " paused" : " resumed"));
}

void AssetController::withdraw() {
    access_.only_role(Role::DefaultAdmin);
    const U128 balance = self_balance();
    if (balance == 0) return;
    if (!chain().try_transfer_value(address(), msg_sender(), balance)) {
        revert(errors::TRANSFER_FAILED, "withdraw to " + addresses::to_hex(msg_sender()));
    }
}

void AssetController::pause() {
    access_.only_role(Role::Pauser);
    pausable_.pause();
}

void AssetController::unpause() {
    access_.only_role(Role::DefaultAdmin);
    pausable_.unpause();
}

// =============================================================================
// Views
// =============================================================================

Address AssetController::controller_for_chain(ChainId chain_id) const {
    auto it = state_->controllers.find(chain_id);
    return it == state_->controllers.end() ? ZERO_ADDRESS : it->second;
}

bool AssetController::is_multi_bridge_adapter(const Address& adapter) const {
    return state_->multi_bridge_adapters.count(adapter) > 0;
}

bool AssetController::transfers_paused_to(ChainId chain_id) const {
    auto it = state_->paused_chains.find(chain_id);
    return it != state_->paused_chains.end() && it->second;
}

std::optional<TransferRecord> AssetController::relayed_transfer(const Bytes32& transfer_id) const {
    auto it = state_->relayed.find(transfer_id);
    if (it == state_->relayed.end()) return std::nullopt;
    return it->second;
}

std::optional<ReceivedTransfer> AssetController::received_transfer(const Bytes32& transfer_id) const {
    auto it = state_->received.find(transfer_id);
    if (it == state_->received.end()) return std::nullopt;
    return it->second;
}

bool AssetController::delivered_by(const Bytes32& transfer_id, const Address& adapter) const {
    return state_->deliveries.count({transfer_id, adapter}) > 0;
}

} // namespace xbridge
