// =============================================================================
// wrapper.cpp - ControllerWrapper Implementation
// =============================================================================

#include "xbridge/wrapper.hpp"
#include "xbridge/controller.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

ControllerWrapper::ControllerWrapper(Chain& chain, const Address& admin, const Address& manager,
                                     const Address& treasury, uint32_t fee_rate,
                                     const std::vector<Address>& controllers,
                                     const std::vector<ChainId>& premium_chain_ids,
                                     const std::vector<uint32_t>& premium_rates)
    : Contract(chain)
    , access_(*this)
    , pausable_(*this)
    , state_(*this) {
    if (addresses::is_zero(treasury) && fee_rate > 0) revert(errors::TREASURY_ZERO_ADDRESS);
    if (fee_rate > fees::MAX_FEE_RATE) revert(errors::INVALID_FEE_RATE, std::to_string(fee_rate));

    access_.setup_role(Role::DefaultAdmin, admin);
    access_.setup_role(Role::Manager, manager);

    state_->treasury = treasury;
    state_->fee_rate = fee_rate;
    for (const Address& controller : controllers) {
        state_->controllers.insert(controller);
    }
    apply_premiums(premium_chain_ids, premium_rates);
}

// =============================================================================
// Quote
// =============================================================================

FeeQuote ControllerWrapper::quote(const Address& controller, ChainId dest_chain_id, U128 amount) const {
    FeeTierConfig config;
    auto it = state_->tiers.find({controller, dest_chain_id});
    if (it != state_->tiers.end()) config = it->second;
    return fee_math::tiered(config, state_->fee_rate, dest_chain_premium_rate(dest_chain_id), amount);
}

// =============================================================================
// Transfers
// =============================================================================

Bytes32 ControllerWrapper::transfer_to(const TransferParams& params, const Address& adapter,
                                       const Bytes& options, const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();

    const U128 net = handle_transfers(msg_sender(), params);
    auto& controller = chain().require_contract<IAssetController>(params.controller);
    Bytes32 transfer_id = chain().call(address(), params.controller, msg_value(), [&] {
        return controller.transfer_to(params.recipient, net, params.unwrap, params.dest_chain_id, adapter, options);
    });
    clear_approval(params);

    emit_sent(params.controller, false, false, params.amount, net, data);
    return transfer_id;
}

Bytes32 ControllerWrapper::transfer_to(const TransferParams& params, const std::vector<Address>& adapters,
                                       const std::vector<U128>& fees, const std::vector<Bytes>& options,
                                       const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();

    const U128 net = handle_transfers(msg_sender(), params);
    auto& controller = chain().require_contract<IAssetController>(params.controller);
    Bytes32 transfer_id = chain().call(address(), params.controller, msg_value(), [&] {
        return controller.transfer_to(params.recipient, net, params.unwrap, params.dest_chain_id,
                                      adapters, fees, options);
    });
    clear_approval(params);

    emit_sent(params.controller, false, true, params.amount, net, data);
    return transfer_id;
}

Bytes32 ControllerWrapper::transfer_to_with_permit(const TransferParams& params, const Permit& permit,
                                                   const Address& adapter, const Bytes& options,
                                                   const Bytes& data) {
    require_controller(params.controller);
    const Address owner = msg_sender();
    const Address token = chain().require_contract<IAssetController>(params.controller).token();
    auto& erc20 = chain().require_contract<ERC20>(token);
    chain().call(address(), token, [&] { erc20.permit(owner, address(), params.amount, permit); });

    return transfer_to(params, adapter, options, data);
}

Bytes32 ControllerWrapper::transfer_to_with_permit(const TransferParams& params, const Permit& permit,
                                                   const std::vector<Address>& adapters,
                                                   const std::vector<U128>& fees,
                                                   const std::vector<Bytes>& options, const Bytes& data) {
    require_controller(params.controller);
    const Address owner = msg_sender();
    const Address token = chain().require_contract<IAssetController>(params.controller).token();
    auto& erc20 = chain().require_contract<ERC20>(token);
    chain().call(address(), token, [&] { erc20.permit(owner, address(), params.amount, permit); });

    return transfer_to(params, adapters, fees, options, data);
}

void ControllerWrapper::resend_transfer(const Address& controller, const Bytes32& transfer_id,
                                        const Address& adapter, const Bytes& options, const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();
    require_controller(controller);

    auto& target = chain().require_contract<IAssetController>(controller);
    chain().call(address(), controller, msg_value(), [&] {
        target.resend_transfer(transfer_id, adapter, options);
    });
    emit_sent(controller, true, false, 0, 0, data);
}

void ControllerWrapper::resend_transfer(const Address& controller, const Bytes32& transfer_id,
                                        const std::vector<Address>& adapters, const std::vector<U128>& fees,
                                        const std::vector<Bytes>& options, const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    pausable_.require_not_paused();
    require_controller(controller);

    auto& target = chain().require_contract<IAssetController>(controller);
    chain().call(address(), controller, msg_value(), [&] {
        target.resend_transfer(transfer_id, adapters, fees, options);
    });
    emit_sent(controller, true, true, 0, 0, data);
}

U128 ControllerWrapper::handle_transfers(const Address& payer, const TransferParams& params) {
    require_controller(params.controller);

    const FeeQuote q = quote(params.controller, params.dest_chain_id, params.amount);
    const Address token = chain().require_contract<IAssetController>(params.controller).token();
    auto& erc20 = chain().require_contract<ERC20>(token);

    const U128 before = erc20.balance_of(address());
    chain().call(address(), token, [&] { erc20.transfer_from(payer, address(), params.amount); });
    const U128 received = erc20.balance_of(address()) - before;
    if (received != params.amount) {
        revert(errors::FEE_ON_TRANSFER_TOKEN_NOT_SUPPORTED,
               "requested=" + u128_to_string(params.amount) + " received=" + u128_to_string(received));
    }

    if (q.fee > 0) {
        const Address treasury = state_->treasury;
        chain().call(address(), token, [&] { erc20.transfer(treasury, q.fee); });
        emit("FeesCollected", {
            {"sender", addresses::to_hex(payer)},
            {"token", addresses::to_hex(token)},
            {"controller", addresses::to_hex(params.controller)},
            {"fee", u128_to_string(q.fee)},
            {"treasury", addresses::to_hex(treasury)},
        });
    }

    chain().call(address(), token, [&] { erc20.approve(params.controller, q.net); });
    XB_DEBUG("wrapper charged " << u128_to_string(q.fee) << " on " << u128_to_string(params.amount));
    return q.net;
}

void ControllerWrapper::clear_approval(const TransferParams& params) {
    const Address token = chain().require_contract<IAssetController>(params.controller).token();
    auto& erc20 = chain().require_contract<ERC20>(token);
    if (erc20.allowance(address(), params.controller) == 0) return;
    chain().call(address(), token, [&] { erc20.approve(params.controller, 0); });
}

void ControllerWrapper::emit_sent(const Address& controller, bool is_resend, bool is_multi, U128 amount,
                                  U128 net, const Bytes& data) {
    emit("TransferSent", {
        {"sender", addresses::to_hex(msg_sender())},
        {"controller", addresses::to_hex(controller)},
        {"isResend", is_resend},
        {"isMulti", is_multi},
        {"amount", u128_to_string(amount)},
        {"net", u128_to_string(net)},
        {"data", to_hex(data)},
    });
}

// =============================================================================
// Admin
// =============================================================================

void ControllerWrapper::only_admin_or_manager() const {
    const Address& caller = msg_sender();
    if (!access_.has_role(Role::DefaultAdmin, caller) && !access_.has_role(Role::Manager, caller)) {
        revert(errors::UNAUTHORIZED, addresses::to_hex(caller));
    }
}

void ControllerWrapper::require_controller(const Address& controller) const {
    if (!is_controller(controller)) {
        revert(errors::CONTROLLER_NOT_WHITELISTED, addresses::to_hex(controller));
    }
}

void ControllerWrapper::set_controllers(const std::vector<Address>& controllers,
                                        const std::vector<bool>& statuses) {
    only_admin_or_manager();
    if (controllers.size() != statuses.size()) revert(errors::LENGTH_MISMATCH);
    for (size_t i = 0; i < controllers.size(); ++i) {
        if (statuses[i]) {
            state_->controllers.insert(controllers[i]);
        } else {
            state_->controllers.erase(controllers[i]);
        }
        emit("ControllerSet", {{"controller", addresses::to_hex(controllers[i])}, {"status", bool(statuses[i])}});
    }
}

void ControllerWrapper::set_fee_rate(uint32_t fee_rate) {
    only_admin_or_manager();
    if (fee_rate > fees::MAX_FEE_RATE) revert(errors::INVALID_FEE_RATE, std::to_string(fee_rate));
    if (fee_rate > 0 && addresses::is_zero(state_->treasury)) revert(errors::TREASURY_ZERO_ADDRESS);

    const uint32_t old = state_->fee_rate;
    state_->fee_rate = fee_rate;
    emit("FeeRateSet", {{"oldRate", old}, {"newRate", fee_rate}});
    XB_INFO("wrapper fee rate " << old << " -> " << fee_rate);
}

void ControllerWrapper::set_dest_chain_premium_rate(const std::vector<ChainId>& chain_ids,
                                                    const std::vector<uint32_t>& rates) {
    only_admin_or_manager();
    apply_premiums(chain_ids, rates);
}

void ControllerWrapper::apply_premiums(const std::vector<ChainId>& chain_ids, const std::vector<uint32_t>& rates) {
    if (chain_ids.size() != rates.size()) revert(errors::LENGTH_MISMATCH);
    for (size_t i = 0; i < chain_ids.size(); ++i) {
        if (rates[i] > fees::MAX_FEE_RATE) revert(errors::INVALID_FEE_RATE, std::to_string(rates[i]));
        state_->premiums[chain_ids[i]] = rates[i];
        emit("DestChainPremiumSet", {{"chainId", chain_ids[i]}, {"rate", rates[i]}});
    }
}

void ControllerWrapper::set_controller_fee_tiers(const Address& controller,
                                                 const std::vector<ChainId>& dest_chain_ids,
                                                 const std::vector<U128>& thresholds,
                                                 const std::vector<uint32_t>& rates) {
    only_admin_or_manager();
    if (thresholds.size() != rates.size() || thresholds.size() > fees::MAX_FEE_TIERS) {
        revert(errors::LENGTH_MISMATCH, "tiers");
    }

    FeeTierConfig config;
    for (size_t i = 0; i < thresholds.size(); ++i) {
        if (rates[i] > fees::MAX_FEE_RATE) revert(errors::INVALID_FEE_RATE, std::to_string(rates[i]));
        if (i > 0 && (thresholds[i] == 0 || thresholds[i] <= thresholds[i - 1])) {
            revert(errors::INVALID_PARAMS, "thresholds must ascend");
        }
        config.tiers[i] = FeeTier{thresholds[i], rates[i]};
    }
    config.count = static_cast<uint8_t>(thresholds.size());

    nlohmann::json threshold_list = nlohmann::json::array();
    for (U128 t : thresholds) threshold_list.push_back(u128_to_string(t));

    for (ChainId dest : dest_chain_ids) {
        state_->tiers[{controller, dest}] = config;
        emit("ControllerFeeTiersSet", {
            {"controller", addresses::to_hex(controller)},
            {"destChainId", dest},
            {"thresholds", threshold_list},
            {"rates", rates},
        });
    }
    XB_INFO("fee tiers for " << addresses::to_hex(controller) << " set on " << dest_chain_ids.size() << " chains");
}

void ControllerWrapper::set_treasury(const Address& treasury) {
    access_.only_role(Role::DefaultAdmin);
    require(!addresses::is_zero(treasury), errors::ZERO_ADDRESS, "treasury");
    const Address old = state_->treasury;
    state_->treasury = treasury;
    emit("TreasurySet", {{"oldTreasury", addresses::to_hex(old)}, {"newTreasury", addresses::to_hex(treasury)}});
}

void ControllerWrapper::rescue_tokens(const Address& token, const Address& to, U128 amount) {
    access_.only_role(Role::DefaultAdmin);
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "rescue recipient");
    auto& erc20 = chain().require_contract<ERC20>(token);
    chain().call(address(), token, [&] { erc20.transfer(to, amount); });
}

void ControllerWrapper::rescue_eth(const Address& to, U128 amount) {
    access_.only_role(Role::DefaultAdmin);
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "rescue recipient");
    if (!chain().try_transfer_value(address(), to, amount)) {
        revert(errors::TRANSFER_FAILED, "rescue to " + addresses::to_hex(to));
    }
}

void ControllerWrapper::pause() {
    access_.only_role(Role::DefaultAdmin);
    pausable_.pause();
}

void ControllerWrapper::unpause() {
    access_.only_role(Role::DefaultAdmin);
    pausable_.unpause();
}

// =============================================================================
// Views
// =============================================================================

uint32_t ControllerWrapper::dest_chain_premium_rate(ChainId chain_id) const {
    auto it = state_->premiums.find(chain_id);
    return it == state_->premiums.end() ? 0 : it->second;
}

bool ControllerWrapper::is_controller(const Address& controller) const {
    return state_->controllers.count(controller) > 0;
}

FeeTierSchedule ControllerWrapper::get_controller_fee_tiers(const Address& controller, ChainId dest_chain_id) const {
    FeeTierSchedule out;
    auto it = state_->tiers.find({controller, dest_chain_id});
    if (it == state_->tiers.end()) return out;
    for (uint8_t i = 0; i < it->second.count; ++i) {
        out.thresholds.push_back(it->second.tiers[i].threshold);
        out.rates.push_back(it->second.tiers[i].rate);
    }
    return out;
}

} // namespace xbridge
