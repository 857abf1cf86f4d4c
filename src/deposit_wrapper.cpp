// =============================================================================
// deposit_wrapper.cpp - RelayWrapper / AcrossV4Wrapper Implementation
// =============================================================================

#include "xbridge/deposit_wrapper.hpp"
#include "xbridge/log.hpp"
#include "xbridge/token.hpp"

namespace xbridge {

// =============================================================================
// DepositWrapper
// =============================================================================

DepositWrapper::DepositWrapper(Chain& chain, const Address& owner, const Address& treasury, uint32_t fee_rate)
    : Contract(chain)
    , ownable_(*this, owner)
    , pausable_(*this)
    , state_(*this) {
    if (addresses::is_zero(treasury) && fee_rate > 0) revert(errors::TREASURY_ZERO_ADDRESS);
    if (fee_rate > fees::MAX_FEE_RATE) revert(errors::INVALID_FEE_RATE, std::to_string(fee_rate));

    state_->treasury = treasury;
    state_->fee_rate = fee_rate;
    emit("TreasurySet", {{"oldTreasury", addresses::to_hex(ZERO_ADDRESS)}, {"newTreasury", addresses::to_hex(treasury)}});
    emit("FeeRateSet", {{"oldRate", 0}, {"newRate", fee_rate}});
}

FeeQuote DepositWrapper::quote(U128 amount) const {
    const U128 fee = fee_math::proportional(amount, state_->fee_rate, fees::RATE_DENOMINATOR);
    return FeeQuote{fee, amount - fee};
}

U128 DepositWrapper::take_erc20(const Address& token, U128 amount, const Address& spender) {
    if (msg_value() != 0) revert(errors::MSG_VALUE_NOT_ZERO);
    if (amount == 0) revert(errors::AMOUNT_ZERO);
    pausable_.require_not_paused();

    const Address payer = msg_sender();
    auto& erc20 = chain().require_contract<ERC20>(token);
    const U128 before = erc20.balance_of(address());
    chain().call(address(), token, [&] { erc20.transfer_from(payer, address(), amount); });
    if (erc20.balance_of(address()) - before != amount) {
        revert(errors::FEE_ON_TRANSFER_TOKEN_NOT_SUPPORTED, addresses::to_hex(token));
    }

    const FeeQuote q = quote(amount);
    if (q.fee > 0) {
        const Address treasury = state_->treasury;
        chain().call(address(), token, [&] { erc20.transfer(treasury, q.fee); });
    }
    chain().call(address(), token, [&] { erc20.approve(spender, q.net); });
    return q.net;
}

U128 DepositWrapper::take_native() {
    const U128 amount = msg_value();
    if (amount == 0) revert(errors::AMOUNT_ZERO);
    pausable_.require_not_paused();

    const FeeQuote q = quote(amount);
    if (q.fee > 0 && !chain().try_transfer_value(address(), state_->treasury, q.fee)) {
        revert(errors::TRANSFER_FAILED, "fee to treasury");
    }
    return q.net;
}

void DepositWrapper::emit_sent(const Address& token, const char* ref_name, nlohmann::json ref, U128 net,
                               const Bytes& data) {
    emit("TransferSent", {
        {"sender", addresses::to_hex(msg_sender())},
        {"token", addresses::to_hex(token)},
        {ref_name, std::move(ref)},
        {"net", u128_to_string(net)},
        {"data", to_hex(data)},
    });
}

void DepositWrapper::set_treasury(const Address& treasury) {
    ownable_.only_owner();
    require(!addresses::is_zero(treasury), errors::ZERO_ADDRESS, "treasury");
    const Address old = state_->treasury;
    state_->treasury = treasury;
    emit("TreasurySet", {{"oldTreasury", addresses::to_hex(old)}, {"newTreasury", addresses::to_hex(treasury)}});
}

void DepositWrapper::set_fee_rate(uint32_t fee_rate) {
    ownable_.only_owner();
    if (fee_rate > fees::MAX_FEE_RATE) revert(errors::INVALID_FEE_RATE, std::to_string(fee_rate));
    if (fee_rate > 0 && addresses::is_zero(state_->treasury)) revert(errors::TREASURY_ZERO_ADDRESS);
    const uint32_t old = state_->fee_rate;
    state_->fee_rate = fee_rate;
    emit("FeeRateSet", {{"oldRate", old}, {"newRate", fee_rate}});
    XB_INFO("deposit wrapper fee rate " << old << " -> " << fee_rate);
}

void DepositWrapper::rescue_tokens(const Address& token, const Address& to, U128 amount) {
    ownable_.only_owner();
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "rescue recipient");
    auto& erc20 = chain().require_contract<ERC20>(token);
    chain().call(address(), token, [&] { erc20.transfer(to, amount); });
}

void DepositWrapper::rescue_eth(const Address& to, U128 amount) {
    ownable_.only_owner();
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "rescue recipient");
    if (!chain().try_transfer_value(address(), to, amount)) {
        revert(errors::TRANSFER_FAILED, "rescue to " + addresses::to_hex(to));
    }
}

void DepositWrapper::pause() {
    ownable_.only_owner();
    pausable_.pause();
}

void DepositWrapper::unpause() {
    ownable_.only_owner();
    pausable_.unpause();
}

// =============================================================================
// RelayWrapper
// =============================================================================

RelayWrapper::RelayWrapper(Chain& chain, const Address& depository, const Address& owner,
                           const Address& treasury, uint32_t fee_rate)
    : DepositWrapper(chain, owner, treasury, fee_rate)
    , depository_(depository) {
    require(!addresses::is_zero(depository), errors::RELAY_DEPOSITORY_ZERO_ADDRESS);
}

void RelayWrapper::deposit_erc20(const Address& token, U128 amount, const Bytes32& id, const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    const U128 net = take_erc20(token, amount, depository_);

    const Address depositor = msg_sender();
    auto& depository = chain().require_contract<IRelayDepository>(depository_);
    chain().call(address(), depository_, [&] { depository.deposit_erc20(depositor, token, net, id); });

    emit_sent(token, "id", to_hex(id), net, data);
    XB_DEBUG("relay deposit " << to_hex(id) << " net " << u128_to_string(net));
}

void RelayWrapper::deposit_native(const Bytes32& id, const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    const U128 net = take_native();

    const Address depositor = msg_sender();
    auto& depository = chain().require_contract<IRelayDepository>(depository_);
    chain().call(address(), depository_, net, [&] { depository.deposit_native(depositor, id); });

    emit_sent(ZERO_ADDRESS, "id", to_hex(id), net, data);
    XB_DEBUG("relay native deposit " << to_hex(id) << " net " << u128_to_string(net));
}

// =============================================================================
// AcrossV4Wrapper
// =============================================================================

AcrossV4Wrapper::AcrossV4Wrapper(Chain& chain, const Address& spoke_pool, const Address& owner,
                                 const Address& treasury, uint32_t fee_rate)
    : DepositWrapper(chain, owner, treasury, fee_rate)
    , spoke_pool_(spoke_pool) {
    require(!addresses::is_zero(spoke_pool), errors::SPOKE_POOL_ZERO_ADDRESS);
}

void AcrossV4Wrapper::deposit_erc20(AcrossDeposit params, const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    params.input_amount = take_erc20(params.input_token, params.input_amount, spoke_pool_);

    auto& pool = chain().require_contract<ISpokePool>(spoke_pool_);
    chain().call(address(), spoke_pool_, [&] { pool.deposit(params); });

    emit_sent(params.input_token, "destChainId", params.destination_chain_id, params.input_amount, data);
}

void AcrossV4Wrapper::deposit_native(AcrossDeposit params, const Bytes& data) {
    ReentrancyGuard guard(reentrancy_lock_);
    params.input_amount = take_native();

    auto& pool = chain().require_contract<ISpokePool>(spoke_pool_);
    chain().call(address(), spoke_pool_, params.input_amount, [&] { pool.deposit(params); });

    emit_sent(ZERO_ADDRESS, "destChainId", params.destination_chain_id, params.input_amount, data);
}

} // namespace xbridge
