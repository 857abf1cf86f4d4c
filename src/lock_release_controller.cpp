// =============================================================================
// lock_release_controller.cpp - Lock/Release Pool Controller
// =============================================================================

#include "xbridge/controller.hpp"
#include "xbridge/log.hpp"
#include "xbridge/token.hpp"

namespace xbridge {

LockReleaseAssetController::LockReleaseAssetController(Chain& chain, const ControllerConfig& config)
    : AssetController(chain, config) {}

void LockReleaseAssetController::take_tokens(const Address& from, U128 amount) {
    auto& erc20 = chain().require_contract<ERC20>(token());
    chain().call(address(), token(), [&] { erc20.transfer_from(from, address(), amount); });
    emit("LiquidityAdded", {{"amount", u128_to_string(amount)}});
}

void LockReleaseAssetController::release_tokens(const Address& to, U128 amount, bool) {
    auto& erc20 = chain().require_contract<ERC20>(token());
    const U128 pool = erc20.balance_of(address());
    if (pool < amount) {
        revert(errors::NOT_ENOUGH_TOKENS_IN_POOL,
               "pool=" + u128_to_string(pool) + " needed=" + u128_to_string(amount));
    }
    chain().call(address(), token(), [&] { erc20.transfer(to, amount); });
    emit("LiquidityRemoved", {{"amount", u128_to_string(amount)}});
}

void LockReleaseAssetController::set_token_unwrapping(bool) {
    access_.only_role(Role::DefaultAdmin);
    revert(errors::UNWRAPPING_NOT_SUPPORTED);
}

void LockReleaseAssetController::rescue_tokens(const Address& token, const Address& to, U128 amount) {
    access_.only_role(Role::DefaultAdmin);
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "rescue recipient");
    auto& erc20 = chain().require_contract<ERC20>(token);
    chain().call(address(), token, [&] { erc20.transfer(to, amount); });
    XB_INFO("rescued " << u128_to_string(amount) << " of " << addresses::to_hex(token));
}

void LockReleaseAssetController::rescue_eth(const Address& to, U128 amount) {
    access_.only_role(Role::DefaultAdmin);
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "rescue recipient");
    if (!chain().try_transfer_value(address(), to, amount)) {
        revert(errors::TRANSFER_FAILED, "rescue to " + addresses::to_hex(to));
    }
}

} // namespace xbridge
