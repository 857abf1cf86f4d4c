// =============================================================================
// fee_collector.cpp - FeeCollector Implementation
// =============================================================================

#include "xbridge/fee_collector.hpp"
#include "xbridge/fee_math.hpp"
#include "xbridge/log.hpp"
#include "xbridge/token.hpp"

namespace xbridge {

FeeCollector::FeeCollector(Chain& chain, uint32_t fee_bps, const Address& treasury, const Address& owner)
    : Contract(chain)
    , ownable_(*this, owner)
    , fee_bps_(*this, fee_bps)
    , treasury_(*this, treasury) {
    if (fee_bps > fees::MAX_FEE_BPS) {
        revert(errors::FEE_EXCEEDS_MAX_BPS, std::to_string(fee_bps));
    }
    require(!addresses::is_zero(treasury), errors::TREASURY_ZERO_ADDRESS);
}

U128 FeeCollector::quote(U128 amount) const {
    return fee_math::proportional(amount, *fee_bps_, fees::FEE_DECIMALS);
}

void FeeCollector::collect(const Address& token, U128 amount) {
    U128 fee = quote(amount);
    if (fee == 0) return;

    const Address payer = msg_sender();
    auto& erc20 = chain().require_contract<ERC20>(token);
    chain().call(address(), token, [&] {
        erc20.transfer_from(payer, *treasury_, fee);
    });

    emit("FeesCollected", {
        {"payer", addresses::to_hex(payer)},
        {"token", addresses::to_hex(token)},
        {"amount", u128_to_string(fee)},
    });
    XB_DEBUG("collected " << u128_to_string(fee) << " fee from " << addresses::to_hex(payer));
}

void FeeCollector::set_fee_bps(uint32_t fee_bps) {
    ownable_.only_owner();
    if (fee_bps > fees::MAX_FEE_BPS) {
        revert(errors::FEE_EXCEEDS_MAX_BPS, std::to_string(fee_bps));
    }
    *fee_bps_ = fee_bps;
    emit("FeeBpsSet", {{"feeBps", fee_bps}});
    XB_INFO("fee collector rate set to " << fee_bps);
}

void FeeCollector::set_treasury(const Address& treasury) {
    ownable_.only_owner();
    require(!addresses::is_zero(treasury), errors::TREASURY_ZERO_ADDRESS);
    *treasury_ = treasury;
    emit("TreasurySet", {{"treasury", addresses::to_hex(treasury)}});
}

} // namespace xbridge
