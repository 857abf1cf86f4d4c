// =============================================================================
// fee_math.cpp - Proportional and Tiered Fee Arithmetic
// =============================================================================

#include "xbridge/fee_math.hpp"
#include <algorithm>

namespace xbridge {
namespace fee_math {

U128 proportional(U128 amount, uint32_t rate, uint32_t denominator) {
    if (rate == 0 || amount == 0) return 0;
    // Split to keep amount * rate inside 128 bits
    U128 whole = amount / denominator;
    U128 rest = amount % denominator;
    return whole * rate + rest * rate / denominator;
}

FeeQuote tiered(const FeeTierConfig& config, uint32_t flat_rate, uint32_t premium_rate, U128 amount) {
    U128 fee = 0;

    if (config.count == 0) {
        fee = proportional(amount, flat_rate, fees::RATE_DENOMINATOR);
    } else {
        U128 remaining = amount;
        U128 previous = 0;
        for (uint8_t i = 0; i < config.count && remaining > 0; ++i) {
            const FeeTier& tier = config.tiers[i];
            U128 slice = remaining;
            if (i + 1 < config.count) {
                U128 width = tier.threshold > previous ? tier.threshold - previous : 0;
                slice = std::min(remaining, width);
                previous = tier.threshold;
            }
            fee += proportional(slice, tier.rate, fees::RATE_DENOMINATOR);
            remaining -= slice;
        }
    }

    fee += proportional(amount, premium_rate, fees::RATE_DENOMINATOR);
    if (fee > amount) fee = amount;
    return FeeQuote{fee, amount - fee};
}

} // namespace fee_math
} // namespace xbridge
