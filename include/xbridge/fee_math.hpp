#ifndef XBRIDGE_FEE_MATH_HPP
#define XBRIDGE_FEE_MATH_HPP

#include <array>

#include "types.hpp"

namespace xbridge {

// =============================================================================
// Fee Tiers
// =============================================================================

struct FeeTier {
    U128 threshold;     // upper bound of this tier's slice (ignored for the last tier)
    uint32_t rate;      // units of RATE_DENOMINATOR
};

struct FeeTierConfig {
    std::array<FeeTier, fees::MAX_FEE_TIERS> tiers{};
    uint8_t count = 0;
};

struct FeeQuote {
    U128 fee;
    U128 net;
};

namespace fee_math {

// amount * rate / denominator, truncated; exact for any U128 amount
U128 proportional(U128 amount, uint32_t rate, uint32_t denominator);

// Walks the tiers (flat rate when none are set) and adds the destination premium on top
FeeQuote tiered(const FeeTierConfig& config, uint32_t flat_rate, uint32_t premium_rate, U128 amount);

} // namespace fee_math

} // namespace xbridge

#endif // XBRIDGE_FEE_MATH_HPP
