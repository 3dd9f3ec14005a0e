#ifndef RANGEPOOL_SWAP_MATH_HPP
#define RANGEPOOL_SWAP_MATH_HPP

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Swap Step Computation
// =============================================================================

namespace swap_math {

struct SwapStep {
    U256 sqrt_price_next;   // Never past the target in the direction of travel
    U256 amount_in;         // Excludes fee
    U256 amount_out;
    U256 fee_amount;        // Charged in the input token
};

// One step of a swap within a price interval of constant liquidity.
// Direction is implied: target below current = token0 in (zero_for_one).
// amount_remaining > 0 is exact input remaining, < 0 exact output remaining.
// fee_pips is in hundredths of a bip (denominator 1e6).
SwapStep compute_swap_step(
    const U256& sqrt_price_current_x96,
    const U256& sqrt_price_target_x96,
    const U128& liquidity,
    const I256& amount_remaining,
    uint32_t fee_pips
);

} // namespace swap_math

} // namespace rangepool

#endif // RANGEPOOL_SWAP_MATH_HPP
