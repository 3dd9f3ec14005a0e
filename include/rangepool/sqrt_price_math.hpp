#ifndef RANGEPOOL_SQRT_PRICE_MATH_HPP
#define RANGEPOOL_SQRT_PRICE_MATH_HPP

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Sqrt Price Math
// =============================================================================
//
// Token amounts for a liquidity change between two Q64.96 prices, and the
// price reached after adding/removing an amount at fixed liquidity.
// Rounding always favours the pool: amounts paid in round up, amounts paid
// out round down, and next-price helpers never pass the true price.

namespace sqrt_price_math {

// Next price after `amount_in` enters the pool. zero_for_one = token0 in.
U256 get_next_sqrt_price_from_input(const U256& sqrt_price_x96, const U128& liquidity,
                                    const U256& amount_in, bool zero_for_one);

// Next price after `amount_out` leaves the pool. zero_for_one = token1 out.
U256 get_next_sqrt_price_from_output(const U256& sqrt_price_x96, const U128& liquidity,
                                     const U256& amount_out, bool zero_for_one);

// L * (b - a) / (a * b), bounds in either order
U256 get_amount0_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const U128& liquidity, bool round_up);

// L * (b - a) / Q96, bounds in either order
U256 get_amount1_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const U128& liquidity, bool round_up);

// Signed forms: positive liquidity_delta -> amount owed to the pool (rounded up),
// negative -> amount owed by the pool (rounded down, returned negative)
I256 get_amount0_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const I128& liquidity_delta);

I256 get_amount1_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const I128& liquidity_delta);

} // namespace sqrt_price_math

} // namespace rangepool

#endif // RANGEPOOL_SQRT_PRICE_MATH_HPP
