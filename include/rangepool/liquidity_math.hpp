#ifndef RANGEPOOL_LIQUIDITY_MATH_HPP
#define RANGEPOOL_LIQUIDITY_MATH_HPP

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Liquidity Math Utilities
// =============================================================================

namespace liquidity_math {

// x + y; throws INSUFFICIENT_LIQUIDITY on underflow, ARITHMETIC_OVERFLOW past 128 bits
U128 add_delta(const U128& x, const I128& y);

// Largest liquidity that the given amounts can back over [a, b] at the
// current price (quoting helper, rounds down)
U128 get_liquidity_for_amounts(
    const U256& sqrt_price_x96,
    const U256& sqrt_price_a_x96,
    const U256& sqrt_price_b_x96,
    const U256& amount0,
    const U256& amount1
);

// Token amounts represented by `liquidity` over [a, b] at the current price,
// rounded down. RangePool computes mint amounts itself, rounding up.
TokenAmounts get_amounts_for_liquidity(
    const U256& sqrt_price_x96,
    const U256& sqrt_price_a_x96,
    const U256& sqrt_price_b_x96,
    const U128& liquidity
);

} // namespace liquidity_math

} // namespace rangepool

#endif // RANGEPOOL_LIQUIDITY_MATH_HPP
