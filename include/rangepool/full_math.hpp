#ifndef RANGEPOOL_FULL_MATH_HPP
#define RANGEPOOL_FULL_MATH_HPP

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Full-Precision Multiply/Divide (512-bit intermediate)
// =============================================================================
//
// All functions throw PoolError(ARITHMETIC_OVERFLOW) when the denominator is
// zero or the result does not fit in 256 bits.

namespace full_math {

// floor(a * b / denominator)
U256 mul_div(const U256& a, const U256& b, const U256& denominator);

// ceil(a * b / denominator)
U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator);

// ceil(x / y)
U256 div_rounding_up(const U256& x, const U256& y);

// Checked narrowing to 128 bits
U128 to_u128(const U256& x);

} // namespace full_math

} // namespace rangepool

#endif // RANGEPOOL_FULL_MATH_HPP
