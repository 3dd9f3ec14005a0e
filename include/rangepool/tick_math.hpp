#ifndef RANGEPOOL_TICK_MATH_HPP
#define RANGEPOOL_TICK_MATH_HPP

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Tick Math Utilities
// =============================================================================
//
// Tick t corresponds to price 1.0001^t; prices are carried as
// sqrt(price) * 2^96 (Q64.96).

namespace tick_math {

// Minimum and maximum ticks
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// get_sqrt_ratio_at_tick(MIN_TICK) and get_sqrt_ratio_at_tick(MAX_TICK)
inline const U256 MIN_SQRT_RATIO = U256(4295128739ULL);
inline const U256 MAX_SQRT_RATIO = U256("1461446703485210103287273052203988822378723970342");

// Exact Q64.96 sqrt price at `tick`, rounded up.
// Throws PoolError(OUT_OF_BOUNDS) if |tick| > MAX_TICK.
U256 get_sqrt_ratio_at_tick(int32_t tick);

// Greatest tick whose sqrt ratio is <= sqrt_price_x96.
// Throws PoolError(OUT_OF_BOUNDS) outside [MIN_SQRT_RATIO, MAX_SQRT_RATIO).
int32_t get_tick_at_sqrt_ratio(const U256& sqrt_price_x96);

} // namespace tick_math

} // namespace rangepool

#endif // RANGEPOOL_TICK_MATH_HPP
