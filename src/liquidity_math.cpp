// =============================================================================
// liquidity_math.cpp - Checked liquidity arithmetic and quoting helpers
// =============================================================================

#include "rangepool/liquidity_math.hpp"
#include "rangepool/full_math.hpp"
#include "rangepool/sqrt_price_math.hpp"

#include <utility>

namespace rangepool {
namespace liquidity_math {

namespace {

std::pair<U256, U256> sorted(const U256& a, const U256& b) {
    if (a == b) {
        throw PoolError(ErrorCode::INVALID_TICK_RANGE, "liquidity_math: empty price range");
    }
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

// amount0 * (a * b / Q96) / (b - a)
U128 liquidity_for_amount0(const U256& a, const U256& b, const U256& amount0) {
    U256 intermediate = full_math::mul_div(a, b, Q96);
    return full_math::to_u128(full_math::mul_div(amount0, intermediate, b - a));
}

// amount1 * Q96 / (b - a)
U128 liquidity_for_amount1(const U256& a, const U256& b, const U256& amount1) {
    return full_math::to_u128(full_math::mul_div(amount1, Q96, b - a));
}

} // anonymous namespace

U128 add_delta(const U128& x, const I128& y) {
    if (y < 0) {
        U128 magnitude = U128(-y);
        if (magnitude > x) {
            throw PoolError(ErrorCode::INSUFFICIENT_LIQUIDITY,
                            "liquidity_math: liquidity " + x.str() + " cannot drop by " +
                            magnitude.str());
        }
        return x - magnitude;
    }

    U128 magnitude = U128(y);
    if (magnitude > U128_MAX - x) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW, "liquidity_math: liquidity overflow");
    }
    return x + magnitude;
}

U128 get_liquidity_for_amounts(
    const U256& sqrt_price_x96,
    const U256& sqrt_price_a_x96,
    const U256& sqrt_price_b_x96,
    const U256& amount0,
    const U256& amount1
) {
    auto [lower, upper] = sorted(sqrt_price_a_x96, sqrt_price_b_x96);

    if (sqrt_price_x96 <= lower) {
        // Below range: all token0
        return liquidity_for_amount0(lower, upper, amount0);
    } else if (sqrt_price_x96 < upper) {
        // In range: the scarcer side binds
        U128 liquidity0 = liquidity_for_amount0(sqrt_price_x96, upper, amount0);
        U128 liquidity1 = liquidity_for_amount1(lower, sqrt_price_x96, amount1);
        return liquidity0 < liquidity1 ? liquidity0 : liquidity1;
    } else {
        // Above range: all token1
        return liquidity_for_amount1(lower, upper, amount1);
    }
}

TokenAmounts get_amounts_for_liquidity(
    const U256& sqrt_price_x96,
    const U256& sqrt_price_a_x96,
    const U256& sqrt_price_b_x96,
    const U128& liquidity
) {
    auto [lower, upper] = sorted(sqrt_price_a_x96, sqrt_price_b_x96);

    TokenAmounts amounts{0, 0};
    if (sqrt_price_x96 <= lower) {
        amounts.amount0 = sqrt_price_math::get_amount0_delta(lower, upper, liquidity, false);
    } else if (sqrt_price_x96 < upper) {
        amounts.amount0 = sqrt_price_math::get_amount0_delta(sqrt_price_x96, upper, liquidity, false);
        amounts.amount1 = sqrt_price_math::get_amount1_delta(lower, sqrt_price_x96, liquidity, false);
    } else {
        amounts.amount1 = sqrt_price_math::get_amount1_delta(lower, upper, liquidity, false);
    }
    return amounts;
}

} // namespace liquidity_math
} // namespace rangepool
