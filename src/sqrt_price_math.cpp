// =============================================================================
// sqrt_price_math.cpp - Amount deltas and next-price computation
// =============================================================================

#include "rangepool/sqrt_price_math.hpp"
#include "rangepool/full_math.hpp"

namespace rangepool {
namespace sqrt_price_math {

namespace {

const U512 U160_MAX_WIDE = U512(U160_MAX);

U512 ceil_div(const U512& x, const U512& y) {
    U512 q = x / y;
    if (x % y != 0) q += 1;
    return q;
}

U256 checked_price(const U512& price) {
    if (price > U160_MAX_WIDE) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW,
                        "sqrt_price_math: price exceeds 160 bits");
    }
    return U256(price);
}

// Price moves down when token0 is added and up when it is removed; the
// result is rounded up in both cases so the move is never overstated.
U256 get_next_sqrt_price_from_amount0_rounding_up(const U256& sqrt_price_x96,
                                                  const U128& liquidity,
                                                  const U256& amount, bool add) {
    if (amount == 0) return sqrt_price_x96;

    U512 numerator1 = U512(U256(liquidity)) << 96;
    U512 product = U512(amount) * U512(sqrt_price_x96);
    U512 numerator = numerator1 * U512(sqrt_price_x96);

    if (add) {
        return checked_price(ceil_div(numerator, numerator1 + product));
    }

    if (product >= numerator1) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW,
                        "sqrt_price_math: token0 out exceeds virtual reserve");
    }
    return checked_price(ceil_div(numerator, numerator1 - product));
}

// Price moves up when token1 is added and down when it is removed; the
// result is rounded down in both cases.
U256 get_next_sqrt_price_from_amount1_rounding_down(const U256& sqrt_price_x96,
                                                    const U128& liquidity,
                                                    const U256& amount, bool add) {
    U512 shifted = U512(amount) << 96;
    U512 wide_liquidity = U512(U256(liquidity));

    if (add) {
        U512 quotient = shifted / wide_liquidity;
        return checked_price(U512(sqrt_price_x96) + quotient);
    }

    U512 quotient = ceil_div(shifted, wide_liquidity);
    if (U512(sqrt_price_x96) <= quotient) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW,
                        "sqrt_price_math: token1 out exceeds virtual reserve");
    }
    return U256(U512(sqrt_price_x96) - quotient);
}

void require_price_and_liquidity(const U256& sqrt_price_x96, const U128& liquidity) {
    if (sqrt_price_x96 == 0) {
        throw PoolError(ErrorCode::OUT_OF_BOUNDS, "sqrt_price_math: zero price");
    }
    if (liquidity == 0) {
        throw PoolError(ErrorCode::INSUFFICIENT_LIQUIDITY, "sqrt_price_math: zero liquidity");
    }
}

} // anonymous namespace

U256 get_next_sqrt_price_from_input(const U256& sqrt_price_x96, const U128& liquidity,
                                    const U256& amount_in, bool zero_for_one) {
    require_price_and_liquidity(sqrt_price_x96, liquidity);

    // Round so the target price is not passed
    return zero_for_one
        ? get_next_sqrt_price_from_amount0_rounding_up(sqrt_price_x96, liquidity, amount_in, true)
        : get_next_sqrt_price_from_amount1_rounding_down(sqrt_price_x96, liquidity, amount_in, true);
}

U256 get_next_sqrt_price_from_output(const U256& sqrt_price_x96, const U128& liquidity,
                                     const U256& amount_out, bool zero_for_one) {
    require_price_and_liquidity(sqrt_price_x96, liquidity);

    // Round so the target price is reached
    return zero_for_one
        ? get_next_sqrt_price_from_amount1_rounding_down(sqrt_price_x96, liquidity, amount_out, false)
        : get_next_sqrt_price_from_amount0_rounding_up(sqrt_price_x96, liquidity, amount_out, false);
}

U256 get_amount0_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const U128& liquidity, bool round_up) {
    const U256& lower = sqrt_ratio_a_x96 < sqrt_ratio_b_x96 ? sqrt_ratio_a_x96 : sqrt_ratio_b_x96;
    const U256& upper = sqrt_ratio_a_x96 < sqrt_ratio_b_x96 ? sqrt_ratio_b_x96 : sqrt_ratio_a_x96;

    if (lower == 0) {
        throw PoolError(ErrorCode::OUT_OF_BOUNDS, "sqrt_price_math: zero price bound");
    }

    U256 numerator1 = U256(liquidity) << 96;
    U256 numerator2 = upper - lower;

    if (round_up) {
        return full_math::div_rounding_up(
            full_math::mul_div_rounding_up(numerator1, numerator2, upper), lower);
    }
    return full_math::mul_div(numerator1, numerator2, upper) / lower;
}

U256 get_amount1_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const U128& liquidity, bool round_up) {
    const U256& lower = sqrt_ratio_a_x96 < sqrt_ratio_b_x96 ? sqrt_ratio_a_x96 : sqrt_ratio_b_x96;
    const U256& upper = sqrt_ratio_a_x96 < sqrt_ratio_b_x96 ? sqrt_ratio_b_x96 : sqrt_ratio_a_x96;

    return round_up
        ? full_math::mul_div_rounding_up(U256(liquidity), upper - lower, Q96)
        : full_math::mul_div(U256(liquidity), upper - lower, Q96);
}

I256 get_amount0_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const I128& liquidity_delta) {
    if (liquidity_delta < 0) {
        U128 magnitude = U128(-liquidity_delta);
        return -I256(get_amount0_delta(sqrt_ratio_a_x96, sqrt_ratio_b_x96, magnitude, false));
    }
    U128 magnitude = U128(liquidity_delta);
    return I256(get_amount0_delta(sqrt_ratio_a_x96, sqrt_ratio_b_x96, magnitude, true));
}

I256 get_amount1_delta(const U256& sqrt_ratio_a_x96, const U256& sqrt_ratio_b_x96,
                       const I128& liquidity_delta) {
    if (liquidity_delta < 0) {
        U128 magnitude = U128(-liquidity_delta);
        return -I256(get_amount1_delta(sqrt_ratio_a_x96, sqrt_ratio_b_x96, magnitude, false));
    }
    U128 magnitude = U128(liquidity_delta);
    return I256(get_amount1_delta(sqrt_ratio_a_x96, sqrt_ratio_b_x96, magnitude, true));
}

} // namespace sqrt_price_math
} // namespace rangepool
