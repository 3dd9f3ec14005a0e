// =============================================================================
// swap_math.cpp - Single swap step within constant liquidity
// =============================================================================

#include "rangepool/swap_math.hpp"
#include "rangepool/full_math.hpp"
#include "rangepool/sqrt_price_math.hpp"

namespace rangepool {
namespace swap_math {

SwapStep compute_swap_step(
    const U256& sqrt_price_current_x96,
    const U256& sqrt_price_target_x96,
    const U128& liquidity,
    const I256& amount_remaining,
    uint32_t fee_pips
) {
    using sqrt_price_math::get_amount0_delta;
    using sqrt_price_math::get_amount1_delta;

    const U256 fee_denominator = fees::FEE_DENOMINATOR;
    const U256 fee = fee_pips;

    bool zero_for_one = sqrt_price_current_x96 >= sqrt_price_target_x96;
    bool exact_in = amount_remaining >= 0;

    SwapStep step{sqrt_price_current_x96, 0, 0, 0};

    if (exact_in) {
        // Fee comes off the top; what is left moves the price
        U256 remaining = U256(amount_remaining);
        U256 remaining_less_fee = full_math::mul_div(remaining, fee_denominator - fee, fee_denominator);

        step.amount_in = zero_for_one
            ? get_amount0_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, true)
            : get_amount1_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, true);

        if (remaining_less_fee >= step.amount_in) {
            step.sqrt_price_next = sqrt_price_target_x96;
        } else {
            step.sqrt_price_next = sqrt_price_math::get_next_sqrt_price_from_input(
                sqrt_price_current_x96, liquidity, remaining_less_fee, zero_for_one);
        }
    } else {
        U256 wanted = U256(-amount_remaining);

        step.amount_out = zero_for_one
            ? get_amount1_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, false)
            : get_amount0_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, false);

        if (wanted >= step.amount_out) {
            step.sqrt_price_next = sqrt_price_target_x96;
        } else {
            step.sqrt_price_next = sqrt_price_math::get_next_sqrt_price_from_output(
                sqrt_price_current_x96, liquidity, wanted, zero_for_one);
        }
    }

    bool reached_target = step.sqrt_price_next == sqrt_price_target_x96;

    // Recompute whichever side was not fixed above from the final price
    if (zero_for_one) {
        if (!(reached_target && exact_in)) {
            step.amount_in = get_amount0_delta(step.sqrt_price_next, sqrt_price_current_x96, liquidity, true);
        }
        if (!(reached_target && !exact_in)) {
            step.amount_out = get_amount1_delta(step.sqrt_price_next, sqrt_price_current_x96, liquidity, false);
        }
    } else {
        if (!(reached_target && exact_in)) {
            step.amount_in = get_amount1_delta(sqrt_price_current_x96, step.sqrt_price_next, liquidity, true);
        }
        if (!(reached_target && !exact_in)) {
            step.amount_out = get_amount0_delta(sqrt_price_current_x96, step.sqrt_price_next, liquidity, false);
        }
    }

    // Never hand out more than was asked for
    if (!exact_in) {
        U256 wanted = U256(-amount_remaining);
        if (step.amount_out > wanted) {
            step.amount_out = wanted;
        }
    }

    if (exact_in && !reached_target) {
        // Stopped short of the target: the whole remainder beyond amount_in is fee
        step.fee_amount = U256(amount_remaining) - step.amount_in;
    } else {
        step.fee_amount = full_math::mul_div_rounding_up(step.amount_in, fee, fee_denominator - fee);
    }

    return step;
}

} // namespace swap_math
} // namespace rangepool
