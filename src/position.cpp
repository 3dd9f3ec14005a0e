// =============================================================================
// position.cpp - Per-owner fee settlement and collection
// =============================================================================

#include "rangepool/position.hpp"
#include "rangepool/full_math.hpp"
#include "rangepool/liquidity_math.hpp"

namespace rangepool {
namespace position {

namespace {

U128 accrued(const U256& inside_now, const U256& inside_last, const U128& liquidity) {
    if (inside_now < inside_last) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW,
                        "position: fee growth went backwards");
    }
    return full_math::to_u128(full_math::mul_div(inside_now - inside_last, U256(liquidity), Q128));
}

U128 checked_add(const U128& a, const U128& b) {
    if (b > U128_MAX - a) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW, "position: tokens owed overflow");
    }
    return a + b;
}

} // anonymous namespace

void settle(PositionInfo& pos, const I128& liquidity_delta, const FeeGrowthInside& inside) {
    // Compute everything first so a failure leaves the position untouched
    U128 liquidity_next = liquidity_math::add_delta(pos.liquidity, liquidity_delta);

    U128 owed0 = accrued(inside.fee_growth0_x128, pos.fee_growth_inside0_last_x128, pos.liquidity);
    U128 owed1 = accrued(inside.fee_growth1_x128, pos.fee_growth_inside1_last_x128, pos.liquidity);
    U128 tokens_owed0 = checked_add(pos.tokens_owed0, owed0);
    U128 tokens_owed1 = checked_add(pos.tokens_owed1, owed1);

    pos.liquidity = liquidity_next;
    pos.fee_growth_inside0_last_x128 = inside.fee_growth0_x128;
    pos.fee_growth_inside1_last_x128 = inside.fee_growth1_x128;
    pos.tokens_owed0 = tokens_owed0;
    pos.tokens_owed1 = tokens_owed1;
}

TokenAmounts collect(PositionInfo& pos, const U128& requested0, const U128& requested1) {
    U128 amount0 = requested0 > pos.tokens_owed0 ? pos.tokens_owed0 : requested0;
    U128 amount1 = requested1 > pos.tokens_owed1 ? pos.tokens_owed1 : requested1;

    pos.tokens_owed0 -= amount0;
    pos.tokens_owed1 -= amount1;

    return {U256(amount0), U256(amount1)};
}

} // namespace position
} // namespace rangepool
