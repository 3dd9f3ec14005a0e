// rangepool - Swap Step Tests

#include <catch2/catch_test_macros.hpp>
#include <rangepool/swap_math.hpp>
#include <rangepool/tick_math.hpp>

using namespace rangepool;
using namespace rangepool::swap_math;

TEST_CASE("Swap step exact input", "[swap_math]") {
    const U256 current = tick_math::get_sqrt_ratio_at_tick(0);
    const U256 target = tick_math::get_sqrt_ratio_at_tick(-100);
    const U128 liquidity = 1000000;

    SECTION("Large amount reaches the target") {
        SwapStep step = compute_swap_step(current, target, liquidity, I256(1000000000), fees::FEE_030);
        REQUIRE(step.sqrt_price_next == target);
        REQUIRE(step.amount_in == 5013);
        REQUIRE(step.amount_out == 4987);
        REQUIRE(step.fee_amount == 16);
    }

    SECTION("Small amount stops short and is fully consumed") {
        SwapStep step = compute_swap_step(current, target, liquidity, I256(500), fees::FEE_030);
        REQUIRE(step.sqrt_price_next > target);
        REQUIRE(step.sqrt_price_next < current);
        REQUIRE(step.amount_in == 498);
        REQUIRE(step.amount_out == 497);
        REQUIRE(step.fee_amount == 2);
        REQUIRE(step.amount_in + step.fee_amount == 500);
    }

    SECTION("One for zero never passes the target") {
        U256 up = tick_math::get_sqrt_ratio_at_tick(100);
        SwapStep step = compute_swap_step(current, up, liquidity, I256(500), fees::FEE_030);
        REQUIRE(step.sqrt_price_next > current);
        REQUIRE(step.sqrt_price_next < up);
        REQUIRE(step.amount_in + step.fee_amount == 500);
    }

    SECTION("Zero liquidity consumes nothing") {
        SwapStep step = compute_swap_step(current, target, U128(0), I256(500), fees::FEE_030);
        REQUIRE(step.sqrt_price_next == target);
        REQUIRE(step.amount_in == 0);
        REQUIRE(step.amount_out == 0);
        REQUIRE(step.fee_amount == 0);
    }

    SECTION("Zero fee") {
        SwapStep step = compute_swap_step(current, target, liquidity, I256(500), 0);
        REQUIRE(step.fee_amount == 0);
        REQUIRE(step.amount_in == 500);
    }
}

TEST_CASE("Swap step exact output", "[swap_math]") {
    const U256 current = tick_math::get_sqrt_ratio_at_tick(0);
    const U128 liquidity = 1000000;

    SECTION("Output is exactly what was asked for") {
        U256 target = tick_math::get_sqrt_ratio_at_tick(-100);
        SwapStep step = compute_swap_step(current, target, liquidity, I256(-300), fees::FEE_030);
        REQUIRE(step.amount_out == 300);
        REQUIRE(step.amount_in == 301);
        REQUIRE(step.fee_amount == 1);
        REQUIRE(step.sqrt_price_next > target);
    }

    SECTION("Oversized request is capped at the target") {
        U256 target = tick_math::get_sqrt_ratio_at_tick(100);
        SwapStep step = compute_swap_step(current, target, liquidity, I256(-1000000000), fees::FEE_030);
        REQUIRE(step.sqrt_price_next == target);
        REQUIRE(step.amount_out == 4987);
        REQUIRE(step.amount_in == 5013);
        REQUIRE(step.fee_amount == 16);
    }
}
