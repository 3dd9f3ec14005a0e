// rangepool - Tick Math Tests

#include <catch2/catch_test_macros.hpp>
#include <rangepool/tick_math.hpp>

using namespace rangepool;
using namespace rangepool::tick_math;

TEST_CASE("Sqrt ratio at tick", "[tick_math]") {
    SECTION("Tick zero is price one") {
        REQUIRE(get_sqrt_ratio_at_tick(0) == Q96);
    }

    SECTION("Neighbouring ticks") {
        REQUIRE(get_sqrt_ratio_at_tick(1) == U256("79232123823359799118286999568"));
        REQUIRE(get_sqrt_ratio_at_tick(-1) == U256("79224201403219477170569942574"));
        REQUIRE(get_sqrt_ratio_at_tick(100) == U256("79625275426524748796330556128"));
        REQUIRE(get_sqrt_ratio_at_tick(-100) == U256("78833030112140176575862854579"));
    }

    SECTION("Bounds") {
        REQUIRE(get_sqrt_ratio_at_tick(MIN_TICK) == MIN_SQRT_RATIO);
        REQUIRE(get_sqrt_ratio_at_tick(MAX_TICK) == MAX_SQRT_RATIO);
    }

    SECTION("Out of bounds throws") {
        REQUIRE_THROWS_AS(get_sqrt_ratio_at_tick(MIN_TICK - 1), PoolError);
        REQUIRE_THROWS_AS(get_sqrt_ratio_at_tick(MAX_TICK + 1), PoolError);
        try {
            get_sqrt_ratio_at_tick(MAX_TICK + 1);
        } catch (const PoolError& e) {
            REQUIRE(e.code() == ErrorCode::OUT_OF_BOUNDS);
        }
    }
}

TEST_CASE("Tick at sqrt ratio", "[tick_math]") {
    SECTION("Round trip across the full range") {
        for (int64_t t = MIN_TICK; t < MAX_TICK; t += 7919) {
            int32_t tick = static_cast<int32_t>(t);
            REQUIRE(get_tick_at_sqrt_ratio(get_sqrt_ratio_at_tick(tick)) == tick);
        }
        for (int32_t tick : {MIN_TICK, MIN_TICK + 1, -1, 0, 1, MAX_TICK - 1}) {
            REQUIRE(get_tick_at_sqrt_ratio(get_sqrt_ratio_at_tick(tick)) == tick);
        }
    }

    SECTION("Floor between ticks") {
        for (int32_t tick : {-50000, -101, -1, 0, 99, 42000}) {
            U256 at = get_sqrt_ratio_at_tick(tick);
            REQUIRE(get_tick_at_sqrt_ratio(at + 1) == tick);
            REQUIRE(get_tick_at_sqrt_ratio(at - 1) == tick - 1);
        }
    }

    SECTION("Monotonic") {
        U256 prev = get_sqrt_ratio_at_tick(MIN_TICK);
        for (int64_t t = MIN_TICK + 4241; t <= MAX_TICK; t += 4241) {
            U256 next = get_sqrt_ratio_at_tick(static_cast<int32_t>(t));
            REQUIRE(next > prev);
            prev = next;
        }
    }

    SECTION("Price bounds") {
        REQUIRE(get_tick_at_sqrt_ratio(MIN_SQRT_RATIO) == MIN_TICK);
        REQUIRE(get_tick_at_sqrt_ratio(MAX_SQRT_RATIO - 1) == MAX_TICK - 1);
        REQUIRE_THROWS_AS(get_tick_at_sqrt_ratio(MIN_SQRT_RATIO - 1), PoolError);
        REQUIRE_THROWS_AS(get_tick_at_sqrt_ratio(MAX_SQRT_RATIO), PoolError);
    }
}
