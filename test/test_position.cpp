// rangepool - Position Accounting Tests

#include <catch2/catch_test_macros.hpp>
#include <rangepool/position.hpp>

using namespace rangepool;

TEST_CASE("Position settle", "[position]") {
    PositionInfo pos{};

    SECTION("First deposit takes the current snapshot, earns nothing") {
        position::settle(pos, I128(1000), {Q128 * 5, Q128 * 7});
        REQUIRE(pos.liquidity == 1000);
        REQUIRE(pos.tokens_owed0 == 0);
        REQUIRE(pos.tokens_owed1 == 0);
        REQUIRE(pos.fee_growth_inside0_last_x128 == Q128 * 5);
        REQUIRE(pos.fee_growth_inside1_last_x128 == Q128 * 7);
    }

    SECTION("Accrues growth times liquidity") {
        position::settle(pos, I128(1000), {U256(0), U256(0)});
        // 3/1000 per unit of liquidity in token0, 1/2000 in token1
        position::settle(pos, I128(0), {Q128 * 3 / 1000, Q128 / 2000});
        REQUIRE(pos.tokens_owed0 == 2);   // floor(2.999...)
        REQUIRE(pos.tokens_owed1 == 0);   // floor(0.5)
        REQUIRE(pos.liquidity == 1000);
    }

    SECTION("Accrual uses liquidity before the delta") {
        position::settle(pos, I128(100), {U256(0), U256(0)});
        position::settle(pos, I128(-100), {Q128, Q128 * 2});
        REQUIRE(pos.liquidity == 0);
        REQUIRE(pos.tokens_owed0 == 100);
        REQUIRE(pos.tokens_owed1 == 200);
    }

    SECTION("Removing too much fails and leaves the position untouched") {
        position::settle(pos, I128(100), {U256(0), U256(0)});
        PositionInfo before = pos;
        try {
            position::settle(pos, I128(-101), {Q128, Q128});
            FAIL("expected PoolError");
        } catch (const PoolError& e) {
            REQUIRE(e.code() == ErrorCode::INSUFFICIENT_LIQUIDITY);
        }
        REQUIRE(pos.liquidity == before.liquidity);
        REQUIRE(pos.tokens_owed0 == 0);
        REQUIRE(pos.fee_growth_inside0_last_x128 == 0);
    }

    SECTION("Owed overflow") {
        pos.tokens_owed0 = U128_MAX;
        position::settle(pos, I128(1), {U256(0), U256(0)});
        REQUIRE_THROWS_AS(position::settle(pos, I128(0), {Q128, U256(0)}), PoolError);
    }
}

TEST_CASE("Position collect", "[position]") {
    PositionInfo pos{};
    pos.tokens_owed0 = 50;
    pos.tokens_owed1 = 20;

    SECTION("Pays min of owed and requested") {
        TokenAmounts paid = position::collect(pos, U128(30), U128_MAX);
        REQUIRE(paid.amount0 == 30);
        REQUIRE(paid.amount1 == 20);
        REQUIRE(pos.tokens_owed0 == 20);
        REQUIRE(pos.tokens_owed1 == 0);
    }

    SECTION("Second collect is empty") {
        position::collect(pos, U128_MAX, U128_MAX);
        TokenAmounts again = position::collect(pos, U128_MAX, U128_MAX);
        REQUIRE(again.amount0 == 0);
        REQUIRE(again.amount1 == 0);
    }
}

TEST_CASE("Position book", "[position]") {
    PositionBook book;
    Address alice = address_from_u64(1);
    Address bob = address_from_u64(2);

    REQUIRE(book.size() == 0);
    REQUIRE_FALSE(book.find(alice).has_value());
    REQUIRE(book.try_get(alice) == nullptr);
    REQUIRE(book.size() == 0);

    book.get(alice).liquidity = 10;
    book.get(bob);
    REQUIRE(book.size() == 2);
    REQUIRE(book.find(alice)->liquidity == 10);
    REQUIRE(book.try_get(bob)->empty());

    size_t n = 0;
    for (const auto& entry : book) {
        (void)entry;
        ++n;
    }
    REQUIRE(n == 2);
}
