// rangepool - Pool State Machine Tests

#include <catch2/catch_test_macros.hpp>
#include "pool_fixture.hpp"

#include <functional>
#include <stdexcept>

using namespace rangepool;
using namespace rangepool::test;

namespace {

template <typename Fn>
ErrorCode error_of(Fn&& fn) {
    try {
        fn();
    } catch (const PoolError& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

// Reads the pool from inside the swap callback, then pays
class ObservingPayer : public ISwapCallback {
public:
    ObservingPayer(const RangePool& pool, LedgerPayer& payer) : pool_(pool), payer_(payer) {}

    void on_swap(const I256& amount0, const I256& amount1,
                 const std::vector<uint8_t>& data) override {
        observed_price = pool_.slot0().sqrt_price_x96;
        observed_tick = pool_.slot0().tick;
        observed_data = data;
        payer_.on_swap(amount0, amount1, data);
    }

    U256 observed_price;
    int32_t observed_tick = 0;
    std::vector<uint8_t> observed_data;

private:
    const RangePool& pool_;
    LedgerPayer& payer_;
};

// Runs another pool operation from inside the swap callback, then pays
class ReentrantPayer : public ISwapCallback {
public:
    ReentrantPayer(const RangePool& pool, std::function<void()> inner, LedgerPayer& payer)
        : pool_(pool), inner_(std::move(inner)), payer_(payer) {}

    void on_swap(const I256& amount0, const I256& amount1,
                 const std::vector<uint8_t>& data) override {
        price_before_inner = pool_.slot0().sqrt_price_x96;
        inner_();
        payer_.on_swap(amount0, amount1, data);
    }

    U256 price_before_inner;

private:
    const RangePool& pool_;
    std::function<void()> inner_;
    LedgerPayer& payer_;
};

class ThrowingPayer : public IMintCallback, public ISwapCallback {
public:
    void on_mint(const U256&, const U256&, const std::vector<uint8_t>&) override {
        throw std::runtime_error("payer unavailable");
    }
    void on_swap(const I256&, const I256&, const std::vector<uint8_t>&) override {
        throw std::runtime_error("payer unavailable");
    }
};

} // namespace

TEST_CASE("Pool initialize", "[pool]") {
    PoolFixture f;

    SECTION("Sets price and tick") {
        REQUIRE(f.pool.initialize(Q96) == 0);
        REQUIRE(f.pool.slot0().initialized);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == Q96);
        REQUIRE(f.pool.slot0().tick == 0);
        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.pool.events().size() == 1);
        REQUIRE(std::holds_alternative<InitializeEvent>(f.pool.events().at(0)));
    }

    SECTION("Twice fails") {
        f.pool.initialize(Q96);
        REQUIRE(error_of([&] { f.pool.initialize(Q96); }) == ErrorCode::ALREADY_INITIALIZED);
        REQUIRE(f.pool.events().size() == 1);
    }

    SECTION("Price out of bounds") {
        REQUIRE(error_of([&] { f.pool.initialize(tick_math::MAX_SQRT_RATIO); }) == ErrorCode::OUT_OF_BOUNDS);
        REQUIRE(error_of([&] { f.pool.initialize(tick_math::MIN_SQRT_RATIO - 1); }) == ErrorCode::OUT_OF_BOUNDS);
        REQUIRE_FALSE(f.pool.slot0().initialized);
    }

    SECTION("Operations before initialize") {
        REQUIRE(error_of([&] { f.mint(U128(1000)); }) == ErrorCode::NOT_INITIALIZED);
        REQUIRE(error_of([&] { f.swap(true, I256(100), -50); }) == ErrorCode::NOT_INITIALIZED);
        REQUIRE(error_of([&] { f.pool.burn(LP, U128(1)); }) == ErrorCode::NOT_INITIALIZED);
    }
}

TEST_CASE("Pool mint", "[pool]") {
    PoolFixture f;

    SECTION("In range takes both tokens, rounded up") {
        f.initialize_at(0);
        TokenAmounts paid = f.mint(U128(1000000));
        REQUIRE(paid.amount0 == 4988);
        REQUIRE(paid.amount1 == 4988);
        REQUIRE(f.pool.liquidity() == 1000000);
        REQUIRE(f.pool.liquidity_gross() == 1000000);
        REQUIRE(f.pool.position(LP)->liquidity == 1000000);
        REQUIRE(f.pool.balances().amount0 == 4988);
        REQUIRE(f.balance0(LP) == FUNDING - 4988);
        REQUIRE(std::holds_alternative<MintEvent>(f.pool.events().at(1)));
    }

    SECTION("Below range takes token0 only and stays inactive") {
        f.initialize_at(-200);
        TokenAmounts paid = f.mint(U128(1000));
        REQUIRE(paid.amount0 == 10);
        REQUIRE(paid.amount1 == 0);
        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.pool.liquidity_gross() == 1000);
    }

    SECTION("Above range takes token1 only") {
        f.initialize_at(200);
        TokenAmounts paid = f.mint(U128(1000));
        REQUIRE(paid.amount0 == 0);
        REQUIRE(paid.amount1 == 10);
        REQUIRE(f.pool.liquidity() == 0);
    }

    SECTION("Zero amount") {
        f.initialize_at(0);
        REQUIRE(error_of([&] { f.mint(U128(0)); }) == ErrorCode::INVALID_AMOUNT);
    }

    SECTION("Recipient owns the position, sender pays") {
        f.initialize_at(0);
        f.pool.mint(LP, OTHER, U128(1000000), f.lp_payer);
        REQUIRE(f.pool.position(OTHER)->liquidity == 1000000);
        REQUIRE_FALSE(f.pool.position(LP).has_value());
        REQUIRE(f.balance0(LP) == FUNDING - 4988);
    }
}

TEST_CASE("Pool swap in range", "[pool]") {
    PoolFixture f;
    f.initialize_at(0);
    f.mint(U128(1000000));

    SECTION("Exact input token0 stays inside the range") {
        BalanceDelta delta = f.swap(true, I256(500), -100);
        REQUIRE(delta.amount0 == 500);
        REQUIRE(delta.amount1 == -497);
        REQUIRE(f.pool.slot0().tick == -10);
        REQUIRE(f.pool.slot0().tick > -100);
        REQUIRE(f.pool.slot0().tick < 0);
        REQUIRE(f.pool.fee_growth_global0_x128() > 0);
        REQUIRE(f.pool.fee_growth_global1_x128() == 0);
        REQUIRE(f.pool.liquidity() == 1000000);

        REQUIRE(f.balance0(TRADER) == FUNDING - 500);
        REQUIRE(f.balance1(TRADER) == FUNDING + 497);
        REQUIRE(f.pool.balances().amount0 == 4988 + 500);
        REQUIRE(f.pool.balances().amount1 == 4988 - 497);
    }

    SECTION("Exact output token1") {
        BalanceDelta delta = f.swap(true, I256(-300), -100);
        REQUIRE(delta.amount0 == 302);
        REQUIRE(delta.amount1 == -300);
        REQUIRE(f.pool.slot0().tick == -7);
    }

    SECTION("Swap event mirrors the result") {
        f.swap(true, I256(500), -100);
        const auto& e = std::get<SwapEvent>(f.pool.events().at(2));
        REQUIRE(e.amount0 == 500);
        REQUIRE(e.amount1 == -497);
        REQUIRE(e.tick == -10);
        REQUIRE(e.liquidity == 1000000);
        REQUIRE(e.sqrt_price_x96 == f.pool.slot0().sqrt_price_x96);
    }

    SECTION("Fee growth is monotonic across swaps") {
        U256 g0 = f.pool.fee_growth_global0_x128();
        U256 g1 = f.pool.fee_growth_global1_x128();
        for (int i = 0; i < 4; ++i) {
            f.swap(i % 2 == 0, I256(500), i % 2 == 0 ? -100 : 100);
            REQUIRE(f.pool.fee_growth_global0_x128() >= g0);
            REQUIRE(f.pool.fee_growth_global1_x128() >= g1);
            g0 = f.pool.fee_growth_global0_x128();
            g1 = f.pool.fee_growth_global1_x128();
        }
        REQUIRE(g0 > 0);
        REQUIRE(g1 > 0);
    }
}

TEST_CASE("Pool swap leaving the range", "[pool]") {
    SECTION("Shallow liquidity is a partial fill at tick_lower") {
        PoolFixture f;
        f.initialize_at(0);
        f.mint(U128(1000));

        BalanceDelta delta = f.swap(true, I256(500), -100);
        REQUIRE(delta.amount0 == 7);
        REQUIRE(delta.amount1 == -4);
        REQUIRE(f.pool.slot0().tick == -101);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == tick_math::get_sqrt_ratio_at_tick(-100));
        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.balance0(TRADER) == FUNDING - 7);
    }

    SECTION("Crossing tick_upper leaves the pool inactive") {
        PoolFixture f;
        f.initialize_at(0);
        f.mint(U128(1000000));

        BalanceDelta up = f.swap(false, I256(1000000000), tick_math::MAX_TICK - 1);
        REQUIRE(up.amount0 == -4987);
        REQUIRE(up.amount1 == 5029);
        REQUIRE(f.pool.slot0().tick == 100);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == tick_math::get_sqrt_ratio_at_tick(100));
        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.pool.liquidity_gross() == 1000000);

        // Nothing left to sell token1 into
        BalanceDelta further = f.swap(false, I256(1000), tick_math::MAX_TICK - 1);
        REQUIRE(further.amount0 == 0);
        REQUIRE(further.amount1 == 0);

        // Coming back down does not re-activate the range either
        BalanceDelta down = f.swap(true, I256(1000), tick_math::MIN_TICK + 1);
        REQUIRE(down.amount0 == 0);
        REQUIRE(down.amount1 == 0);
        REQUIRE(f.pool.slot0().tick == 100);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == tick_math::get_sqrt_ratio_at_tick(100));
        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.balance0(TRADER) == FUNDING + 4987);
        REQUIRE(f.balance1(TRADER) == FUNDING - 5029);
    }

    SECTION("Leaving through tick_lower is final") {
        PoolFixture f;
        f.initialize_at(0);
        f.mint(U128(1000));
        f.swap(true, I256(500), -100);
        REQUIRE(f.pool.slot0().tick == -101);

        BalanceDelta back = f.swap(false, I256(3), 50);
        REQUIRE(back.amount0 == 0);
        REQUIRE(back.amount1 == 0);
        REQUIRE(f.pool.slot0().tick == -101);
        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.pool.fee_growth_global1_x128() == 0);
    }

    SECTION("Starting below the range fills nothing") {
        PoolFixture f;
        f.initialize_at(-200);
        f.mint(U128(1000));
        REQUIRE(f.pool.liquidity() == 0);

        BalanceDelta delta = f.swap(false, I256(1000), 0);
        REQUIRE(delta.amount0 == 0);
        REQUIRE(delta.amount1 == 0);
        REQUIRE(f.pool.slot0().tick == -200);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == tick_math::get_sqrt_ratio_at_tick(-200));
        REQUIRE(f.balance1(TRADER) == FUNDING);
        REQUIRE(std::get<SwapEvent>(f.pool.events().at(2)).amount1 == 0);
    }

    SECTION("Empty pool trades nothing") {
        PoolFixture f;
        f.initialize_at(0);
        BalanceDelta delta = f.swap(true, I256(500), -100);
        REQUIRE(delta.amount0 == 0);
        REQUIRE(delta.amount1 == 0);
        REQUIRE(f.pool.slot0().tick == 0);
    }
}

TEST_CASE("Pool swap validation", "[pool]") {
    PoolFixture f;
    f.initialize_at(0);
    f.mint(U128(1000000));

    SECTION("Zero amount") {
        REQUIRE(error_of([&] { f.swap(true, I256(0), -100); }) == ErrorCode::INVALID_AMOUNT);
    }

    SECTION("Limit on the wrong side") {
        REQUIRE(error_of([&] { f.swap(true, I256(100), 10); }) == ErrorCode::INVALID_PRICE_LIMIT);
        REQUIRE(error_of([&] { f.swap(false, I256(100), -10); }) == ErrorCode::INVALID_PRICE_LIMIT);
        REQUIRE(error_of([&] { f.swap(true, I256(100), 0); }) == ErrorCode::INVALID_PRICE_LIMIT);
    }

    SECTION("Limit at the global bounds") {
        SwapParams down{true, I256(100), tick_math::MIN_SQRT_RATIO};
        REQUIRE(error_of([&] { f.pool.swap(TRADER, TRADER, down, f.trader_payer); })
                == ErrorCode::INVALID_PRICE_LIMIT);
        SwapParams up{false, I256(100), tick_math::MAX_SQRT_RATIO};
        REQUIRE(error_of([&] { f.pool.swap(TRADER, TRADER, up, f.trader_payer); })
                == ErrorCode::INVALID_PRICE_LIMIT);
    }
}

TEST_CASE("Pool burn and collect", "[pool]") {
    PoolFixture f;
    f.initialize_at(0);
    f.mint(U128(1000000));

    SECTION("Round trip returns at most what was paid") {
        TokenAmounts owed = f.pool.burn(LP, U128(1000000));
        REQUIRE(owed.amount0 == 4987);
        REQUIRE(owed.amount1 == 4987);
        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.pool.liquidity_gross() == 0);
        REQUIRE(f.pool.position(LP)->tokens_owed0 == 4987);

        // Burn only credits
        REQUIRE(f.balance0(LP) == FUNDING - 4988);

        TokenAmounts got = f.pool.collect(LP, LP);
        REQUIRE(got.amount0 == 4987);
        REQUIRE(got.amount1 == 4987);
        REQUIRE(f.balance0(LP) == FUNDING - 1);
        REQUIRE(f.balance1(LP) == FUNDING - 1);
    }

    SECTION("Fees accrue on poke and collect once") {
        f.swap(true, I256(500), -100);
        f.pool.burn(LP, U128(0));
        REQUIRE(f.pool.position(LP)->tokens_owed0 == 1);
        REQUIRE(f.pool.position(LP)->tokens_owed1 == 0);

        TokenAmounts first = f.pool.collect(LP, OTHER);
        REQUIRE(first.amount0 == 1);
        REQUIRE(first.amount1 == 0);
        REQUIRE(f.balance0(OTHER) == 1);

        TokenAmounts second = f.pool.collect(LP, OTHER);
        REQUIRE(second.amount0 == 0);
        REQUIRE(second.amount1 == 0);
    }

    SECTION("Partial collect") {
        f.pool.burn(LP, U128(1000000));
        TokenAmounts got = f.pool.collect(LP, LP, U128(100), U128(0));
        REQUIRE(got.amount0 == 100);
        REQUIRE(got.amount1 == 0);
        REQUIRE(f.pool.position(LP)->tokens_owed0 == 4887);
    }

    SECTION("Burning more than the position changes nothing") {
        size_t events = f.pool.events().size();
        Slot0 before = f.pool.slot0();
        REQUIRE(error_of([&] { f.pool.burn(LP, U128(1000001)); }) == ErrorCode::INSUFFICIENT_LIQUIDITY);
        REQUIRE(f.pool.liquidity() == 1000000);
        REQUIRE(f.pool.liquidity_gross() == 1000000);
        REQUIRE(f.pool.position(LP)->liquidity == 1000000);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == before.sqrt_price_x96);
        REQUIRE(f.pool.events().size() == events);
    }

    SECTION("Poke on an empty position") {
        REQUIRE(error_of([&] { f.pool.burn(OTHER, U128(0)); }) == ErrorCode::INVALID_AMOUNT);
        REQUIRE(error_of([&] { f.pool.burn(OTHER, U128(1)); }) == ErrorCode::INSUFFICIENT_LIQUIDITY);
    }

    SECTION("Collect with nothing owed") {
        TokenAmounts got = f.pool.collect(OTHER, OTHER);
        REQUIRE(got.amount0 == 0);
        REQUIRE(got.amount1 == 0);
    }
}

TEST_CASE("Pool payment verification", "[pool]") {
    PoolFixture f;
    f.initialize_at(0);

    SECTION("Underpaid mint rolls back pool and balances") {
        f.lp_payer.set_shortfall(U256(1));
        REQUIRE(error_of([&] {
            f.ledger.transact([&] { f.mint(U128(1000000)); });
        }) == ErrorCode::INSUFFICIENT_PAYMENT);

        REQUIRE(f.pool.liquidity() == 0);
        REQUIRE(f.pool.liquidity_gross() == 0);
        REQUIRE_FALSE(f.pool.position(LP).has_value());
        REQUIRE(f.pool.events().size() == 1);
        REQUIRE(f.balance0(LP) == FUNDING);
        REQUIRE(f.balance1(LP) == FUNDING);
        REQUIRE(f.pool.balances().amount0 == 0);
    }

    SECTION("Underpaid top-up restores the existing position") {
        f.mint(U128(1000000));
        f.swap(true, I256(500), -100);
        PositionInfo before = *f.pool.position(LP);

        f.lp_payer.set_shortfall(U256(1));
        REQUIRE(error_of([&] {
            f.ledger.transact([&] { f.mint(U128(5000)); });
        }) == ErrorCode::INSUFFICIENT_PAYMENT);

        PositionInfo after = *f.pool.position(LP);
        REQUIRE(after.liquidity == before.liquidity);
        REQUIRE(after.fee_growth_inside0_last_x128 == before.fee_growth_inside0_last_x128);
        REQUIRE(after.tokens_owed0 == before.tokens_owed0);
        REQUIRE(f.pool.positions().size() == 1);
        REQUIRE(f.pool.liquidity_gross() == 1000000);
    }

    SECTION("Underpaid swap rolls back pool and balances") {
        f.mint(U128(1000000));
        Slot0 before = f.pool.slot0();
        TokenAmounts pool_before = f.pool.balances();

        f.trader_payer.set_shortfall(U256(1));
        REQUIRE(error_of([&] {
            f.ledger.transact([&] { f.swap(true, I256(500), -100); });
        }) == ErrorCode::INSUFFICIENT_INPUT);

        REQUIRE(f.pool.slot0().sqrt_price_x96 == before.sqrt_price_x96);
        REQUIRE(f.pool.slot0().tick == before.tick);
        REQUIRE(f.pool.fee_growth_global0_x128() == 0);
        REQUIRE(f.pool.events().size() == 2);
        REQUIRE(f.balance0(TRADER) == FUNDING);
        REQUIRE(f.balance1(TRADER) == FUNDING);
        REQUIRE(f.pool.balances() == pool_before);
    }

    SECTION("Callback exception propagates and rolls back") {
        ThrowingPayer payer;
        REQUIRE_THROWS_AS(f.pool.mint(LP, LP, U128(1000), payer), std::runtime_error);
        REQUIRE(f.pool.liquidity_gross() == 0);
        REQUIRE(f.pool.events().size() == 1);
    }
}

TEST_CASE("Pool reentrant reads", "[pool]") {
    PoolFixture f;
    f.initialize_at(0);
    f.mint(U128(1000000));

    ObservingPayer observer(f.pool, f.trader_payer);
    SwapParams params{true, I256(500), tick_math::get_sqrt_ratio_at_tick(-100)};
    f.pool.swap(TRADER, TRADER, params, observer, {1, 2, 3});

    REQUIRE(observer.observed_price == f.pool.slot0().sqrt_price_x96);
    REQUIRE(observer.observed_price < Q96);
    REQUIRE(observer.observed_tick == -10);
    REQUIRE(observer.observed_data == std::vector<uint8_t>{1, 2, 3});
}

TEST_CASE("Pool reentrant operations", "[pool]") {
    PoolFixture f;
    f.initialize_at(0);
    f.mint(U128(1000000));

    SECTION("Inner swap runs on the committed outer state") {
        BalanceDelta inner{};
        ReentrantPayer payer(f.pool, [&] { inner = f.swap(true, I256(100), -100); }, f.trader_payer);

        SwapParams params{true, I256(500), tick_math::get_sqrt_ratio_at_tick(-100)};
        BalanceDelta outer = f.pool.swap(TRADER, TRADER, params, payer);

        REQUIRE(outer.amount0 == 500);
        REQUIRE(outer.amount1 == -497);
        const BalanceDelta expected_inner{I256(100), I256(-98)};
        REQUIRE(inner == expected_inner);

        // Inner first, then outer; the outer event keeps its own post-move price
        REQUIRE(f.pool.events().size() == 4);
        const auto& inner_event = std::get<SwapEvent>(f.pool.events().at(2));
        const auto& outer_event = std::get<SwapEvent>(f.pool.events().at(3));
        REQUIRE(inner_event.amount0 == 100);
        REQUIRE(outer_event.amount0 == 500);
        REQUIRE(payer.price_before_inner == outer_event.sqrt_price_x96);
        REQUIRE(inner_event.sqrt_price_x96 < outer_event.sqrt_price_x96);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == inner_event.sqrt_price_x96);

        REQUIRE(f.pool.balances().amount0 == 5588);
        REQUIRE(f.pool.balances().amount1 == 4393);
        REQUIRE(f.balance0(TRADER) == FUNDING - 600);
        REQUIRE(f.balance1(TRADER) == FUNDING + 595);
    }

    SECTION("Outer failure undoes an inner mint") {
        Slot0 before = f.pool.slot0();
        TokenAmounts pool_before = f.pool.balances();

        LedgerPayer stingy(f.ledger, TRADER, f.pool.address(), f.pool.token0(), f.pool.token1());
        stingy.set_shortfall(U256(500));
        bool inner_done = false;
        ReentrantPayer payer(f.pool, [&] {
            f.mint(U128(1000));
            inner_done = true;
        }, stingy);

        SwapParams params{true, I256(500), tick_math::get_sqrt_ratio_at_tick(-100)};
        REQUIRE(error_of([&] {
            f.ledger.transact([&] { f.pool.swap(TRADER, TRADER, params, payer); });
        }) == ErrorCode::INSUFFICIENT_INPUT);

        REQUIRE(inner_done);
        REQUIRE(f.pool.slot0().sqrt_price_x96 == before.sqrt_price_x96);
        REQUIRE(f.pool.slot0().tick == before.tick);
        REQUIRE(f.pool.liquidity() == 1000000);
        REQUIRE(f.pool.liquidity_gross() == 1000000);
        REQUIRE(f.pool.position(LP)->liquidity == 1000000);
        REQUIRE(f.pool.fee_growth_global0_x128() == 0);
        REQUIRE(f.pool.events().size() == 2);
        REQUIRE(f.pool.balances() == pool_before);
        REQUIRE(f.balance0(LP) == FUNDING - 4988);
        REQUIRE(f.balance0(TRADER) == FUNDING);
        REQUIRE(f.balance1(TRADER) == FUNDING);
    }
}

TEST_CASE("Pool queries", "[pool]") {
    PoolFixture f(-60, 120, fees::FEE_005);
    f.initialize_at(10);
    f.mint(U128(5000));
    f.swap(true, I256(10), -60);

    FeeGrowthInside inside = f.pool.fee_growth_inside();
    REQUIRE(inside.fee_growth0_x128 == f.pool.fee_growth_global0_x128());
    REQUIRE(inside.fee_growth1_x128 == f.pool.fee_growth_global1_x128());

    REQUIRE(f.pool.fee() == fees::FEE_005);
    REQUIRE(f.pool.tick_lower() == -60);
    REQUIRE(f.pool.tick_upper() == 120);
    REQUIRE(f.pool.token0() == Currency(TOKEN_A));
    REQUIRE(f.pool.token1() == Currency(TOKEN_B));
    REQUIRE(f.pool.factory() == FACTORY);
    REQUIRE(f.pool.positions().size() == 1);
    REQUIRE(f.pool.key().id() == make_pool_key(Currency(TOKEN_B), Currency(TOKEN_A), fees::FEE_005, -60, 120).id());
}
