// =============================================================================
// pool.cpp - RangePool AMM Implementation
// Single fixed tick range, callback-paid mint and swap, all-or-nothing calls
// =============================================================================

#include "rangepool/pool.hpp"
#include "rangepool/full_math.hpp"
#include "rangepool/liquidity_math.hpp"
#include "rangepool/sqrt_price_math.hpp"
#include "rangepool/swap_math.hpp"
#include "rangepool/tick_math.hpp"

#include <boost/log/trivial.hpp>

#include <limits>

namespace rangepool {

// =============================================================================
// Internal Helpers
// =============================================================================

namespace {

const PoolParameters& validated(const PoolDeployer& deployer) {
    const PoolParameters& p = deployer.parameters();
    if (p.tick_lower >= p.tick_upper ||
        p.tick_lower < tick_math::MIN_TICK ||
        p.tick_upper > tick_math::MAX_TICK) {
        throw PoolError(ErrorCode::INVALID_TICK_RANGE,
                        "RangePool: invalid range [" + std::to_string(p.tick_lower) + ", " +
                        std::to_string(p.tick_upper) + ")");
    }
    if (p.fee >= fees::FEE_DENOMINATOR) {
        throw PoolError(ErrorCode::INVALID_FEE, "RangePool: fee " + std::to_string(p.fee));
    }
    return p;
}

I128 signed_liquidity(const U128& amount) {
    if (amount > U128(std::numeric_limits<I128>::max())) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW,
                        "RangePool: liquidity amount " + amount.str() + " too large");
    }
    return I128(amount);
}

U128 add_owed(const U128& owed, const U256& amount) {
    U256 total = U256(owed) + amount;
    if (total > U256(U128_MAX)) {
        throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW, "RangePool: tokens owed overflow");
    }
    return U128(total);
}

// Working copy of the moving parts of a swap
struct SwapState {
    I256 amount_remaining;
    I256 amount_calculated;
    U256 sqrt_price_x96;
    int32_t tick;
    U128 liquidity;
    U256 fee_growth_global_x128;   // Input token's accumulator
};

} // anonymous namespace

// =============================================================================
// Rollback Guard
// =============================================================================

// Snapshots pool state and event log length; restores both unless committed.
// Position writes are undone from the journal, so only touched positions
// are copied. Nested guards share the journal; the outermost one clears it.
class RangePool::StateGuard {
public:
    explicit StateGuard(RangePool& pool)
        : pool_(pool)
        , state_(pool.state_)
        , events_size_(pool.events_.size())
        , journal_size_(pool.position_journal_.size())
    {
        ++pool_.open_guards_;
    }

    ~StateGuard() {
        if (!committed_) {
            pool_.state_ = state_;
            pool_.events_.truncate(events_size_);

            auto& journal = pool_.position_journal_;
            while (journal.size() > journal_size_) {
                pool_.positions_.restore(journal.back().owner, journal.back().prior);
                journal.pop_back();
            }
        }
        if (--pool_.open_guards_ == 0) {
            pool_.position_journal_.clear();
        }
    }

    StateGuard(const StateGuard&) = delete;
    StateGuard& operator=(const StateGuard&) = delete;

    void commit() { committed_ = true; }

private:
    RangePool& pool_;
    PoolState state_;
    size_t events_size_;
    size_t journal_size_;
    bool committed_{false};
};

// =============================================================================
// Construction
// =============================================================================

RangePool::RangePool(const PoolDeployer& deployer)
    : address_(validated(deployer).pool)
    , factory_(deployer.parameters().factory)
    , token0_(deployer.parameters().token0)
    , token1_(deployer.parameters().token1)
    , fee_(deployer.parameters().fee)
    , tick_lower_(deployer.parameters().tick_lower)
    , tick_upper_(deployer.parameters().tick_upper)
    , sqrt_price_lower_x96_(tick_math::get_sqrt_ratio_at_tick(tick_lower_))
    , sqrt_price_upper_x96_(tick_math::get_sqrt_ratio_at_tick(tick_upper_))
    , tokens_(deployer.tokens())
    , state_{Slot0{U256(0), 0, false}, U128(0), U128(0), U256(0), U256(0)}
{
}

PositionInfo& RangePool::touch_position(const Address& owner) {
    position_journal_.push_back({owner, positions_.find(owner)});
    return positions_.get(owner);
}

void RangePool::require_initialized(const char* op) const {
    if (!state_.slot0.initialized) {
        throw PoolError(ErrorCode::NOT_INITIALIZED,
                        std::string("RangePool: ") + op + " before initialize");
    }
}

FeeGrowthInside RangePool::fee_growth_inside() const {
    return {state_.fee_growth_global0_x128, state_.fee_growth_global1_x128};
}

TokenAmounts RangePool::balances() const {
    return {tokens_.balance_of(token0_, address_), tokens_.balance_of(token1_, address_)};
}

TokenAmounts RangePool::amounts_for_liquidity(const U128& liquidity, bool round_up) const {
    using sqrt_price_math::get_amount0_delta;
    using sqrt_price_math::get_amount1_delta;

    const Slot0& s = state_.slot0;
    TokenAmounts amounts{0, 0};

    if (s.tick < tick_lower_) {
        // Below range: all token0
        amounts.amount0 = get_amount0_delta(sqrt_price_lower_x96_, sqrt_price_upper_x96_, liquidity, round_up);
    } else if (s.tick < tick_upper_) {
        amounts.amount0 = get_amount0_delta(s.sqrt_price_x96, sqrt_price_upper_x96_, liquidity, round_up);
        amounts.amount1 = get_amount1_delta(sqrt_price_lower_x96_, s.sqrt_price_x96, liquidity, round_up);
    } else {
        // Above range: all token1
        amounts.amount1 = get_amount1_delta(sqrt_price_lower_x96_, sqrt_price_upper_x96_, liquidity, round_up);
    }
    return amounts;
}

// =============================================================================
// Initialize Pool
// =============================================================================

int32_t RangePool::initialize(const U256& sqrt_price_x96) {
    if (state_.slot0.initialized) {
        throw PoolError(ErrorCode::ALREADY_INITIALIZED, "RangePool: already initialized");
    }

    // Throws OUT_OF_BOUNDS outside [MIN_SQRT_RATIO, MAX_SQRT_RATIO)
    int32_t tick = tick_math::get_tick_at_sqrt_ratio(sqrt_price_x96);

    StateGuard guard(*this);

    state_.slot0.sqrt_price_x96 = sqrt_price_x96;
    state_.slot0.tick = tick;
    state_.slot0.initialized = true;
    state_.liquidity = in_range(tick) ? state_.liquidity_gross : U128(0);

    events_.append(InitializeEvent{sqrt_price_x96, tick});
    guard.commit();

    BOOST_LOG_TRIVIAL(info) << "RangePool " << to_hex(address_) << " initialized at tick " << tick
                            << " (sqrt_price_x96=" << sqrt_price_x96 << ")";
    return tick;
}

// =============================================================================
// Mint
// =============================================================================

TokenAmounts RangePool::mint(const Address& sender, const Address& recipient, const U128& amount,
                             IMintCallback& callback, const std::vector<uint8_t>& data) {
    if (amount == 0) {
        throw PoolError(ErrorCode::INVALID_AMOUNT, "RangePool: mint amount must be positive");
    }
    require_initialized("mint");

    StateGuard guard(*this);

    I128 delta = signed_liquidity(amount);
    TokenAmounts amounts = amounts_for_liquidity(amount, true);

    position::settle(touch_position(recipient), delta, fee_growth_inside());
    state_.liquidity_gross = liquidity_math::add_delta(state_.liquidity_gross, delta);
    if (in_range(state_.slot0.tick)) {
        state_.liquidity = liquidity_math::add_delta(state_.liquidity, delta);
    }

    // State is final; now collect payment
    TokenAmounts before = balances();
    callback.on_mint(amounts.amount0, amounts.amount1, data);
    TokenAmounts after = balances();

    if (amounts.amount0 > 0 && after.amount0 < before.amount0 + amounts.amount0) {
        throw PoolError(ErrorCode::INSUFFICIENT_PAYMENT,
                        "RangePool: mint underpaid token0, owed " + amounts.amount0.str());
    }
    if (amounts.amount1 > 0 && after.amount1 < before.amount1 + amounts.amount1) {
        throw PoolError(ErrorCode::INSUFFICIENT_PAYMENT,
                        "RangePool: mint underpaid token1, owed " + amounts.amount1.str());
    }

    events_.append(MintEvent{sender, recipient, amount, amounts.amount0, amounts.amount1});
    guard.commit();

    BOOST_LOG_TRIVIAL(debug) << "RangePool mint " << amount << " for " << to_hex(recipient)
                             << ": amount0=" << amounts.amount0 << " amount1=" << amounts.amount1;
    return amounts;
}

// =============================================================================
// Burn
// =============================================================================

TokenAmounts RangePool::burn(const Address& owner, const U128& amount) {
    require_initialized("burn");

    std::optional<PositionInfo> current = positions_.find(owner);
    U128 held = current ? current->liquidity : U128(0);

    if (amount > held) {
        throw PoolError(ErrorCode::INSUFFICIENT_LIQUIDITY,
                        "RangePool: burn " + amount.str() + " exceeds position liquidity " + held.str());
    }
    if (amount == 0 && held == 0) {
        throw PoolError(ErrorCode::INVALID_AMOUNT, "RangePool: poke on empty position");
    }

    StateGuard guard(*this);

    I128 delta = -signed_liquidity(amount);
    TokenAmounts amounts = amounts_for_liquidity(amount, false);

    PositionInfo& pos = touch_position(owner);
    position::settle(pos, delta, fee_growth_inside());
    state_.liquidity_gross = liquidity_math::add_delta(state_.liquidity_gross, delta);
    if (in_range(state_.slot0.tick)) {
        state_.liquidity = liquidity_math::add_delta(state_.liquidity, delta);
    }

    pos.tokens_owed0 = add_owed(pos.tokens_owed0, amounts.amount0);
    pos.tokens_owed1 = add_owed(pos.tokens_owed1, amounts.amount1);

    events_.append(BurnEvent{owner, amount, amounts.amount0, amounts.amount1});
    guard.commit();

    BOOST_LOG_TRIVIAL(debug) << "RangePool burn " << amount << " from " << to_hex(owner)
                             << ": amount0=" << amounts.amount0 << " amount1=" << amounts.amount1;
    return amounts;
}

// =============================================================================
// Collect
// =============================================================================

TokenAmounts RangePool::collect(const Address& owner, const Address& recipient,
                                const U128& requested0, const U128& requested1) {
    StateGuard guard(*this);

    TokenAmounts amounts{0, 0};
    if (positions_.try_get(owner)) {
        amounts = position::collect(touch_position(owner), requested0, requested1);
    }

    if (amounts.amount0 > 0) tokens_.transfer(token0_, address_, recipient, amounts.amount0);
    if (amounts.amount1 > 0) tokens_.transfer(token1_, address_, recipient, amounts.amount1);

    events_.append(CollectEvent{owner, recipient, amounts.amount0, amounts.amount1});
    guard.commit();

    BOOST_LOG_TRIVIAL(debug) << "RangePool collect by " << to_hex(owner) << " to " << to_hex(recipient)
                             << ": amount0=" << amounts.amount0 << " amount1=" << amounts.amount1;
    return amounts;
}

// =============================================================================
// Swap
// =============================================================================

BalanceDelta RangePool::swap(const Address& sender, const Address& recipient, const SwapParams& params,
                             ISwapCallback& callback, const std::vector<uint8_t>& data) {
    require_initialized("swap");

    if (params.amount_specified == 0) {
        throw PoolError(ErrorCode::INVALID_AMOUNT, "RangePool: swap amount must be non-zero");
    }

    const U256& limit = params.sqrt_price_limit;
    const U256& price = state_.slot0.sqrt_price_x96;
    bool zero_for_one = params.zero_for_one;

    // Validate price limit
    if (zero_for_one) {
        if (limit >= price || limit <= tick_math::MIN_SQRT_RATIO) {
            throw PoolError(ErrorCode::INVALID_PRICE_LIMIT,
                            "RangePool: limit " + limit.str() + " not below price " + price.str());
        }
    } else {
        if (limit <= price || limit >= tick_math::MAX_SQRT_RATIO) {
            throw PoolError(ErrorCode::INVALID_PRICE_LIMIT,
                            "RangePool: limit " + limit.str() + " not above price " + price.str());
        }
    }

    StateGuard guard(*this);

    bool exact_in = params.amount_specified > 0;

    SwapState state{
        params.amount_specified,
        I256(0),
        state_.slot0.sqrt_price_x96,
        state_.slot0.tick,
        state_.liquidity,
        zero_for_one ? state_.fee_growth_global0_x128 : state_.fee_growth_global1_x128
    };

    // Main swap loop: one step to the range edge, or one partial step
    while (state.amount_remaining != 0 && state.sqrt_price_x96 != limit) {
        if (state.liquidity == 0) {
            // Outside the range (or empty): nothing can be filled
            break;
        }

        // Active liquidity implies tick_lower <= tick < tick_upper
        int32_t boundary = zero_for_one ? tick_lower_ : tick_upper_;
        U256 sqrt_price_next = tick_math::get_sqrt_ratio_at_tick(boundary);

        // Clamp to price limit
        U256 sqrt_price_target;
        if (zero_for_one) {
            sqrt_price_target = sqrt_price_next < limit ? limit : sqrt_price_next;
        } else {
            sqrt_price_target = sqrt_price_next > limit ? limit : sqrt_price_next;
        }

        U256 sqrt_price_before = state.sqrt_price_x96;

        swap_math::SwapStep step = swap_math::compute_swap_step(
            state.sqrt_price_x96, sqrt_price_target, state.liquidity, state.amount_remaining, fee_);
        state.sqrt_price_x96 = step.sqrt_price_next;

        if (exact_in) {
            state.amount_remaining -= I256(step.amount_in + step.fee_amount);
            state.amount_calculated -= I256(step.amount_out);
        } else {
            state.amount_remaining += I256(step.amount_out);
            state.amount_calculated += I256(step.amount_in + step.fee_amount);
        }

        if (step.fee_amount > 0) {
            U256 growth = full_math::mul_div(step.fee_amount, Q128, U256(state.liquidity));
            if (growth > std::numeric_limits<U256>::max() - state.fee_growth_global_x128) {
                throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW, "RangePool: fee growth overflow");
            }
            state.fee_growth_global_x128 += growth;
        }

        if (state.sqrt_price_x96 == sqrt_price_next) {
            // Cross the boundary
            state.tick = zero_for_one ? boundary - 1 : boundary;
            state.liquidity = 0;
        } else if (state.sqrt_price_x96 != sqrt_price_before) {
            state.tick = tick_math::get_tick_at_sqrt_ratio(state.sqrt_price_x96);
        }
    }

    // Persist state changes before any external call
    state_.slot0.sqrt_price_x96 = state.sqrt_price_x96;
    state_.slot0.tick = state.tick;
    state_.liquidity = state.liquidity;
    if (zero_for_one) {
        state_.fee_growth_global0_x128 = state.fee_growth_global_x128;
    } else {
        state_.fee_growth_global1_x128 = state.fee_growth_global_x128;
    }

    // Calculate balance delta
    BalanceDelta delta{};
    if (zero_for_one == exact_in) {
        delta.amount0 = params.amount_specified - state.amount_remaining;
        delta.amount1 = state.amount_calculated;
    } else {
        delta.amount0 = state.amount_calculated;
        delta.amount1 = params.amount_specified - state.amount_remaining;
    }

    // Pay out first, then collect the input through the callback
    const Currency& token_in = zero_for_one ? token0_ : token1_;
    const Currency& token_out = zero_for_one ? token1_ : token0_;
    const I256& amount_in = zero_for_one ? delta.amount0 : delta.amount1;
    const I256& amount_out = zero_for_one ? delta.amount1 : delta.amount0;

    if (amount_out < 0) {
        tokens_.transfer(token_out, address_, recipient, U256(-amount_out));
    }

    SwapEvent event{sender, recipient, delta.amount0, delta.amount1,
                    state_.slot0.sqrt_price_x96, state_.liquidity, state_.slot0.tick};

    U256 balance_before = tokens_.balance_of(token_in, address_);
    callback.on_swap(delta.amount0, delta.amount1, data);
    if (amount_in > 0 && tokens_.balance_of(token_in, address_) < balance_before + U256(amount_in)) {
        throw PoolError(ErrorCode::INSUFFICIENT_INPUT,
                        "RangePool: swap underpaid, owed " + amount_in.str());
    }

    events_.append(event);
    guard.commit();

    BOOST_LOG_TRIVIAL(debug) << "RangePool swap " << (zero_for_one ? "0->1" : "1->0")
                             << ": amount0=" << delta.amount0 << " amount1=" << delta.amount1
                             << " tick=" << event.tick;
    return delta;
}

} // namespace rangepool
