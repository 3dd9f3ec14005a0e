#ifndef RANGEPOOL_POOL_HPP
#define RANGEPOOL_POOL_HPP

#include <optional>
#include <vector>

#include "types.hpp"
#include "callbacks.hpp"
#include "deployer.hpp"
#include "events.hpp"
#include "position.hpp"
#include "tokens.hpp"

namespace rangepool {

// =============================================================================
// Pool Slot0 State
// =============================================================================

struct Slot0 {
    U256 sqrt_price_x96;    // Current sqrt(price) as Q64.96
    int32_t tick;           // Floor tick of the price; tick_lower - 1 right after crossing down
    bool initialized;
};

// =============================================================================
// Pool State
// =============================================================================

struct PoolState {
    Slot0 slot0;
    U128 liquidity;              // Active: liquidity_gross while in range, else 0
    U128 liquidity_gross;        // Sum of all position liquidity
    U256 fee_growth_global0_x128;
    U256 fee_growth_global1_x128;
};

// =============================================================================
// RangePool - constant-product AMM over one fixed tick range
// =============================================================================

// Every mutating call is all-or-nothing: on any exception the pool state and
// event log are restored to what they were on entry. Callbacks run after the
// state has been updated, so reentrant reads see the post-move pool.
class RangePool {
public:
    // Reads PoolParameters from a deployment in progress
    explicit RangePool(const PoolDeployer& deployer);
    ~RangePool() = default;

    // Non-copyable
    RangePool(const RangePool&) = delete;
    RangePool& operator=(const RangePool&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Set the starting price. Returns the tick at that price.
    int32_t initialize(const U256& sqrt_price_x96);

    // Add `amount` liquidity to recipient's position; sender pays through
    // callback.on_mint. Returns the amounts owed (rounded up).
    TokenAmounts mint(const Address& sender, const Address& recipient, const U128& amount,
                      IMintCallback& callback, const std::vector<uint8_t>& data = {});

    // Remove liquidity and credit the amounts (rounded down) to tokens_owed.
    // amount == 0 only settles fees.
    TokenAmounts burn(const Address& owner, const U128& amount);

    // Transfer up to the requested tokens_owed to recipient
    TokenAmounts collect(const Address& owner, const Address& recipient,
                         const U128& requested0 = U128_MAX,
                         const U128& requested1 = U128_MAX);

    // Returns the net amounts: positive = owed to the pool by the trader
    BalanceDelta swap(const Address& sender, const Address& recipient, const SwapParams& params,
                      ISwapCallback& callback, const std::vector<uint8_t>& data = {});

    // =========================================================================
    // Query Operations
    // =========================================================================

    const Slot0& slot0() const { return state_.slot0; }
    const U128& liquidity() const { return state_.liquidity; }
    const U128& liquidity_gross() const { return state_.liquidity_gross; }
    const U256& fee_growth_global0_x128() const { return state_.fee_growth_global0_x128; }
    const U256& fee_growth_global1_x128() const { return state_.fee_growth_global1_x128; }

    // Fee growth inside [tick_lower, tick_upper). The whole pool is one
    // range, so this is the global accumulator pair.
    FeeGrowthInside fee_growth_inside() const;

    std::optional<PositionInfo> position(const Address& owner) const {
        return positions_.find(owner);
    }
    const PositionBook& positions() const { return positions_; }

    // Pool's own token balances
    TokenAmounts balances() const;

    const EventLog& events() const { return events_; }

    // Immutables
    const Address& address() const { return address_; }
    const Address& factory() const { return factory_; }
    const Currency& token0() const { return token0_; }
    const Currency& token1() const { return token1_; }
    uint32_t fee() const { return fee_; }
    int32_t tick_lower() const { return tick_lower_; }
    int32_t tick_upper() const { return tick_upper_; }
    PoolKey key() const { return {token0_, token1_, fee_, tick_lower_, tick_upper_}; }

private:
    class StateGuard;

    // Value of a position before its first write under an open guard
    struct PositionUndo {
        Address owner;
        std::optional<PositionInfo> prior;
    };

    // Journals the current value, then returns the (possibly new) position
    PositionInfo& touch_position(const Address& owner);

    bool in_range(int32_t tick) const { return tick_lower_ <= tick && tick < tick_upper_; }
    void require_initialized(const char* op) const;

    // Token amounts for `liquidity` at the current tick (mint rounds up, burn down)
    TokenAmounts amounts_for_liquidity(const U128& liquidity, bool round_up) const;

    const Address address_;
    const Address factory_;
    const Currency token0_;
    const Currency token1_;
    const uint32_t fee_;
    const int32_t tick_lower_;
    const int32_t tick_upper_;
    const U256 sqrt_price_lower_x96_;
    const U256 sqrt_price_upper_x96_;
    ITokens& tokens_;

    PoolState state_;
    PositionBook positions_;
    std::vector<PositionUndo> position_journal_;
    size_t open_guards_ = 0;
    EventLog events_;
};

} // namespace rangepool

#endif // RANGEPOOL_POOL_HPP
