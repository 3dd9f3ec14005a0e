#ifndef RANGEPOOL_POSITION_HPP
#define RANGEPOOL_POSITION_HPP

#include <map>
#include <optional>

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Position Info
// =============================================================================

struct PositionInfo {
    U128 liquidity;                     // Owner's contribution
    U256 fee_growth_inside0_last_x128;  // Snapshot at last settlement
    U256 fee_growth_inside1_last_x128;
    U128 tokens_owed0;                  // Settled, withdrawable via collect
    U128 tokens_owed1;

    bool empty() const {
        return liquidity == 0 && tokens_owed0 == 0 && tokens_owed1 == 0;
    }
};

// Fee growth per unit of liquidity inside the position's range (Q128.128).
// A single-range pool passes its global accumulators here.
struct FeeGrowthInside {
    U256 fee_growth0_x128;
    U256 fee_growth1_x128;
};

// =============================================================================
// Position Accounting
// =============================================================================

namespace position {

// Accrue fees earned since the last settlement into tokens_owed, move the
// snapshot to `inside`, then apply `liquidity_delta`.
// Throws INSUFFICIENT_LIQUIDITY (position unchanged) if liquidity would go
// negative, ARITHMETIC_OVERFLOW if tokens owed would exceed 128 bits.
void settle(PositionInfo& pos, const I128& liquidity_delta, const FeeGrowthInside& inside);

// Pay out min(owed, requested) per token and reduce tokens_owed by exactly
// that much. Nothing owed -> {0, 0}.
TokenAmounts collect(PositionInfo& pos, const U128& requested0, const U128& requested1);

} // namespace position

// =============================================================================
// Position Book (one position per owner)
// =============================================================================

class PositionBook {
public:
    using Map = std::map<Address, PositionInfo>;

    // Creates a zero position on first access
    PositionInfo& get(const Address& owner) { return positions_[owner]; }

    // nullptr if the owner has never held a position
    PositionInfo* try_get(const Address& owner) {
        auto it = positions_.find(owner);
        return it != positions_.end() ? &it->second : nullptr;
    }

    std::optional<PositionInfo> find(const Address& owner) const {
        auto it = positions_.find(owner);
        return it != positions_.end() ? std::optional{it->second} : std::nullopt;
    }

    // Put back a prior value; nullopt removes the entry
    void restore(const Address& owner, const std::optional<PositionInfo>& prior) {
        if (prior) {
            positions_[owner] = *prior;
        } else {
            positions_.erase(owner);
        }
    }

    size_t size() const { return positions_.size(); }

    Map::const_iterator begin() const { return positions_.begin(); }
    Map::const_iterator end() const { return positions_.end(); }

private:
    Map positions_;
};

} // namespace rangepool

#endif // RANGEPOOL_POSITION_HPP
