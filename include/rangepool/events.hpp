#ifndef RANGEPOOL_EVENTS_HPP
#define RANGEPOOL_EVENTS_HPP

#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Pool Events
// =============================================================================

struct InitializeEvent {
    U256 sqrt_price_x96;
    int32_t tick;
};

struct MintEvent {
    Address sender;
    Address owner;
    U128 amount;
    U256 amount0;
    U256 amount1;
};

struct BurnEvent {
    Address owner;
    U128 amount;
    U256 amount0;
    U256 amount1;
};

struct CollectEvent {
    Address owner;
    Address recipient;
    U256 amount0;
    U256 amount1;
};

struct SwapEvent {
    Address sender;
    Address recipient;
    I256 amount0;
    I256 amount1;
    U256 sqrt_price_x96;
    U128 liquidity;
    int32_t tick;
};

using PoolEvent = std::variant<InitializeEvent, MintEvent, BurnEvent, CollectEvent, SwapEvent>;

void to_json(nlohmann::json& j, const InitializeEvent& e);
void to_json(nlohmann::json& j, const MintEvent& e);
void to_json(nlohmann::json& j, const BurnEvent& e);
void to_json(nlohmann::json& j, const CollectEvent& e);
void to_json(nlohmann::json& j, const SwapEvent& e);

// {"event": "<Name>", ...fields}
nlohmann::json event_to_json(const PoolEvent& event);

// "Initialize", "Mint", ...
const char* event_name(const PoolEvent& event);

// =============================================================================
// Event Log
// =============================================================================

class EventLog {
public:
    void append(PoolEvent event) { entries_.push_back(std::move(event)); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const PoolEvent& at(size_t i) const { return entries_.at(i); }
    const std::vector<PoolEvent>& entries() const { return entries_; }

    // Drop everything after the first `n` entries (rollback only)
    void truncate(size_t n) {
        if (n < entries_.size()) entries_.resize(n);
    }

private:
    std::vector<PoolEvent> entries_;
};

} // namespace rangepool

#endif // RANGEPOOL_EVENTS_HPP
