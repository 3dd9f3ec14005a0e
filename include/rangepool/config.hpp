#ifndef RANGEPOOL_CONFIG_HPP
#define RANGEPOOL_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace rangepool {

// =============================================================================
// PoolConfig - builder for a pool deployment
// =============================================================================
//
// JSON form:
//   {
//     "token0": "0x...", "token1": "0x...",
//     "fee": 3000, "tick_lower": -100, "tick_upper": 100,
//     "sqrt_price_x96": "79228162514264337593543950336",   (optional)
//     "initial_tick": 0,                                    (optional)
//     "log_level": "info"                                   (optional)
//   }

class PoolConfig {
public:
    Currency token0;
    Currency token1;
    uint32_t fee = fees::FEE_030;
    int32_t tick_lower = -100;
    int32_t tick_upper = 100;
    std::optional<U256> sqrt_price_x96;
    std::optional<int32_t> initial_tick;
    std::string log_level = "info";

    PoolConfig() = default;

    static PoolConfig create(const Currency& a, const Currency& b) {
        PoolConfig cfg;
        cfg.token0 = a;
        cfg.token1 = b;
        return cfg;
    }

    PoolConfig& with_fee(uint32_t f) {
        fee = f;
        return *this;
    }

    PoolConfig& with_range(int32_t lower, int32_t upper) {
        tick_lower = lower;
        tick_upper = upper;
        return *this;
    }

    PoolConfig& with_sqrt_price(const U256& price) {
        sqrt_price_x96 = price;
        return *this;
    }

    PoolConfig& with_initial_tick(int32_t tick) {
        initial_tick = tick;
        return *this;
    }

    PoolConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    // Explicit price, else price at initial_tick, else price at tick 0
    U256 initial_sqrt_price() const;

    // All loaders throw PoolError(INVALID_CONFIG)
    static PoolConfig from_json(const nlohmann::json& j);
    static PoolConfig from_string(std::string_view text);
    static PoolConfig from_file(std::string_view path);
};

// Decimal string or non-negative JSON integer; throws INVALID_CONFIG
U256 parse_u256(const nlohmann::json& value, std::string_view field);
I256 parse_i256(const nlohmann::json& value, std::string_view field);

// JSON integer within [MIN_TICK, MAX_TICK]; throws INVALID_CONFIG
int32_t parse_tick(const nlohmann::json& value, std::string_view field);

} // namespace rangepool

#endif // RANGEPOOL_CONFIG_HPP
