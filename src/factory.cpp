// =============================================================================
// factory.cpp - Pool creation and lookup
// =============================================================================

#include "rangepool/factory.hpp"
#include "rangepool/tick_math.hpp"

#include <boost/log/trivial.hpp>

namespace rangepool {

PoolKey make_pool_key(const Currency& token_a, const Currency& token_b, uint32_t fee,
                      int32_t tick_lower, int32_t tick_upper) {
    bool sorted = token_a < token_b;
    return PoolKey{
        sorted ? token_a : token_b,
        sorted ? token_b : token_a,
        fee,
        tick_lower,
        tick_upper
    };
}

RangePool& PoolFactory::create_pool(const Currency& token_a, const Currency& token_b, uint32_t fee,
                                    int32_t tick_lower, int32_t tick_upper) {
    if (token_a == token_b) {
        throw PoolError(ErrorCode::INVALID_CURRENCY, "PoolFactory: identical tokens");
    }

    PoolKey key = make_pool_key(token_a, token_b, fee, tick_lower, tick_upper);

    if (key.currency0.is_zero()) {
        throw PoolError(ErrorCode::INVALID_CURRENCY, "PoolFactory: zero token address");
    }
    if (fee >= fees::FEE_DENOMINATOR) {
        throw PoolError(ErrorCode::INVALID_FEE, "PoolFactory: fee " + std::to_string(fee) + " >= 1e6");
    }
    if (tick_lower >= tick_upper || tick_lower < tick_math::MIN_TICK || tick_upper > tick_math::MAX_TICK) {
        throw PoolError(ErrorCode::INVALID_TICK_RANGE,
                        "PoolFactory: invalid range [" + std::to_string(tick_lower) + ", " +
                        std::to_string(tick_upper) + ")");
    }

    uint64_t id = key.id();
    auto it = pools_.find(id);
    if (it != pools_.end() && it->second->key() == key) {
        throw PoolError(ErrorCode::POOL_ALREADY_EXISTS,
                        "PoolFactory: pool exists at " + to_hex(it->second->address()));
    }
    if (it != pools_.end()) {
        // Distinct key with the same salt would collide on address too
        throw PoolError(ErrorCode::POOL_ALREADY_EXISTS, "PoolFactory: pool key salt collision");
    }

    std::unique_ptr<RangePool> pool = deploy(key);
    RangePool& ref = *pool;
    pools_.emplace(id, std::move(pool));

    BOOST_LOG_TRIVIAL(info) << "PoolFactory created pool " << to_hex(ref.address())
                            << " token0=" << to_hex(key.currency0.addr)
                            << " token1=" << to_hex(key.currency1.addr)
                            << " fee=" << fee << " range=[" << tick_lower << ", " << tick_upper << ")";
    return ref;
}

RangePool* PoolFactory::get_pool(const Currency& token_a, const Currency& token_b, uint32_t fee,
                                 int32_t tick_lower, int32_t tick_upper) const {
    PoolKey key = make_pool_key(token_a, token_b, fee, tick_lower, tick_upper);
    auto it = pools_.find(key.id());
    if (it == pools_.end() || !(it->second->key() == key)) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace rangepool
