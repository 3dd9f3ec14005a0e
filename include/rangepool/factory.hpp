#ifndef RANGEPOOL_FACTORY_HPP
#define RANGEPOOL_FACTORY_HPP

#include <memory>
#include <unordered_map>

#include "deployer.hpp"
#include "pool.hpp"

namespace rangepool {

// =============================================================================
// PoolFactory - creates and owns pools, one per key
// =============================================================================

class PoolFactory : public PoolDeployer {
public:
    PoolFactory(const Address& address, ITokens& tokens) : PoolDeployer(address, tokens) {}

    // Tokens may come in either order. Throws INVALID_CURRENCY, INVALID_FEE,
    // INVALID_TICK_RANGE or POOL_ALREADY_EXISTS.
    RangePool& create_pool(const Currency& token_a, const Currency& token_b, uint32_t fee,
                           int32_t tick_lower, int32_t tick_upper);

    // nullptr if no such pool; token order does not matter
    RangePool* get_pool(const Currency& token_a, const Currency& token_b, uint32_t fee,
                        int32_t tick_lower, int32_t tick_upper) const;

    size_t pool_count() const { return pools_.size(); }

private:
    std::unordered_map<uint64_t, std::unique_ptr<RangePool>> pools_;  // key.id() -> pool
};

// Sorted key for a token pair
PoolKey make_pool_key(const Currency& token_a, const Currency& token_b, uint32_t fee,
                      int32_t tick_lower, int32_t tick_upper);

} // namespace rangepool

#endif // RANGEPOOL_FACTORY_HPP
