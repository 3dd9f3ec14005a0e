#ifndef RANGEPOOL_CALLBACKS_HPP
#define RANGEPOOL_CALLBACKS_HPP

#include <vector>

#include "types.hpp"

namespace rangepool {

// =============================================================================
// Payment Callbacks
// =============================================================================

// Invoked by RangePool::mint after state is updated. The implementation must
// transfer at least amount0/amount1 to the pool before returning; the pool
// verifies its own balances afterwards.
class IMintCallback {
public:
    virtual ~IMintCallback() = default;

    virtual void on_mint(const U256& amount0, const U256& amount1,
                         const std::vector<uint8_t>& data) = 0;
};

// Invoked by RangePool::swap after the output token has been sent.
// A positive amount is owed to the pool.
class ISwapCallback {
public:
    virtual ~ISwapCallback() = default;

    virtual void on_swap(const I256& amount0, const I256& amount1,
                         const std::vector<uint8_t>& data) = 0;
};

} // namespace rangepool

#endif // RANGEPOOL_CALLBACKS_HPP
