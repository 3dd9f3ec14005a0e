#ifndef RANGEPOOL_DEPLOYER_HPP
#define RANGEPOOL_DEPLOYER_HPP

#include <memory>
#include <optional>

#include "types.hpp"

namespace rangepool {

class ITokens;
class RangePool;

// =============================================================================
// Deployment Parameters
// =============================================================================

// Handed to RangePool's constructor out-of-band while a deployment runs
struct PoolParameters {
    Address factory;
    Address pool;
    Currency token0;
    Currency token1;
    uint32_t fee;
    int32_t tick_lower;
    int32_t tick_upper;
};

// 20-byte pool address derived from the deployer address, the key salt and a
// fixed code hash. Deterministic, no dependence on deployment order.
Address compute_pool_address(const Address& deployer, const PoolKey& key);

// =============================================================================
// PoolDeployer
// =============================================================================

class PoolDeployer {
public:
    PoolDeployer(const Address& address, ITokens& tokens);
    virtual ~PoolDeployer() = default;

    PoolDeployer(const PoolDeployer&) = delete;
    PoolDeployer& operator=(const PoolDeployer&) = delete;

    const Address& address() const { return address_; }
    ITokens& tokens() const { return tokens_; }

    // Throws PoolError(NOT_INITIALIZED) outside a deployment
    const PoolParameters& parameters() const;
    bool deploying() const { return parameters_.has_value(); }

    // Publish `key` as parameters, construct the pool, then clear them.
    // The pool address is compute_pool_address(address(), key).
    std::unique_ptr<RangePool> deploy(const PoolKey& key);

private:
    Address address_;
    ITokens& tokens_;
    std::optional<PoolParameters> parameters_;
};

} // namespace rangepool

#endif // RANGEPOOL_DEPLOYER_HPP
