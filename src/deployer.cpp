// =============================================================================
// deployer.cpp - Out-of-band pool construction parameters
// =============================================================================

#include "rangepool/deployer.hpp"
#include "rangepool/pool.hpp"

namespace rangepool {

namespace {

// Stands in for the pool's init code hash in address derivation
constexpr uint64_t POOL_CODE_HASH = 0x52a7c1f3d94e6b08ULL;

// Clears the parameters however the pool constructor exits
class ParametersReset {
public:
    explicit ParametersReset(std::optional<PoolParameters>& params) : params_(params) {}
    ~ParametersReset() { params_.reset(); }

    ParametersReset(const ParametersReset&) = delete;
    ParametersReset& operator=(const ParametersReset&) = delete;

private:
    std::optional<PoolParameters>& params_;
};

} // anonymous namespace

Address compute_pool_address(const Address& deployer, const PoolKey& key) {
    uint64_t h = 0xff;
    for (uint8_t b : deployer) h = h * 31 + b;
    h = h * 31 + key.id();
    h = h * 31 + POOL_CODE_HASH;

    // Spread the 64-bit digest over 20 bytes
    Address addr{};
    uint64_t x = h;
    for (size_t i = 0; i < addr.size(); ++i) {
        x ^= x >> 33;
        x *= 0xff51afd7ed558ccdULL;
        x ^= x >> 29;
        addr[i] = static_cast<uint8_t>(x >> 56);
        x += h + i;
    }
    return addr;
}

PoolDeployer::PoolDeployer(const Address& address, ITokens& tokens)
    : address_(address), tokens_(tokens) {}

const PoolParameters& PoolDeployer::parameters() const {
    if (!parameters_) {
        throw PoolError(ErrorCode::NOT_INITIALIZED, "PoolDeployer: no deployment in progress");
    }
    return *parameters_;
}

std::unique_ptr<RangePool> PoolDeployer::deploy(const PoolKey& key) {
    parameters_ = PoolParameters{
        address_,
        compute_pool_address(address_, key),
        key.currency0,
        key.currency1,
        key.fee,
        key.tick_lower,
        key.tick_upper
    };
    ParametersReset reset(parameters_);

    return std::make_unique<RangePool>(*this);
}

} // namespace rangepool
