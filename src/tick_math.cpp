// =============================================================================
// tick_math.cpp - Exact tick <-> sqrt price conversion
// =============================================================================

#include "rangepool/tick_math.hpp"

namespace rangepool {
namespace tick_math {

namespace {

// 2^128 / sqrt(1.0001)^(2^i) for i = 1..19, as Q128.128
const std::array<U256, 19>& ratio_multipliers() {
    static const std::array<U256, 19> multipliers = {
        U256("0xfff97272373d413259a46990580e213a"),
        U256("0xfff2e50f5f656932ef12357cf3c7fdcc"),
        U256("0xffe5caca7e10e4e61c3624eaa0941cd0"),
        U256("0xffcb9843d60f6159c9db58835c926644"),
        U256("0xff973b41fa98c081472e6896dfb254c0"),
        U256("0xff2ea16466c96a3843ec78b326b52861"),
        U256("0xfe5dee046a99a2a811c461f1969c3053"),
        U256("0xfcbe86c7900a88aedcffc83b479aa3a4"),
        U256("0xf987a7253ac413176f2b074cf7815e54"),
        U256("0xf3392b0822b70005940c7a398e4b70f3"),
        U256("0xe7159475a2c29b7443b29c7fa6e889d9"),
        U256("0xd097f3bdfd2022b8845ad8f792aa5825"),
        U256("0xa9f746462d870fdf8a65dc1f90e061e5"),
        U256("0x70d869a156d2a1b890bb3df62baf32f7"),
        U256("0x31be135f97d08fd981231505542fcfa6"),
        U256("0x9aa508b5b7a84e1c677de54f3e99bc9"),
        U256("0x5d6af8dedb81196699c329225ee604"),
        U256("0x2216e584f5fa1ea926041bedfe98"),
        U256("0x48a170391f7dc42444e8fa2")
    };
    return multipliers;
}

} // anonymous namespace

U256 get_sqrt_ratio_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw PoolError(ErrorCode::OUT_OF_BOUNDS,
                        "tick_math: tick " + std::to_string(tick) + " out of bounds");
    }

    uint32_t abs_tick = tick < 0
        ? static_cast<uint32_t>(-static_cast<int64_t>(tick))
        : static_cast<uint32_t>(tick);

    U256 ratio = (abs_tick & 0x1) != 0
        ? U256("0xfffcb933bd6fad37aa2d162d1a594001")
        : U256(1) << 128;

    const auto& multipliers = ratio_multipliers();
    for (size_t i = 0; i < multipliers.size(); ++i) {
        if ((abs_tick & (1u << (i + 1))) != 0) {
            ratio = (ratio * multipliers[i]) >> 128;
        }
    }

    // Positive ticks: invert the Q128.128 ratio
    if (tick > 0) {
        ratio = std::numeric_limits<U256>::max() / ratio;
    }

    // Q128.128 -> Q64.96, rounding up so get_tick_at_sqrt_ratio stays consistent
    U256 sqrt_price_x96 = ratio >> 32;
    if ((ratio & U256(0xFFFFFFFFULL)) != 0) {
        sqrt_price_x96 += 1;
    }
    return sqrt_price_x96;
}

int32_t get_tick_at_sqrt_ratio(const U256& sqrt_price_x96) {
    if (sqrt_price_x96 < MIN_SQRT_RATIO || sqrt_price_x96 >= MAX_SQRT_RATIO) {
        throw PoolError(ErrorCode::OUT_OF_BOUNDS,
                        "tick_math: sqrt price " + sqrt_price_x96.str() + " out of bounds");
    }

    // Invariant: ratio(lo) <= price < ratio(hi)
    int32_t lo = MIN_TICK;
    int32_t hi = MAX_TICK;
    while (hi - lo > 1) {
        int32_t mid = lo + (hi - lo) / 2;
        if (get_sqrt_ratio_at_tick(mid) <= sqrt_price_x96) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

} // namespace tick_math
} // namespace rangepool
