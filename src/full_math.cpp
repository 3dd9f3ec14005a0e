// =============================================================================
// full_math.cpp - 512-bit intermediate mul_div with directional rounding
// =============================================================================

#include "rangepool/full_math.hpp"

namespace rangepool {
namespace full_math {

namespace {

const U512 U256_MAX_WIDE = U512(std::numeric_limits<U256>::max());

[[noreturn]] void overflow(const char* what) {
    throw PoolError(ErrorCode::ARITHMETIC_OVERFLOW, std::string("full_math: ") + what);
}

} // anonymous namespace

U256 mul_div(const U256& a, const U256& b, const U256& denominator) {
    if (denominator == 0) overflow("mul_div by zero");

    U512 product = U512(a) * U512(b);
    U512 result = product / U512(denominator);
    if (result > U256_MAX_WIDE) overflow("mul_div result exceeds 256 bits");

    return U256(result);
}

U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator) {
    if (denominator == 0) overflow("mul_div_rounding_up by zero");

    U512 product = U512(a) * U512(b);
    U512 wide_denominator = U512(denominator);
    U512 result = product / wide_denominator;
    if (product % wide_denominator != 0) {
        result += 1;
    }
    if (result > U256_MAX_WIDE) overflow("mul_div_rounding_up result exceeds 256 bits");

    return U256(result);
}

U256 div_rounding_up(const U256& x, const U256& y) {
    if (y == 0) overflow("div_rounding_up by zero");

    U256 result = x / y;
    if (x % y != 0) {
        result += 1;
    }
    return result;
}

U128 to_u128(const U256& x) {
    if (x > U256(U128_MAX)) overflow("value exceeds 128 bits");
    return U128(x);
}

} // namespace full_math
} // namespace rangepool
