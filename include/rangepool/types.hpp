#ifndef RANGEPOOL_TYPES_HPP
#define RANGEPOOL_TYPES_HPP

#include <cstdint>
#include <array>
#include <limits>
#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace rangepool {

// =============================================================================
// Fixed-Width Integers
// =============================================================================

using U128 = boost::multiprecision::uint128_t;
using I128 = boost::multiprecision::int128_t;
using U256 = boost::multiprecision::uint256_t;
using I256 = boost::multiprecision::int256_t;
using U512 = boost::multiprecision::uint512_t;

// Q64.96 and Q128.128 scaling factors
inline const U256 Q96 = U256(1) << 96;
inline const U256 Q128 = U256(1) << 128;

inline const U128 U128_MAX = std::numeric_limits<U128>::max();
inline const U256 U160_MAX = (U256(1) << 160) - 1;

// =============================================================================
// Addresses (EVM-style 20-byte identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Helper to create an address whose low bytes hold `n`
constexpr Address address_from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" followed by 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x"; throws PoolError(INVALID_CONFIG) on bad input
Address parse_address(std::string_view hex);

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_zero() const { return is_zero_address(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Fee Tiers (hundredths of a bip)
// =============================================================================

namespace fees {
constexpr uint32_t FEE_005 = 500;       // 0.05%
constexpr uint32_t FEE_030 = 3000;      // 0.30%
constexpr uint32_t FEE_100 = 10000;     // 1.00%
constexpr uint32_t FEE_DENOMINATOR = 1000000;
}

// =============================================================================
// Amounts
// =============================================================================

// Signed token amounts from the trader's point of view:
// positive = owed to the pool, negative = paid out by the pool
struct BalanceDelta {
    I256 amount0;
    I256 amount1;

    bool operator==(const BalanceDelta& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
};

// Unsigned per-token amounts (mint, burn, collect)
struct TokenAmounts {
    U256 amount0;
    U256 amount1;

    bool operator==(const TokenAmounts& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
};

// =============================================================================
// Swap Parameters
// =============================================================================

struct SwapParams {
    bool zero_for_one;       // true = sell token0 for token1
    I256 amount_specified;   // positive = exact input, negative = exact output
    U256 sqrt_price_limit;   // Q64.96, must lie strictly beyond the current price
};

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;
    int32_t tick_lower;
    int32_t tick_upper;

    // Salt used for address derivation and factory lookup
    uint64_t id() const {
        uint64_t h = 0;
        for (auto b : currency0.addr) h = h * 31 + b;
        for (auto b : currency1.addr) h = h * 31 + b;
        h = h * 31 + fee;
        h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_lower));
        h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_upper));
        return h;
    }

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_lower == other.tick_lower &&
               tick_upper == other.tick_upper;
    }
};

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,
    NOT_INITIALIZED = -1,
    ALREADY_INITIALIZED = -2,
    INVALID_TICK_RANGE = -3,
    INSUFFICIENT_LIQUIDITY = -4,
    INVALID_PRICE_LIMIT = -5,
    INVALID_CURRENCY = -6,
    POOL_ALREADY_EXISTS = -7,
    INVALID_FEE = -8,
    INVALID_AMOUNT = -9,
    INSUFFICIENT_BALANCE = -10,
    INSUFFICIENT_PAYMENT = -11,
    INSUFFICIENT_INPUT = -12,
    ARITHMETIC_OVERFLOW = -20,
    OUT_OF_BOUNDS = -21,
    INVALID_CONFIG = -40
};

const char* to_string(ErrorCode code);

class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace rangepool

#endif // RANGEPOOL_TYPES_HPP
