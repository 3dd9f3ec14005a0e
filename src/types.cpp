// =============================================================================
// types.cpp - Address helpers and error names
// =============================================================================

#include "rangepool/types.hpp"

namespace rangepool {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address parse_address(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw PoolError(ErrorCode::INVALID_CONFIG,
                        "parse_address: expected 40 hex digits, got " +
                        std::to_string(hex.size()));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw PoolError(ErrorCode::INVALID_CONFIG,
                            "parse_address: invalid hex digit in " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case ErrorCode::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case ErrorCode::INVALID_TICK_RANGE: return "INVALID_TICK_RANGE";
        case ErrorCode::INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case ErrorCode::INVALID_PRICE_LIMIT: return "INVALID_PRICE_LIMIT";
        case ErrorCode::INVALID_CURRENCY: return "INVALID_CURRENCY";
        case ErrorCode::POOL_ALREADY_EXISTS: return "POOL_ALREADY_EXISTS";
        case ErrorCode::INVALID_FEE: return "INVALID_FEE";
        case ErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorCode::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case ErrorCode::INSUFFICIENT_PAYMENT: return "INSUFFICIENT_PAYMENT";
        case ErrorCode::INSUFFICIENT_INPUT: return "INSUFFICIENT_INPUT";
        case ErrorCode::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case ErrorCode::OUT_OF_BOUNDS: return "OUT_OF_BOUNDS";
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
    }
    return "UNKNOWN";
}

} // namespace rangepool
