// =============================================================================
// config.cpp - JSON pool configuration
// =============================================================================

#include "rangepool/config.hpp"
#include "rangepool/log.hpp"
#include "rangepool/tick_math.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace rangepool {

namespace {

[[noreturn]] void config_error(const std::string& msg) {
    throw PoolError(ErrorCode::INVALID_CONFIG, "PoolConfig: " + msg);
}

const nlohmann::json& require(const nlohmann::json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end()) config_error(std::string("missing field '") + field + "'");
    return *it;
}

Currency parse_token(const nlohmann::json& j, const char* field) {
    const nlohmann::json& v = require(j, field);
    if (!v.is_string()) config_error(std::string("'") + field + "' must be a hex string");
    return Currency(parse_address(v.get<std::string>()));
}

bool all_digits(const std::string& s, size_t from) {
    if (s.size() <= from) return false;
    for (size_t i = from; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

} // anonymous namespace

U256 parse_u256(const nlohmann::json& value, std::string_view field) {
    if (value.is_number_unsigned()) return U256(value.get<uint64_t>());
    if (value.is_number_integer() && value.get<int64_t>() >= 0) return U256(value.get<int64_t>());
    if (value.is_string()) {
        const std::string s = value.get<std::string>();
        // 78 digits is already past 2^256
        if (all_digits(s, 0) && s.size() <= 78) {
            boost::multiprecision::cpp_int v(s);
            if (v <= boost::multiprecision::cpp_int(std::numeric_limits<U256>::max())) {
                return U256(v);
            }
        }
    }
    config_error("'" + std::string(field) + "' is not an unsigned 256-bit integer");
}

I256 parse_i256(const nlohmann::json& value, std::string_view field) {
    if (value.is_number_integer()) return I256(value.get<int64_t>());
    if (value.is_string()) {
        const std::string s = value.get<std::string>();
        size_t from = (!s.empty() && s[0] == '-') ? 1 : 0;
        if (all_digits(s, from) && s.size() <= 78) {
            boost::multiprecision::cpp_int v(s);
            if (v <= boost::multiprecision::cpp_int(std::numeric_limits<I256>::max()) &&
                v >= boost::multiprecision::cpp_int(std::numeric_limits<I256>::min())) {
                return I256(v);
            }
        }
    }
    config_error("'" + std::string(field) + "' is not a signed 256-bit integer");
}

int32_t parse_tick(const nlohmann::json& value, std::string_view field) {
    const std::string name(field);
    if (value.is_number_unsigned()) {
        // Values above INT64_MAX would wrap in get<int64_t>()
        uint64_t t = value.get<uint64_t>();
        if (t > static_cast<uint64_t>(tick_math::MAX_TICK)) {
            config_error("'" + name + "' out of range: " + std::to_string(t));
        }
        return static_cast<int32_t>(t);
    }
    if (!value.is_number_integer()) config_error("'" + name + "' must be an integer");
    int64_t t = value.get<int64_t>();
    if (t < tick_math::MIN_TICK || t > tick_math::MAX_TICK) {
        config_error("'" + name + "' out of range: " + std::to_string(t));
    }
    return static_cast<int32_t>(t);
}

U256 PoolConfig::initial_sqrt_price() const {
    if (sqrt_price_x96) return *sqrt_price_x96;
    return tick_math::get_sqrt_ratio_at_tick(initial_tick.value_or(0));
}

PoolConfig PoolConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) config_error("top level must be an object");

    PoolConfig cfg;
    cfg.token0 = parse_token(j, "token0");
    cfg.token1 = parse_token(j, "token1");

    if (j.contains("fee")) {
        const nlohmann::json& f = j.at("fee");
        if (!f.is_number_unsigned() || f.get<uint64_t>() >= fees::FEE_DENOMINATOR) {
            config_error("'fee' must be an integer below 1000000");
        }
        cfg.fee = static_cast<uint32_t>(f.get<uint64_t>());
    }

    cfg.tick_lower = parse_tick(require(j, "tick_lower"), "tick_lower");
    cfg.tick_upper = parse_tick(require(j, "tick_upper"), "tick_upper");
    if (cfg.tick_lower >= cfg.tick_upper) {
        config_error("tick_lower must be below tick_upper");
    }

    if (j.contains("sqrt_price_x96")) {
        cfg.sqrt_price_x96 = parse_u256(j.at("sqrt_price_x96"), "sqrt_price_x96");
    }
    if (j.contains("initial_tick")) {
        cfg.initial_tick = parse_tick(j.at("initial_tick"), "initial_tick");
    }

    if (j.contains("log_level")) {
        const nlohmann::json& l = j.at("log_level");
        if (!l.is_string()) config_error("'log_level' must be a string");
        cfg.log_level = l.get<std::string>();
        if (cfg.log_level != "off") {
            // Throws INVALID_CONFIG on unknown names
            log::parse_level(cfg.log_level);
        }
    }

    return cfg;
}

PoolConfig PoolConfig::from_string(std::string_view text) {
    nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) config_error("malformed JSON");
    return from_json(j);
}

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str(path);
    std::ifstream file(path_str);
    if (!file) {
        config_error("cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

} // namespace rangepool
