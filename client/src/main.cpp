// rangepool-sim - replay a scenario against a single-range pool
//
// Builds an in-memory ledger, a factory and one pool from a JSON config,
// funds the scenario accounts, then runs each operation and prints the
// emitted events as JSON lines.

#include "rangepool/config.hpp"
#include "rangepool/factory.hpp"
#include "rangepool/log.hpp"
#include "rangepool/tick_math.hpp"
#include "rangepool/tokens.hpp"

#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using json = nlohmann::json;
using namespace rangepool;

namespace {

constexpr Address FACTORY_ADDRESS = address_from_u64(0xfac7041);

struct Options {
    std::string config_path;
    std::string scenario_path;
    std::optional<std::string> log_level;
};

void print_usage(const char* prog) {
    std::cout << "rangepool-sim - single-range AMM scenario replay\n\n"
              << "Usage: " << prog << " --config <pool.json> --scenario <scenario.json> [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>     Pool configuration (JSON)\n"
              << "  -s, --scenario <file>   Accounts and operations to replay (JSON)\n"
              << "  -l, --log-level <lvl>   trace|debug|info|warning|error|fatal|off\n"
              << "  -h, --help              Show this help message\n\n"
              << "Example:\n"
              << "  " << prog << " -c client/scenarios/pool.json -s client/scenarios/basic.json\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            opts.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--scenario") {
            if (i + 1 >= argc) {
                std::cerr << "Missing scenario argument\n";
                std::exit(1);
            }
            opts.scenario_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level argument\n";
                std::exit(1);
            }
            opts.log_level = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (opts.config_path.empty() || opts.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return opts;
}

json load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw PoolError(ErrorCode::INVALID_CONFIG, "cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        throw PoolError(ErrorCode::INVALID_CONFIG, "malformed JSON in " + path);
    }
    return j;
}

Address address_field(const json& op, const char* field) {
    if (!op.contains(field) || !op.at(field).is_string()) {
        throw PoolError(ErrorCode::INVALID_CONFIG, std::string("missing address '") + field + "'");
    }
    return parse_address(op.at(field).get<std::string>());
}

U128 u128_field(const json& op, const char* field) {
    if (!op.contains(field)) {
        throw PoolError(ErrorCode::INVALID_CONFIG, std::string("missing amount '") + field + "'");
    }
    U256 v = parse_u256(op.at(field), field);
    if (v > U256(U128_MAX)) {
        throw PoolError(ErrorCode::INVALID_CONFIG, std::string("'") + field + "' exceeds 128 bits");
    }
    return U128(v);
}

// Limit from "sqrt_price_limit" or "limit_tick", else the widest legal limit
U256 swap_limit(const json& op, bool zero_for_one) {
    if (op.contains("sqrt_price_limit")) {
        return parse_u256(op.at("sqrt_price_limit"), "sqrt_price_limit");
    }
    if (op.contains("limit_tick")) {
        return tick_math::get_sqrt_ratio_at_tick(parse_tick(op.at("limit_tick"), "limit_tick"));
    }
    return zero_for_one ? tick_math::MIN_SQRT_RATIO + 1 : tick_math::MAX_SQRT_RATIO - 1;
}

void run_operation(RangePool& pool, TokenLedger& ledger, const json& op) {
    std::string kind = op.value("op", "");

    if (kind == "mint") {
        Address sender = address_field(op, "sender");
        Address recipient = op.contains("recipient") ? address_field(op, "recipient") : sender;
        LedgerPayer payer(ledger, sender, pool.address(), pool.token0(), pool.token1());
        pool.mint(sender, recipient, u128_field(op, "amount"), payer);
    } else if (kind == "burn") {
        pool.burn(address_field(op, "owner"), u128_field(op, "amount"));
    } else if (kind == "collect") {
        Address owner = address_field(op, "owner");
        Address recipient = op.contains("recipient") ? address_field(op, "recipient") : owner;
        U128 req0 = op.contains("amount0") ? u128_field(op, "amount0") : U128_MAX;
        U128 req1 = op.contains("amount1") ? u128_field(op, "amount1") : U128_MAX;
        pool.collect(owner, recipient, req0, req1);
    } else if (kind == "swap") {
        Address sender = address_field(op, "sender");
        Address recipient = op.contains("recipient") ? address_field(op, "recipient") : sender;
        bool zero_for_one = op.value("zero_for_one", true);
        if (!op.contains("amount_specified")) {
            throw PoolError(ErrorCode::INVALID_CONFIG, "missing amount 'amount_specified'");
        }
        SwapParams params{
            zero_for_one,
            parse_i256(op.at("amount_specified"), "amount_specified"),
            swap_limit(op, zero_for_one)
        };
        LedgerPayer payer(ledger, sender, pool.address(), pool.token0(), pool.token1());
        pool.swap(sender, recipient, params, payer);
    } else {
        throw PoolError(ErrorCode::INVALID_CONFIG, "unknown operation '" + kind + "'");
    }
}

void print_events(const RangePool& pool, size_t from) {
    const auto& entries = pool.events().entries();
    for (size_t i = from; i < entries.size(); ++i) {
        std::cout << event_to_json(entries[i]).dump() << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    TokenLedger ledger;
    PoolFactory factory(FACTORY_ADDRESS, ledger);
    RangePool* pool = nullptr;
    json scenario;

    try {
        PoolConfig config = PoolConfig::from_file(opts.config_path);
        log::init(opts.log_level.value_or(config.log_level));

        pool = &factory.create_pool(config.token0, config.token1, config.fee,
                                    config.tick_lower, config.tick_upper);
        pool->initialize(config.initial_sqrt_price());

        scenario = load_json(opts.scenario_path);
        if (!scenario.is_object() || !scenario.contains("operations") ||
            !scenario.at("operations").is_array()) {
            throw PoolError(ErrorCode::INVALID_CONFIG, "scenario needs an 'operations' array");
        }

        // Fund accounts
        for (const json& account : scenario.value("accounts", json::array())) {
            Address addr = address_field(account, "address");
            if (account.contains("token0")) {
                ledger.credit(pool->token0(), addr, parse_u256(account.at("token0"), "token0"));
            }
            if (account.contains("token1")) {
                ledger.credit(pool->token1(), addr, parse_u256(account.at("token1"), "token1"));
            }
        }
    } catch (const PoolError& e) {
        std::cerr << "Setup failed [" << to_string(e.code()) << "]: " << e.what() << "\n";
        return 1;
    }

    print_events(*pool, 0);

    size_t index = 0;
    size_t failed = 0;
    for (const json& op : scenario.at("operations")) {
        size_t seen = pool->events().size();
        try {
            ledger.transact([&] { run_operation(*pool, ledger, op); });
        } catch (const PoolError& e) {
            ++failed;
            BOOST_LOG_TRIVIAL(warning) << "operation " << index << " (" << op.value("op", "?")
                                       << ") failed [" << to_string(e.code()) << "]: " << e.what();
        } catch (const json::exception& e) {
            ++failed;
            BOOST_LOG_TRIVIAL(warning) << "operation " << index << " malformed: " << e.what();
        }
        print_events(*pool, seen);
        ++index;
    }

    BOOST_LOG_TRIVIAL(info) << "replayed " << index << " operations, " << failed << " failed";
    return 0;
}
