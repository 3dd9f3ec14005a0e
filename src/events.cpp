// =============================================================================
// events.cpp - JSON form of pool events
// =============================================================================

#include "rangepool/events.hpp"

#include <nlohmann/json.hpp>

namespace rangepool {

// Big integers go out as decimal strings, addresses as 0x hex

void to_json(nlohmann::json& j, const InitializeEvent& e) {
    j = nlohmann::json{
        {"sqrt_price_x96", e.sqrt_price_x96.str()},
        {"tick", e.tick}
    };
}

void to_json(nlohmann::json& j, const MintEvent& e) {
    j = nlohmann::json{
        {"sender", to_hex(e.sender)},
        {"owner", to_hex(e.owner)},
        {"amount", e.amount.str()},
        {"amount0", e.amount0.str()},
        {"amount1", e.amount1.str()}
    };
}

void to_json(nlohmann::json& j, const BurnEvent& e) {
    j = nlohmann::json{
        {"owner", to_hex(e.owner)},
        {"amount", e.amount.str()},
        {"amount0", e.amount0.str()},
        {"amount1", e.amount1.str()}
    };
}

void to_json(nlohmann::json& j, const CollectEvent& e) {
    j = nlohmann::json{
        {"owner", to_hex(e.owner)},
        {"recipient", to_hex(e.recipient)},
        {"amount0", e.amount0.str()},
        {"amount1", e.amount1.str()}
    };
}

void to_json(nlohmann::json& j, const SwapEvent& e) {
    j = nlohmann::json{
        {"sender", to_hex(e.sender)},
        {"recipient", to_hex(e.recipient)},
        {"amount0", e.amount0.str()},
        {"amount1", e.amount1.str()},
        {"sqrt_price_x96", e.sqrt_price_x96.str()},
        {"liquidity", e.liquidity.str()},
        {"tick", e.tick}
    };
}

namespace {

struct NameVisitor {
    const char* operator()(const InitializeEvent&) const { return "Initialize"; }
    const char* operator()(const MintEvent&) const { return "Mint"; }
    const char* operator()(const BurnEvent&) const { return "Burn"; }
    const char* operator()(const CollectEvent&) const { return "Collect"; }
    const char* operator()(const SwapEvent&) const { return "Swap"; }
};

} // anonymous namespace

const char* event_name(const PoolEvent& event) {
    return std::visit(NameVisitor{}, event);
}

nlohmann::json event_to_json(const PoolEvent& event) {
    nlohmann::json j = std::visit([](const auto& e) { return nlohmann::json(e); }, event);
    j["event"] = event_name(event);
    return j;
}

} // namespace rangepool
