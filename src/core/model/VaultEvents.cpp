#include "core/model/VaultEvents.h"

#include <stdexcept>

namespace stratvault {
namespace core {

const char* toString(VaultEventType type) {
    switch (type) {
        case VaultEventType::STRATEGY_CREATED: return "StrategyCreated";
        case VaultEventType::STATUS_CHANGED: return "StatusChanged";
        case VaultEventType::INVESTED: return "Invested";
        case VaultEventType::WITHDRAWN: return "Withdrawn";
        case VaultEventType::REBALANCED: return "Rebalanced";
        case VaultEventType::GRID_ORDER_FILLED: return "GridOrderFilled";
        case VaultEventType::DCA_EXECUTED: return "DCAExecuted";
        case VaultEventType::ARBITRAGE_EXECUTED: return "ArbitrageExecuted";
        case VaultEventType::EMERGENCY_STOPPED: return "EmergencyStopped";
        case VaultEventType::SETTLEMENT_FAILED: return "SettlementFailed";
    }
    return "Rebalanced";
}

std::optional<VaultEventType> eventTypeFromString(const std::string& value) {
    if (value == "StrategyCreated") return VaultEventType::STRATEGY_CREATED;
    if (value == "StatusChanged") return VaultEventType::STATUS_CHANGED;
    if (value == "Invested") return VaultEventType::INVESTED;
    if (value == "Withdrawn") return VaultEventType::WITHDRAWN;
    if (value == "Rebalanced") return VaultEventType::REBALANCED;
    if (value == "GridOrderFilled") return VaultEventType::GRID_ORDER_FILLED;
    if (value == "DCAExecuted") return VaultEventType::DCA_EXECUTED;
    if (value == "ArbitrageExecuted") return VaultEventType::ARBITRAGE_EXECUTED;
    if (value == "EmergencyStopped") return VaultEventType::EMERGENCY_STOPPED;
    if (value == "SettlementFailed") return VaultEventType::SETTLEMENT_FAILED;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const JournalEvent& event) {
    j = nlohmann::json{
        {"seq", event.seq},
        {"ts", event.ts},
        {"type", toString(event.type)},
        {"strategy_id", event.strategy_id},
        {"entity_id", event.entity_id},
        {"payload", event.payload.is_null() ? nlohmann::json::object() : event.payload}
    };
}

void from_json(const nlohmann::json& j, JournalEvent& event) {
    const std::string type_name = j.at("type").get<std::string>();
    const auto type = eventTypeFromString(type_name);
    if (!type) {
        throw std::invalid_argument("unknown event type " + type_name);
    }
    event.seq = j.at("seq").get<std::uint64_t>();
    event.ts = j.value("ts", static_cast<EpochSeconds>(0));
    event.type = *type;
    event.strategy_id = j.value("strategy_id", static_cast<StrategyId>(0));
    event.entity_id = j.value("entity_id", std::string());
    event.payload = j.value("payload", nlohmann::json::object());
}

} // namespace core
} // namespace stratvault
