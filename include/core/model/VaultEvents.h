#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace stratvault {
namespace core {

enum class VaultEventType {
    STRATEGY_CREATED,
    STATUS_CHANGED,
    INVESTED,
    WITHDRAWN,
    REBALANCED,
    GRID_ORDER_FILLED,
    DCA_EXECUTED,
    ARBITRAGE_EXECUTED,
    EMERGENCY_STOPPED,
    SETTLEMENT_FAILED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    EpochSeconds ts = 0;
    VaultEventType type = VaultEventType::REBALANCED;
    StrategyId strategy_id = 0;
    std::string entity_id;
    nlohmann::json payload;
};

const char* toString(VaultEventType type);
std::optional<VaultEventType> eventTypeFromString(const std::string& value);

// Journal line layout: {"seq", "ts", "type", "strategy_id", "entity_id", "payload"}.
// from_json throws on a missing seq or an unknown event type.
void to_json(nlohmann::json& j, const JournalEvent& event);
void from_json(const nlohmann::json& j, JournalEvent& event);

} // namespace core
} // namespace stratvault
