#pragma once

#include "common/Types.h"
#include "core/model/VaultEvents.h"

#include <string>
#include <vector>

namespace stratvault {
namespace strategy {

// Outcome of one engine pass. Events are published only after the pass
// has been committed to the ledger.
struct RebalanceReport {
    StrategyId strategy_id = 0;
    StrategyType type = StrategyType::GRID_TRADING;
    bool skipped = false;           // section was held; scheduler retries next tick
    bool traded = false;
    std::string action;
    int trades = 0;
    int fills = 0;
    int execution_failures = 0;
    Amount volume = 0;
    Amount realized_pnl = 0;
    Price reference_price = 0.0;
    bool status_changed = false;
    StrategyStatus status_after = StrategyStatus::ACTIVE;
    std::vector<core::JournalEvent> events;

    void addEvent(core::VaultEventType type_, EpochSeconds ts, const std::string& entity,
                  nlohmann::json payload) {
        core::JournalEvent e;
        e.ts = ts;
        e.type = type_;
        e.strategy_id = strategy_id;
        e.entity_id = entity;
        e.payload = std::move(payload);
        events.push_back(std::move(e));
    }
};

} // namespace strategy
} // namespace stratvault
