#pragma once

#include "common/Errors.h"
#include "core/contracts/IExecutionPort.h"
#include "ledger/LedgerStore.h"
#include "strategy/RebalanceReport.h"

#include <memory>
#include <string>

namespace stratvault {
namespace strategy {

// Executes a detected cross-venue spread once, inside its validity window.
// The opportunity record is consumed by the lookup, so a stale or failed
// quote is never retried.
class ArbitrageExecutor {
public:
    ArbitrageExecutor(ledger::LedgerStore& ledger,
                      std::shared_ptr<core::IExecutionPort> execution,
                      EpochSeconds validity_window_sec);

    OpResult execute(const std::string& opportunity_id, ledger::StrategyBook& book,
                     EpochSeconds now, RebalanceReport& report) const;

    static bool isExpired(const ArbitrageOpportunity& opportunity, EpochSeconds now,
                          EpochSeconds window_sec) {
        return now > opportunity.timestamp + window_sec;
    }

    EpochSeconds validityWindow() const { return validity_window_sec_; }

private:
    ledger::LedgerStore& ledger_;
    std::shared_ptr<core::IExecutionPort> execution_;
    EpochSeconds validity_window_sec_;
};

} // namespace strategy
} // namespace stratvault
