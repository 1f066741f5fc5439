#pragma once

#include "common/Errors.h"
#include "core/contracts/IExecutionPort.h"
#include "core/contracts/IPriceFeed.h"
#include "ledger/StrategyBook.h"
#include "strategy/RebalanceReport.h"

#include <memory>

namespace stratvault {
namespace strategy {

// Dollar-cost averaging: one buy leg of dca_amount per dca_interval until
// dca_total_budget is spent, after which the strategy pauses itself.
class PeriodicEngine {
public:
    PeriodicEngine(std::shared_ptr<core::IPriceFeed> price_feed,
                   std::shared_ptr<core::IExecutionPort> execution);

    OpResult tick(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const;

    static bool budgetExhausted(const Strategy& strategy);

private:
    std::shared_ptr<core::IPriceFeed> price_feed_;
    std::shared_ptr<core::IExecutionPort> execution_;
};

} // namespace strategy
} // namespace stratvault
