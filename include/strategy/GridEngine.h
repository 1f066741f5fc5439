#pragma once

#include "common/Errors.h"
#include "core/contracts/IExecutionPort.h"
#include "core/contracts/IPriceFeed.h"
#include "ledger/StrategyBook.h"
#include "strategy/RebalanceReport.h"

#include <memory>

namespace stratvault {
namespace strategy {

// Symmetric buy/sell ladder around a reference price.
//
//   seed:   buy  at base - i*spacing, sell at base + i*spacing, i = 1..levels
//   fill:   a buy is crossed when price <= order.price, a sell when
//           price >= order.price; the filled rung is deactivated and a rung
//           on the opposite side is appended at order.price +/- 2*spacing.
//
// The number of active rungs stays at 2*levels for the life of the ladder.
class GridEngine {
public:
    GridEngine(std::shared_ptr<core::IPriceFeed> price_feed,
               std::shared_ptr<core::IExecutionPort> execution,
               EpochSeconds twap_window_sec);

    OpResult seedLadder(ledger::StrategyBook& book, EpochSeconds now) const;
    OpResult rebalance(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const;

    // Re-sizes active rungs to the current per-level allocation.
    void resizeLadder(ledger::StrategyBook& book) const;

    static Amount perLevelAmount(const Strategy& strategy);

private:
    std::optional<Price> referencePrice(const Strategy& strategy) const;

    std::shared_ptr<core::IPriceFeed> price_feed_;
    std::shared_ptr<core::IExecutionPort> execution_;
    EpochSeconds twap_window_sec_;
};

} // namespace strategy
} // namespace stratvault
