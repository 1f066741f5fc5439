#pragma once

#include "common/Errors.h"
#include "core/contracts/IExecutionPort.h"
#include "core/contracts/IPriceFeed.h"
#include "ledger/StrategyBook.h"
#include "strategy/RebalanceReport.h"

#include <memory>

namespace stratvault {
namespace strategy {

struct TrendDecision {
    bool triggered = false;
    TradeDirection direction = TradeDirection::BUY;
    double deviation_bps = 0.0;
    Price price = 0.0;
    Price twap = 0.0;
};

// TWAP-deviation triggers. Momentum follows the move, mean reversion fades it.
class TrendEngine {
public:
    TrendEngine(std::shared_ptr<core::IPriceFeed> price_feed,
                std::shared_ptr<core::IExecutionPort> execution,
                EpochSeconds momentum_window_sec,
                EpochSeconds mean_reversion_window_sec);

    // Pure decision: |price - twap| / twap against the threshold.
    static TrendDecision evaluate(Price price, Price twap, int threshold_bps, bool follow_trend);

    OpResult momentum(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const;
    OpResult meanReversion(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const;

private:
    OpResult run(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report,
                 EpochSeconds window_sec, bool follow_trend) const;

    std::shared_ptr<core::IPriceFeed> price_feed_;
    std::shared_ptr<core::IExecutionPort> execution_;
    EpochSeconds momentum_window_sec_;
    EpochSeconds mean_reversion_window_sec_;
};

} // namespace strategy
} // namespace stratvault
