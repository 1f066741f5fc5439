#pragma once

#include "common/Types.h"

namespace stratvault {
namespace ledger {

// Folds realized trade outcomes into a strategy's metrics, fee accrual and
// (with auto_compound) its active capital. Runs inside the strategy's
// exclusive section.
class PerformanceTracker {
public:
    static void recordTrade(Strategy& strategy, Amount realized_pnl, EpochSeconds now);

    // Statistics computed outside the core (Sharpe, volatility).
    static void recordExternal(StrategyMetrics& metrics, double sharpe_ratio,
                               double volatility, EpochSeconds now);

    static bool drawdownLimitBreached(const Strategy& strategy);
};

} // namespace ledger
} // namespace stratvault
