#include "ledger/PerformanceTracker.h"
#include "ledger/FeeCalculator.h"

#include <algorithm>

namespace stratvault {
namespace ledger {

namespace {
double toBps(Amount value, Amount base) {
    if (base <= 0) {
        return 0.0;
    }
    return static_cast<double>(value) * static_cast<double>(kBpsDenominator) / static_cast<double>(base);
}
}

void PerformanceTracker::recordTrade(Strategy& strategy, Amount realized_pnl, EpochSeconds now) {
    auto& m = strategy.metrics;
    m.total_trades++;
    if (realized_pnl > 0) {
        m.winning_trades++;
    } else if (realized_pnl < 0) {
        m.losing_trades++;
    }

    m.total_return += realized_pnl;
    m.total_return_bps = toBps(m.total_return, strategy.total_capital);
    m.win_rate = static_cast<double>(m.winning_trades) / static_cast<double>(m.total_trades);
    m.average_return = static_cast<double>(m.total_return) / static_cast<double>(m.total_trades);

    m.peak_return = std::max(m.peak_return, m.total_return);
    const double drawdown_bps = toBps(m.peak_return - m.total_return, strategy.total_capital);
    m.max_drawdown_bps = std::max(m.max_drawdown_bps, drawdown_bps);
    m.last_update = now;

    if (realized_pnl > 0) {
        const Amount fee = FeeCalculator::performanceFee(realized_pnl, strategy.performance_fee_bps);
        strategy.accrued_performance_fee += fee;
        if (strategy.params.auto_compound) {
            strategy.active_capital += realized_pnl - fee;
        }
    }
}

void PerformanceTracker::recordExternal(StrategyMetrics& metrics, double sharpe_ratio,
                                        double volatility, EpochSeconds now) {
    metrics.sharpe_ratio = sharpe_ratio;
    metrics.volatility = volatility;
    metrics.last_update = now;
}

bool PerformanceTracker::drawdownLimitBreached(const Strategy& strategy) {
    const int limit = strategy.params.max_drawdown_bps;
    return limit > 0 && strategy.metrics.max_drawdown_bps >= static_cast<double>(limit);
}

} // namespace ledger
} // namespace stratvault
