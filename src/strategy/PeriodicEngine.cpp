#include "strategy/PeriodicEngine.h"
#include "ledger/PerformanceTracker.h"
#include "common/Logger.h"

namespace stratvault {
namespace strategy {

PeriodicEngine::PeriodicEngine(std::shared_ptr<core::IPriceFeed> price_feed,
                               std::shared_ptr<core::IExecutionPort> execution)
    : price_feed_(std::move(price_feed))
    , execution_(std::move(execution))
{
}

bool PeriodicEngine::budgetExhausted(const Strategy& strategy) {
    const Amount budget = strategy.params.dca_total_budget;
    if (budget <= 0) {
        return false;  // unlimited
    }
    return strategy.dca_spent >= budget ||
           strategy.dca_spent + strategy.params.dca_amount > budget;
}

OpResult PeriodicEngine::tick(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const {
    Strategy& s = book.strategy;

    if (budgetExhausted(s)) {
        s.status = StrategyStatus::PAUSED;
        report.status_changed = true;
        report.status_after = StrategyStatus::PAUSED;
        report.action = "budget_exhausted";
        LOG_INFO("[PeriodicEngine] strategy {} budget exhausted (spent={} budget={}), pausing",
                 s.id, s.dca_spent, s.params.dca_total_budget);
        return OpResult::success();
    }

    if (s.last_rebalance > 0 && now - s.last_rebalance < s.params.dca_interval_sec) {
        report.action = "interval_not_elapsed";
        return OpResult::success();
    }

    const auto price = price_feed_->getPrice(s.base_asset);
    if (!price || *price <= 0.0) {
        return OpResult::failure(ErrorCode::PRICE_UNAVAILABLE, "no price for " + s.base_asset);
    }
    report.reference_price = *price;

    core::TradeRequest request;
    request.strategy_id = s.id;
    request.asset = s.base_asset;
    request.quote_asset = s.quote_asset;
    request.direction = TradeDirection::BUY;
    request.amount = s.params.dca_amount;
    request.reference_price = *price;
    request.max_slippage_bps = s.params.max_slippage_bps;
    request.reason = "dca leg " + std::to_string(s.metrics.total_trades + 1);

    const core::TradeResult result = execution_->executeTrade(request);
    if (!result.success) {
        report.execution_failures++;
        report.action = "execution_rejected";
        LOG_WARN("[PeriodicEngine] strategy {} leg rejected: {}", s.id, result.reason);
        return OpResult::success();
    }

    s.dca_spent += s.params.dca_amount;
    s.last_rebalance = now;
    ledger::PerformanceTracker::recordTrade(s, result.realized_pnl, now);

    report.traded = true;
    report.trades = 1;
    report.volume = s.params.dca_amount;
    report.realized_pnl = result.realized_pnl;
    report.action = "dca_leg";
    report.addEvent(core::VaultEventType::DCA_EXECUTED, now, std::to_string(s.id), {
        {"amount", s.params.dca_amount},
        {"price", *price},
        {"spent", s.dca_spent},
        {"budget", s.params.dca_total_budget}
    });
    return OpResult::success();
}

} // namespace strategy
} // namespace stratvault
