#include "strategy/TrendEngine.h"
#include "ledger/PerformanceTracker.h"
#include "common/FixedPoint.h"
#include "common/Logger.h"

#include <cmath>

namespace stratvault {
namespace strategy {

TrendEngine::TrendEngine(std::shared_ptr<core::IPriceFeed> price_feed,
                         std::shared_ptr<core::IExecutionPort> execution,
                         EpochSeconds momentum_window_sec,
                         EpochSeconds mean_reversion_window_sec)
    : price_feed_(std::move(price_feed))
    , execution_(std::move(execution))
    , momentum_window_sec_(momentum_window_sec)
    , mean_reversion_window_sec_(mean_reversion_window_sec)
{
}

TrendDecision TrendEngine::evaluate(Price price, Price twap, int threshold_bps, bool follow_trend) {
    TrendDecision d;
    d.price = price;
    d.twap = twap;
    if (twap <= 0.0 || price <= 0.0) {
        return d;
    }

    d.deviation_bps = std::fabs(price - twap) * static_cast<double>(kBpsDenominator) / twap;
    if (threshold_bps <= 0 || price == twap || d.deviation_bps < static_cast<double>(threshold_bps)) {
        return d;
    }

    const bool above = price > twap;
    d.triggered = true;
    if (follow_trend) {
        d.direction = above ? TradeDirection::BUY : TradeDirection::SELL;
    } else {
        d.direction = above ? TradeDirection::SELL : TradeDirection::BUY;
    }
    return d;
}

OpResult TrendEngine::momentum(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const {
    return run(book, now, report, momentum_window_sec_, true);
}

OpResult TrendEngine::meanReversion(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const {
    return run(book, now, report, mean_reversion_window_sec_, false);
}

OpResult TrendEngine::run(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report,
                          EpochSeconds window_sec, bool follow_trend) const {
    Strategy& s = book.strategy;
    const auto price = price_feed_->getPrice(s.base_asset);
    const auto twap = price_feed_->getTwap(s.base_asset, window_sec);
    if (!price || !twap || *price <= 0.0 || *twap <= 0.0) {
        return OpResult::failure(ErrorCode::PRICE_UNAVAILABLE, "no price/twap for " + s.base_asset);
    }
    report.reference_price = *price;

    const TrendDecision decision = evaluate(*price, *twap, s.params.rebalance_threshold_bps, follow_trend);
    if (!decision.triggered) {
        report.action = "below_threshold";
        return OpResult::success();
    }

    const Amount size = fixed::applyBps(s.active_capital, s.params.trade_size_bps);
    if (size <= 0) {
        report.action = "no_active_capital";
        return OpResult::success();
    }

    core::TradeRequest request;
    request.strategy_id = s.id;
    request.asset = s.base_asset;
    request.quote_asset = s.quote_asset;
    request.direction = decision.direction;
    request.amount = size;
    request.reference_price = *price;
    request.max_slippage_bps = s.params.max_slippage_bps;
    request.stop_loss_bps = s.params.stop_loss_bps;
    request.take_profit_bps = s.params.take_profit_bps;
    request.reason = std::string(follow_trend ? "momentum" : "mean_reversion") +
                     " deviation_bps=" + std::to_string(decision.deviation_bps);

    const core::TradeResult result = execution_->executeTrade(request);
    if (!result.success) {
        report.execution_failures++;
        report.action = "execution_rejected";
        LOG_WARN("[TrendEngine] strategy {} {} rejected: {}", s.id, toString(decision.direction), result.reason);
        return OpResult::success();
    }

    ledger::PerformanceTracker::recordTrade(s, result.realized_pnl, now);
    s.last_rebalance = now;

    report.traded = true;
    report.trades = 1;
    report.volume = size;
    report.realized_pnl = result.realized_pnl;
    report.action = std::string(follow_trend ? "momentum_" : "reversion_") +
                    (decision.direction == TradeDirection::BUY ? "buy" : "sell");

    LOG_INFO("[TrendEngine] strategy {} {} {} size={} price={:.6f} twap={:.6f} dev={:.1f}bps",
             s.id, follow_trend ? "momentum" : "mean-reversion", toString(decision.direction),
             size, *price, *twap, decision.deviation_bps);
    return OpResult::success();
}

} // namespace strategy
} // namespace stratvault
