#include "strategy/ArbitrageExecutor.h"
#include "ledger/PerformanceTracker.h"
#include "common/FixedPoint.h"
#include "common/Logger.h"

namespace stratvault {
namespace strategy {

ArbitrageExecutor::ArbitrageExecutor(ledger::LedgerStore& ledger,
                                     std::shared_ptr<core::IExecutionPort> execution,
                                     EpochSeconds validity_window_sec)
    : ledger_(ledger)
    , execution_(std::move(execution))
    , validity_window_sec_(validity_window_sec)
{
}

OpResult ArbitrageExecutor::execute(const std::string& opportunity_id, ledger::StrategyBook& book,
                                    EpochSeconds now, RebalanceReport& report) const {
    const auto taken = ledger_.takeOpportunity(opportunity_id);
    if (!taken) {
        return OpResult::failure(ErrorCode::OPPORTUNITY_NOT_FOUND, "opportunity " + opportunity_id);
    }
    const ArbitrageOpportunity& opp = *taken;

    if (isExpired(opp, now, validity_window_sec_)) {
        LOG_WARN("[Arbitrage] opportunity {} expired ({}s old), discarded", opp.id, now - opp.timestamp);
        return OpResult::failure(ErrorCode::OPPORTUNITY_EXPIRED,
                                 "opportunity " + opp.id + " is " + std::to_string(now - opp.timestamp) + "s old");
    }

    Strategy& s = book.strategy;
    const Amount size = fixed::applyBps(s.active_capital, s.params.trade_size_bps);
    if (size <= 0) {
        report.execution_failures++;
        report.action = "no_active_capital";
        return OpResult::success();
    }

    // Buy where it is cheaper, sell where it is dearer.
    const bool a_cheaper = opp.price_a <= opp.price_b;
    core::TradeRequest buy;
    buy.strategy_id = s.id;
    buy.asset = opp.token_a;
    buy.quote_asset = opp.token_b;
    buy.venue = a_cheaper ? opp.venue_a : opp.venue_b;
    buy.direction = TradeDirection::BUY;
    buy.amount = size;
    buy.reference_price = a_cheaper ? opp.price_a : opp.price_b;
    buy.max_slippage_bps = s.params.max_slippage_bps;
    buy.reason = "arbitrage " + opp.id + " leg 1";

    core::TradeRequest sell = buy;
    sell.venue = a_cheaper ? opp.venue_b : opp.venue_a;
    sell.direction = TradeDirection::SELL;
    sell.reference_price = a_cheaper ? opp.price_b : opp.price_a;
    sell.reason = "arbitrage " + opp.id + " leg 2";

    const core::TradeResult first = execution_->executeTrade(buy);
    if (!first.success) {
        report.execution_failures++;
        report.action = "leg1_rejected";
        LOG_WARN("[Arbitrage] opportunity {} leg 1 rejected: {}", opp.id, first.reason);
        return OpResult::success();
    }
    report.trades++;
    report.volume += size;

    const core::TradeResult second = execution_->executeTrade(sell);
    if (!second.success) {
        report.execution_failures++;
        report.action = "leg2_rejected";
        report.realized_pnl = first.realized_pnl;
        ledger::PerformanceTracker::recordTrade(s, first.realized_pnl, now);
        LOG_ERROR("[Arbitrage] opportunity {} leg 2 rejected after leg 1 filled on {}; position unhedged: {}",
                  opp.id, buy.venue, second.reason);
        return OpResult::success();
    }
    report.trades++;
    report.volume += size;

    const Amount pnl = first.realized_pnl + second.realized_pnl;
    ledger::PerformanceTracker::recordTrade(s, pnl, now);
    s.last_rebalance = now;

    report.traded = true;
    report.realized_pnl = pnl;
    report.action = "arbitrage_executed";
    report.reference_price = buy.reference_price;
    report.addEvent(core::VaultEventType::ARBITRAGE_EXECUTED, now, opp.id, {
        {"token_a", opp.token_a},
        {"token_b", opp.token_b},
        {"buy_venue", buy.venue},
        {"sell_venue", sell.venue},
        {"buy_price", buy.reference_price},
        {"sell_price", sell.reference_price},
        {"amount", size},
        {"quoted_profit", opp.profit},
        {"realized_pnl", pnl}
    });

    LOG_INFO("[Arbitrage] opportunity {} executed: {} {} -> {} size={} pnl={}",
             opp.id, opp.token_a, buy.venue, sell.venue, size, pnl);
    return OpResult::success();
}

} // namespace strategy
} // namespace stratvault
