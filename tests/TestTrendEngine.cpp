#include "strategy/TrendEngine.h"
#include "core/adapters/PaperExecutionPort.h"
#include "core/adapters/PaperPriceFeed.h"

#include <cassert>
#include <iostream>
#include <memory>

using namespace stratvault;
using stratvault::ledger::StrategyBook;
using stratvault::strategy::RebalanceReport;
using stratvault::strategy::TrendDecision;
using stratvault::strategy::TrendEngine;

namespace {

StrategyBook makeBook(StrategyType type) {
    StrategyBook book;
    book.strategy.id = 7;
    book.strategy.type = type;
    book.strategy.status = StrategyStatus::ACTIVE;
    book.strategy.base_asset = "BTC";
    book.strategy.quote_asset = "USDT";
    book.strategy.total_capital = 10000;
    book.strategy.active_capital = 10000;
    book.strategy.params.rebalance_threshold_bps = 200;
    book.strategy.params.trade_size_bps = 1000;
    book.strategy.params.stop_loss_bps = 300;
    book.strategy.params.take_profit_bps = 600;
    return book;
}

}

int main() {
    // decision function
    {
        TrendDecision d = TrendEngine::evaluate(101.0, 100.0, 100, true);
        assert(d.triggered && d.direction == TradeDirection::BUY);

        d = TrendEngine::evaluate(101.0, 100.0, 100, false);
        assert(d.triggered && d.direction == TradeDirection::SELL);

        d = TrendEngine::evaluate(99.0, 100.0, 100, true);
        assert(d.triggered && d.direction == TradeDirection::SELL);

        d = TrendEngine::evaluate(99.0, 100.0, 100, false);
        assert(d.triggered && d.direction == TradeDirection::BUY);

        d = TrendEngine::evaluate(100.5, 100.0, 100, true);
        assert(!d.triggered);
        assert(d.deviation_bps > 49.0 && d.deviation_bps < 51.0);

        assert(!TrendEngine::evaluate(150.0, 100.0, 0, true).triggered);
        assert(!TrendEngine::evaluate(150.0, 0.0, 100, true).triggered);
        assert(!TrendEngine::evaluate(100.0, 100.0, 1, true).triggered);
        std::cout << "[TEST] evaluate PASSED\n";
    }

    auto prices = std::make_shared<core::PaperPriceFeed>();
    auto execution = std::make_shared<core::PaperExecutionPort>();
    TrendEngine trend(prices, execution, 3600, 14400);

    // momentum follows the 1h deviation
    {
        StrategyBook book = makeBook(StrategyType::MOMENTUM);
        prices->setPrice("BTC", 31000.0);
        prices->setTwap("BTC", 3600, 30000.0);
        prices->setTwap("BTC", 14400, 31000.0);

        RebalanceReport report;
        assert(trend.momentum(book, 500, report).ok());
        assert(report.traded);
        assert(report.action == "momentum_buy");
        auto requests = execution->requests();
        assert(requests.size() == 1);
        assert(requests[0].direction == TradeDirection::BUY);
        assert(requests[0].amount == 1000);
        assert(requests[0].stop_loss_bps == 300);
        assert(requests[0].take_profit_bps == 600);
        assert(book.strategy.metrics.total_trades == 1);
        assert(book.strategy.last_rebalance == 500);

        // the 4h TWAP sits at the price, so mean reversion stays flat
        RebalanceReport flat;
        assert(trend.meanReversion(book, 600, flat).ok());
        assert(!flat.traded);
        assert(flat.action == "below_threshold");
        assert(execution->requestCount() == 1);
        std::cout << "[TEST] momentum PASSED\n";
    }

    // mean reversion fades the 4h deviation
    {
        StrategyBook book = makeBook(StrategyType::MEAN_REVERSION);
        prices->setPrice("BTC", 31000.0);
        prices->setTwap("BTC", 14400, 30000.0);

        RebalanceReport report;
        assert(trend.meanReversion(book, 700, report).ok());
        assert(report.traded);
        auto requests = execution->requests();
        assert(requests.back().direction == TradeDirection::SELL);
        std::cout << "[TEST] mean reversion PASSED\n";
    }

    // below threshold, rejected, and no price
    {
        StrategyBook book = makeBook(StrategyType::MOMENTUM);
        prices->setPrice("BTC", 30100.0);
        prices->setTwap("BTC", 3600, 30000.0);
        const std::size_t before = execution->requestCount();

        RebalanceReport quiet;
        assert(trend.momentum(book, 800, quiet).ok());
        assert(quiet.action == "below_threshold");
        assert(execution->requestCount() == before);

        prices->setPrice("BTC", 33000.0);
        execution->rejectNext(1);
        RebalanceReport rejected;
        assert(trend.momentum(book, 900, rejected).ok());
        assert(rejected.execution_failures == 1);
        assert(!rejected.traded);
        assert(book.strategy.metrics.total_trades == 0);
        assert(book.strategy.last_rebalance == 0);

        prices->clear("BTC");
        RebalanceReport missing;
        assert(trend.momentum(book, 1000, missing).error == ErrorCode::PRICE_UNAVAILABLE);
        std::cout << "[TEST] trend edge cases PASSED\n";
    }

    // realized profit accrues the performance fee and compounds the rest
    {
        StrategyBook book = makeBook(StrategyType::MOMENTUM);
        book.strategy.performance_fee_bps = 2000;
        book.strategy.params.auto_compound = true;
        prices->setPrice("BTC", 31000.0);
        prices->setTwap("BTC", 3600, 30000.0);
        execution->queuePnl(500);

        RebalanceReport report;
        assert(trend.momentum(book, 1100, report).ok());
        assert(report.realized_pnl == 500);
        assert(book.strategy.accrued_performance_fee == 100);
        assert(book.strategy.active_capital == 10400);
        assert(book.strategy.total_capital == 10000);
        assert(book.strategy.metrics.winning_trades == 1);
        assert(book.strategy.metrics.total_return == 500);
        std::cout << "[TEST] performance accrual PASSED\n";
    }

    std::cout << "[TEST] TrendEngine PASSED\n";
    return 0;
}
