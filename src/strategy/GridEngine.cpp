#include "strategy/GridEngine.h"
#include "ledger/PerformanceTracker.h"
#include "common/Logger.h"

namespace stratvault {
namespace strategy {

GridEngine::GridEngine(std::shared_ptr<core::IPriceFeed> price_feed,
                       std::shared_ptr<core::IExecutionPort> execution,
                       EpochSeconds twap_window_sec)
    : price_feed_(std::move(price_feed))
    , execution_(std::move(execution))
    , twap_window_sec_(twap_window_sec)
{
}

Amount GridEngine::perLevelAmount(const Strategy& strategy) {
    const int levels = strategy.params.grid_levels;
    if (levels <= 0 || strategy.active_capital <= 0) {
        return 0;
    }
    return strategy.active_capital / (2 * static_cast<Amount>(levels));
}

std::optional<Price> GridEngine::referencePrice(const Strategy& strategy) const {
    if (strategy.params.use_twap_oracle) {
        return price_feed_->getTwap(strategy.base_asset, twap_window_sec_);
    }
    return price_feed_->getPrice(strategy.base_asset);
}

// ===== Ladder Seeding =====

OpResult GridEngine::seedLadder(ledger::StrategyBook& book, EpochSeconds now) const {
    const Strategy& s = book.strategy;
    const int levels = s.params.grid_levels;
    const double spacing = s.params.grid_spacing;

    if (levels <= 0 || spacing <= 0.0) {
        return OpResult::failure(ErrorCode::INVALID_PARAMS, "grid_levels and grid_spacing must be positive");
    }
    if (book.activeGridOrderCount() > 0) {
        return OpResult::failure(ErrorCode::ALREADY_ACTIVE, "ladder already seeded");
    }

    const auto base = referencePrice(s);
    if (!base || *base <= 0.0) {
        return OpResult::failure(ErrorCode::PRICE_UNAVAILABLE, "no reference price for " + s.base_asset);
    }

    const Price lowest_buy = *base - spacing * levels;
    if (lowest_buy <= 0.0) {
        return OpResult::failure(ErrorCode::INVALID_PARAMS,
                                 "ladder would place buys at non-positive prices");
    }

    const Amount size = perLevelAmount(s);
    for (int i = 1; i <= levels; i++) {
        GridOrder buy;
        buy.id = book.next_order_id++;
        buy.strategy_id = s.id;
        buy.price = *base - spacing * i;
        buy.amount = size;
        buy.is_buy = true;
        buy.is_active = true;
        buy.created_at = now;
        book.grid_orders.push_back(buy);

        GridOrder sell = buy;
        sell.id = book.next_order_id++;
        sell.price = *base + spacing * i;
        sell.is_buy = false;
        book.grid_orders.push_back(sell);
    }

    LOG_INFO("[GridEngine] strategy {} ladder seeded: base={:.6f} levels={} spacing={:.6f} size={}",
             s.id, *base, levels, spacing, size);
    return OpResult::success();
}

// ===== Rebalance =====

OpResult GridEngine::rebalance(ledger::StrategyBook& book, EpochSeconds now, RebalanceReport& report) const {
    Strategy& s = book.strategy;
    const auto price = price_feed_->getPrice(s.base_asset);
    if (!price || *price <= 0.0) {
        return OpResult::failure(ErrorCode::PRICE_UNAVAILABLE, "no price for " + s.base_asset);
    }
    report.reference_price = *price;

    const double step = 2.0 * s.params.grid_spacing;
    const Amount replacement_size = perLevelAmount(s);

    // Rungs appended during this pass are not evaluated until the next one.
    const std::size_t existing = book.grid_orders.size();
    for (std::size_t i = 0; i < existing; i++) {
        GridOrder& order = book.grid_orders[i];
        if (!order.is_active) {
            continue;
        }
        const bool crossed = order.is_buy ? (*price <= order.price) : (*price >= order.price);
        if (!crossed) {
            continue;
        }

        core::TradeResult result;
        if (order.amount > 0) {
            core::TradeRequest request;
            request.strategy_id = s.id;
            request.asset = s.base_asset;
            request.quote_asset = s.quote_asset;
            request.direction = order.is_buy ? TradeDirection::BUY : TradeDirection::SELL;
            request.amount = order.amount;
            request.reference_price = order.price;
            request.max_slippage_bps = s.params.max_slippage_bps;
            request.reason = "grid rung " + std::to_string(order.id);
            result = execution_->executeTrade(request);
            if (!result.success) {
                report.execution_failures++;
                LOG_WARN("[GridEngine] strategy {} rung {} fill rejected: {}", s.id, order.id, result.reason);
                continue;
            }
            report.trades++;
            report.volume += order.amount;
            report.realized_pnl += result.realized_pnl;
            ledger::PerformanceTracker::recordTrade(s, result.realized_pnl, now);
        }

        order.is_active = false;
        order.filled_at = now;

        // `order` may dangle after push_back; copy what is needed first.
        const GridOrder filled = order;

        GridOrder replacement;
        replacement.id = book.next_order_id++;
        replacement.strategy_id = s.id;
        replacement.is_buy = !filled.is_buy;
        replacement.price = filled.is_buy ? filled.price + step : filled.price - step;
        if (replacement.price <= 0.0) {
            // Below the floor of the ladder: rest halfway to zero instead.
            replacement.price = filled.price / 2.0;
            LOG_WARN("[GridEngine] strategy {} replacement for rung {} would be at {:.6f}, placed at {:.6f}",
                     s.id, filled.id, filled.price - step, replacement.price);
        }
        replacement.amount = replacement_size;
        replacement.is_active = true;
        replacement.created_at = now;
        book.grid_orders.push_back(replacement);

        report.fills++;
        report.addEvent(core::VaultEventType::GRID_ORDER_FILLED, now, std::to_string(filled.id), {
            {"order_id", filled.id},
            {"side", filled.is_buy ? "BUY" : "SELL"},
            {"price", filled.price},
            {"amount", filled.amount},
            {"market_price", *price},
            {"fill_price", result.executed_price},
            {"replacement_id", replacement.id},
            {"replacement_price", replacement.price}
        });
    }

    if (report.fills > 0) {
        book.pruneFilledOrders();
        s.last_rebalance = now;
        report.traded = report.trades > 0;
        report.action = "grid_fills";
        LOG_INFO("[GridEngine] strategy {} price={:.6f} fills={} active={}",
                 s.id, *price, report.fills, book.activeGridOrderCount());
    } else {
        report.action = "no_crossing";
    }
    return OpResult::success();
}

void GridEngine::resizeLadder(ledger::StrategyBook& book) const {
    const Amount size = perLevelAmount(book.strategy);
    for (auto& order : book.grid_orders) {
        if (order.is_active) {
            order.amount = size;
        }
    }
}

} // namespace strategy
} // namespace stratvault
