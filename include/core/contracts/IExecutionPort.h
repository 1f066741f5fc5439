#pragma once

#include <string>

#include "common/Types.h"

namespace stratvault {
namespace core {

struct TradeRequest {
    StrategyId strategy_id = 0;
    std::string asset;
    std::string quote_asset;
    std::string venue;              // empty = default venue
    TradeDirection direction = TradeDirection::BUY;
    Amount amount = 0;              // quote units
    Price reference_price = 0.0;
    int max_slippage_bps = 0;
    int stop_loss_bps = 0;
    int take_profit_bps = 0;
    std::string reason;
};

struct TradeResult {
    bool success = false;
    Price executed_price = 0.0;
    Amount executed_amount = 0;
    Amount realized_pnl = 0;
    std::string reason;
};

// Venue-side execution of a decided trade.
class IExecutionPort {
public:
    virtual ~IExecutionPort() = default;

    virtual TradeResult executeTrade(const TradeRequest& request) = 0;
};

} // namespace core
} // namespace stratvault
