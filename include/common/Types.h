#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stratvault {

// Capital and share quantities are integer base units of the quote asset.
using Amount = std::int64_t;
using Shares = std::int64_t;
using Price = double;
using StrategyId = std::uint64_t;
using EpochSeconds = long long;

constexpr int kMaxPerformanceFeeBps = 2000;
constexpr int kMaxManagementFeeBpsPerYear = 500;
constexpr long long kBpsDenominator = 10000;
constexpr EpochSeconds kSecondsPerYear = 365LL * 24 * 60 * 60;

enum class StrategyType {
    GRID_TRADING,
    DCA,
    MOMENTUM,
    MEAN_REVERSION,
    ARBITRAGE,
    LIQUIDITY_PROVIDING,
    DELTA_NEUTRAL,
    YIELD_FARMING
};

enum class StrategyStatus {
    INACTIVE,
    ACTIVE,
    PAUSED,
    EMERGENCY_STOP          // terminal
};

enum class Role {
    STRATEGY_MANAGER,
    OPERATOR,
    ADMIN
};

enum class TradeDirection { BUY, SELL };

struct StrategyParams {
    int grid_levels = 0;
    double grid_spacing = 0.0;          // absolute price step between rungs
    EpochSeconds dca_interval_sec = 0;
    Amount dca_amount = 0;
    Amount dca_total_budget = 0;        // 0 = unlimited
    int stop_loss_bps = 0;
    int take_profit_bps = 0;
    int rebalance_threshold_bps = 0;    // TWAP deviation trigger
    int max_slippage_bps = 0;
    int max_drawdown_bps = 0;           // 0 = guard disabled
    int trade_size_bps = 1000;          // share of active capital per trend/arb trade
    bool use_twap_oracle = false;
    bool auto_compound = false;
    std::vector<double> extra;
};

struct StrategyMetrics {
    Amount total_return = 0;            // cumulative realized P&L
    double total_return_bps = 0.0;
    double sharpe_ratio = 0.0;          // supplied externally
    double max_drawdown_bps = 0.0;
    double win_rate = 0.0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double average_return = 0.0;
    double volatility = 0.0;            // supplied externally
    Amount peak_return = 0;
    EpochSeconds last_update = 0;
};

struct Strategy {
    StrategyId id = 0;
    StrategyType type = StrategyType::GRID_TRADING;
    StrategyStatus status = StrategyStatus::INACTIVE;
    std::string creator;
    std::string base_asset;
    std::string quote_asset;
    Amount total_capital = 0;
    Amount active_capital = 0;
    Shares total_shares = 0;
    Amount min_investment = 0;
    Amount max_investment = 0;          // 0 = unlimited
    int performance_fee_bps = 0;
    int management_fee_bps_per_year = 0;
    EpochSeconds created_at = 0;
    EpochSeconds last_rebalance = 0;
    StrategyParams params;
    StrategyMetrics metrics;
    Amount dca_spent = 0;
    Amount accrued_performance_fee = 0;
};

struct InvestorPosition {
    StrategyId strategy_id = 0;
    std::string investor_id;
    Shares shares = 0;
    Amount capital_contributed = 0;
    EpochSeconds entry_time = 0;
};

struct GridOrder {
    std::uint64_t id = 0;
    StrategyId strategy_id = 0;
    Price price = 0.0;
    Amount amount = 0;
    bool is_buy = true;
    bool is_active = true;
    EpochSeconds created_at = 0;
    EpochSeconds filled_at = 0;
};

struct ArbitrageOpportunity {
    std::string id;
    std::string token_a;
    std::string token_b;
    std::string venue_a;
    std::string venue_b;
    Price price_a = 0.0;
    Price price_b = 0.0;
    Amount profit = 0;
    EpochSeconds timestamp = 0;
};

const char* toString(StrategyType type);
const char* toString(StrategyStatus status);
const char* toString(Role role);
const char* toString(TradeDirection direction);
bool parseStrategyType(const std::string& value, StrategyType& out);

} // namespace stratvault
