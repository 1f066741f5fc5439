#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace stratvault {

const char* toString(StrategyType type) {
    switch (type) {
        case StrategyType::GRID_TRADING: return "GRID_TRADING";
        case StrategyType::DCA: return "DCA";
        case StrategyType::MOMENTUM: return "MOMENTUM";
        case StrategyType::MEAN_REVERSION: return "MEAN_REVERSION";
        case StrategyType::ARBITRAGE: return "ARBITRAGE";
        case StrategyType::LIQUIDITY_PROVIDING: return "LIQUIDITY_PROVIDING";
        case StrategyType::DELTA_NEUTRAL: return "DELTA_NEUTRAL";
        case StrategyType::YIELD_FARMING: return "YIELD_FARMING";
    }
    return "UNKNOWN";
}

const char* toString(StrategyStatus status) {
    switch (status) {
        case StrategyStatus::INACTIVE: return "INACTIVE";
        case StrategyStatus::ACTIVE: return "ACTIVE";
        case StrategyStatus::PAUSED: return "PAUSED";
        case StrategyStatus::EMERGENCY_STOP: return "EMERGENCY_STOP";
    }
    return "UNKNOWN";
}

const char* toString(Role role) {
    switch (role) {
        case Role::STRATEGY_MANAGER: return "strategy_manager";
        case Role::OPERATOR: return "operator";
        case Role::ADMIN: return "admin";
    }
    return "unknown";
}

const char* toString(TradeDirection direction) {
    return direction == TradeDirection::BUY ? "BUY" : "SELL";
}

bool parseStrategyType(const std::string& value, StrategyType& out) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    // Backward compatibility alias
    if (upper == "GRID") {
        upper = "GRID_TRADING";
    }

    static const StrategyType all[] = {
        StrategyType::GRID_TRADING, StrategyType::DCA, StrategyType::MOMENTUM,
        StrategyType::MEAN_REVERSION, StrategyType::ARBITRAGE,
        StrategyType::LIQUIDITY_PROVIDING, StrategyType::DELTA_NEUTRAL,
        StrategyType::YIELD_FARMING
    };
    for (auto type : all) {
        if (upper == toString(type)) {
            out = type;
            return true;
        }
    }
    return false;
}

} // namespace stratvault
