#pragma once

#include "common/Logger.h"
#include "common/Types.h"

#include <map>
#include <string>
#include <vector>

namespace stratvault {
namespace engine {

// Runtime settings of the vault core
struct VaultConfig {
    // bounded wait on a strategy's exclusive section before reporting Busy
    int lock_timeout_ms;

    EpochSeconds arbitrage_window_sec;
    EpochSeconds momentum_twap_window_sec;
    EpochSeconds mean_reversion_twap_window_sec;
    EpochSeconds grid_twap_window_sec;

    // settlement accounts
    std::string vault_account;
    std::string fee_recipient;

    LogOptions logging;
    std::string journal_path;

    // role name -> caller ids
    std::map<std::string, std::vector<std::string>> roles;

    StrategyParams default_params;

    VaultConfig()
        : lock_timeout_ms(250)
        , arbitrage_window_sec(300)
        , momentum_twap_window_sec(3600)
        , mean_reversion_twap_window_sec(14400)
        , grid_twap_window_sec(3600)
        , vault_account("vault")
        , fee_recipient("treasury")
        , journal_path("logs/events.jsonl")
    {}
};

} // namespace engine
} // namespace stratvault
