#include "common/Config.h"
#include "core/adapters/StaticRoleAuthorizer.h"

#include <cassert>
#include <cstdlib>
#include <iostream>

int main() {
    using namespace stratvault;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // a missing file keeps the defaults
    config.load("/nonexistent/stratvault.json");
    assert(!config.isLoaded());
    {
        auto cfg = config.getVaultConfig();
        assert(cfg.lock_timeout_ms == 250);
        assert(cfg.arbitrage_window_sec == 300);
        assert(cfg.momentum_twap_window_sec == 3600);
        assert(cfg.mean_reversion_twap_window_sec == 14400);
        assert(cfg.fee_recipient == "treasury");
    }

    nlohmann::json j = {
        {"vault", {
            {"lock_timeout_ms", 50},
            {"arbitrage_window_sec", 120},
            {"vault_account", "custody-main"},
            {"fee_recipient", "fees"}
        }},
        {"logging", {{"dir", "/tmp/stratvault-logs"}, {"level", "warn"}, {"max_files", 5}, {"console", false}}},
        {"roles", {
            {"admin", nlohmann::json::array({"root"})},
            {"Manager", nlohmann::json::array({" desk "})},
            {"operator", nlohmann::json::array({"scheduler", "scanner"})}
        }},
        {"default_params", {
            {"max_slippage_bps", 40},
            {"trade_size_bps", 500},
            {"use_twap_oracle", true},
            {"extra", nlohmann::json::array({1.5, 2.5})}
        }}
    };

    unsetenv("STRATVAULT_FEE_RECIPIENT");
    config.loadFromJson(j);
    assert(config.isLoaded());
    {
        auto cfg = config.getVaultConfig();
        assert(cfg.lock_timeout_ms == 50);
        assert(cfg.arbitrage_window_sec == 120);
        assert(cfg.momentum_twap_window_sec == 3600);
        assert(cfg.vault_account == "custody-main");
        assert(cfg.fee_recipient == "fees");
        assert(cfg.logging.dir == "/tmp/stratvault-logs");
        assert(cfg.logging.level == "warn");
        assert(cfg.logging.max_files == 5);
        assert(cfg.logging.max_file_mb == 10);
        assert(!cfg.logging.console);
        assert(config.getLogLevel() == "warn");

        assert(cfg.roles.count("strategy_manager") == 1);
        assert(cfg.roles.at("strategy_manager").front() == "desk");
        assert(cfg.roles.at("operator").size() == 2);

        assert(cfg.default_params.max_slippage_bps == 40);
        assert(cfg.default_params.trade_size_bps == 500);
        assert(cfg.default_params.use_twap_oracle);
        assert(cfg.default_params.extra.size() == 2);
        assert(cfg.default_params.grid_levels == 0);

        core::StaticRoleAuthorizer authorizer(cfg.roles);
        assert(authorizer.hasRole("root", Role::ADMIN));
        assert(authorizer.hasRole("desk", Role::STRATEGY_MANAGER));
        assert(authorizer.hasRole("scanner", Role::OPERATOR));
        assert(!authorizer.hasRole("root", Role::OPERATOR));
        authorizer.revoke("scanner", Role::OPERATOR);
        assert(!authorizer.hasRole("scanner", Role::OPERATOR));
    }
    std::cout << "[TEST] loadFromJson PASSED" << std::endl;

    // environment overrides the fee recipient
    setenv("STRATVAULT_FEE_RECIPIENT", " ops-treasury ", 1);
    config.loadFromJson(j);
    assert(config.getVaultConfig().fee_recipient == "ops-treasury");
    unsetenv("STRATVAULT_FEE_RECIPIENT");
    std::cout << "[TEST] env override PASSED" << std::endl;

    // per-strategy params layer over defaults
    {
        StrategyParams defaults;
        defaults.max_slippage_bps = 25;
        auto p = Config::parseParams({{"grid_levels", 4}, {"grid_spacing", 12.5}}, defaults);
        assert(p.grid_levels == 4);
        assert(p.grid_spacing == 12.5);
        assert(p.max_slippage_bps == 25);
        assert(p.trade_size_bps == 1000);
    }

    std::cout << "[TEST] Config PASSED" << std::endl;
    return 0;
}
