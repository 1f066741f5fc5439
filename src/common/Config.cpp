#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace stratvault {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeRoleName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);

    // Backward compatibility alias
    if (name == "manager") {
        return "strategy_manager";
    }
    return name;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        const std::filesystem::path config_path = utils::PathUtils::locateExisting(path);
        if (config_path.empty()) {
            std::cout << "Warning: config file not found: " << path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }
        std::cout << "Config path: " << config_path << std::endl;

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: config file could not be opened." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "Config loaded: lock_timeout_ms=" << vault_config_.lock_timeout_ms
                  << ", arbitrage_window_sec=" << vault_config_.arbitrage_window_sec << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::VaultConfig cfg;

    if (j.contains("vault")) {
        const auto& v = j["vault"];
        cfg.lock_timeout_ms = v.value("lock_timeout_ms", 250);
        cfg.arbitrage_window_sec = v.value("arbitrage_window_sec", 300LL);
        cfg.momentum_twap_window_sec = v.value("momentum_twap_window_sec", 3600LL);
        cfg.mean_reversion_twap_window_sec = v.value("mean_reversion_twap_window_sec", 14400LL);
        cfg.grid_twap_window_sec = v.value("grid_twap_window_sec", 3600LL);
        cfg.vault_account = v.value("vault_account", std::string("vault"));
        cfg.fee_recipient = v.value("fee_recipient", std::string("treasury"));
        cfg.journal_path = v.value("journal_path", std::string("logs/events.jsonl"));
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        cfg.logging.dir = l.value("dir", cfg.logging.dir);
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.max_file_mb = l.value("max_file_mb", cfg.logging.max_file_mb);
        cfg.logging.max_files = l.value("max_files", cfg.logging.max_files);
        cfg.logging.console = l.value("console", cfg.logging.console);
    }

    // Environment overrides the file for the fee recipient account
    const std::string env_fee_recipient = readEnvVar("STRATVAULT_FEE_RECIPIENT");
    if (!env_fee_recipient.empty()) {
        cfg.fee_recipient = env_fee_recipient;
    }

    if (j.contains("roles") && j["roles"].is_object()) {
        for (const auto& item : j["roles"].items()) {
            const std::string role = normalizeRoleName(item.key());
            auto callers = item.value().get<std::vector<std::string>>();
            for (auto& caller : callers) {
                caller = trimCopy(caller);
            }
            cfg.roles[role] = std::move(callers);
        }
    }

    if (j.contains("default_params")) {
        cfg.default_params = parseParams(j["default_params"], cfg.default_params);
    }

    vault_config_ = cfg;
    loaded_ = true;
}

StrategyParams Config::parseParams(const nlohmann::json& j, const StrategyParams& defaults) {
    StrategyParams p = defaults;
    p.grid_levels = j.value("grid_levels", defaults.grid_levels);
    p.grid_spacing = j.value("grid_spacing", defaults.grid_spacing);
    p.dca_interval_sec = j.value("dca_interval_sec", defaults.dca_interval_sec);
    p.dca_amount = j.value("dca_amount", defaults.dca_amount);
    p.dca_total_budget = j.value("dca_total_budget", defaults.dca_total_budget);
    p.stop_loss_bps = j.value("stop_loss_bps", defaults.stop_loss_bps);
    p.take_profit_bps = j.value("take_profit_bps", defaults.take_profit_bps);
    p.rebalance_threshold_bps = j.value("rebalance_threshold_bps", defaults.rebalance_threshold_bps);
    p.max_slippage_bps = j.value("max_slippage_bps", defaults.max_slippage_bps);
    p.max_drawdown_bps = j.value("max_drawdown_bps", defaults.max_drawdown_bps);
    p.trade_size_bps = j.value("trade_size_bps", defaults.trade_size_bps);
    p.use_twap_oracle = j.value("use_twap_oracle", defaults.use_twap_oracle);
    p.auto_compound = j.value("auto_compound", defaults.auto_compound);
    if (j.contains("extra")) {
        p.extra = j["extra"].get<std::vector<double>>();
    }
    return p;
}

} // namespace stratvault
