#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/VaultConfig.h"

namespace stratvault {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    engine::VaultConfig getVaultConfig() const { return vault_config_; }
    std::string getLogLevel() const { return vault_config_.logging.level; }
    bool isLoaded() const { return loaded_; }

    static StrategyParams parseParams(const nlohmann::json& j, const StrategyParams& defaults);

private:
    Config() = default;
    engine::VaultConfig vault_config_;
    bool loaded_ = false;
};

} // namespace stratvault
