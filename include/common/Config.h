#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"
#include "selection/SelectorConfig.h"
#include "strategy/StrategyConfig.h"

namespace stratbench {

class Config {
public:
    static Config& getInstance();

    // Missing or malformed files are logged and leave every value at its default.
    void load(const std::string& config_path);

    // Applies an already parsed document on top of the defaults.
    void loadFromJson(const nlohmann::json& j);

    bool isLoaded() const { return loaded_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getStorePath() const { return store_path_; }

    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    selection::SelectorConfig getSelectorConfig() const { return selector_config_; }

    // strategy name -> parameter overrides from the "strategies" section
    std::map<std::string, strategy::ParamMap> getStrategyParams() const { return strategy_params_; }
    strategy::ParamMap getStrategyParams(const std::string& name) const;

private:
    Config() = default;
    void resetDefaults();

    bool loaded_ = false;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string store_path_ = "data/backtest_results.jsonl";

    backtest::BacktestConfig backtest_config_;
    selection::SelectorConfig selector_config_;
    std::map<std::string, strategy::ParamMap> strategy_params_;
};

} // namespace stratbench
