#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace stratbench {

namespace {
void readSpread(const nlohmann::json& s, backtest::SpreadConfig& spread) {
    if (s.contains("sessions")) {
        spread.session_spreads.clear();
        for (const auto& item : s["sessions"].items()) {
            spread.session_spreads[item.key()] = item.value().get<double>();
        }
    }
    spread.default_spread = s.value("default", spread.default_spread);
}

void readWeights(const nlohmann::json& w, selection::MetricWeights& weights) {
    weights.win_rate = w.value("win_rate", weights.win_rate);
    weights.profit_factor = w.value("profit_factor", weights.profit_factor);
    weights.sharpe_ratio = w.value("sharpe_ratio", weights.sharpe_ratio);
    weights.expectancy = w.value("expectancy", weights.expectancy);
    weights.max_drawdown = w.value("max_drawdown", weights.max_drawdown);
}

// strategy -> parameter -> [min, max, step]; listed strategies replace their defaults.
void readParamSpaces(const nlohmann::json& spaces, backtest::OptimizerConfig& cfg) {
    for (const auto& strategy_item : spaces.items()) {
        backtest::ParamSpace space;
        for (const auto& param : strategy_item.value().items()) {
            const auto bounds = param.value().get<std::vector<double>>();
            if (bounds.size() != 3) {
                throw std::invalid_argument("optimizer.param_spaces." + strategy_item.key() + "." +
                                            param.key() + " must be [min, max, step]");
            }
            space[param.key()] = backtest::ParamRange{bounds[0], bounds[1], bounds[2]};
        }
        cfg.param_spaces[strategy_item.key()] = space;
    }
}

void readRegimeModifiers(const nlohmann::json& m, selection::SelectorConfig& cfg) {
    cfg.regime_modifiers.clear();
    for (const auto& regime_item : m.items()) {
        auto regime = analytics::regimeFromString(regime_item.key());
        if (!regime) {
            LOG_WARN("Config: unknown regime '{}' in selector.regime_modifiers", regime_item.key());
            continue;
        }
        for (const auto& entry : regime_item.value().items()) {
            cfg.regime_modifiers[*regime][entry.key()] = entry.value().get<double>();
        }
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetDefaults() {
    loaded_ = false;
    log_level_ = "info";
    log_dir_ = "logs";
    store_path_ = "data/backtest_results.jsonl";
    backtest_config_ = backtest::BacktestConfig();
    selector_config_ = selection::SelectorConfig();
    strategy_params_.clear();
}

void Config::load(const std::string& path) {
    resetDefaults();

    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} -- using defaults", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {} -- using defaults", config_path.string());
        return;
    }

    try {
        nlohmann::json j;
        file >> j;
        loadFromJson(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Config load error ({}): {} -- using defaults", config_path.string(), e.what());
        resetDefaults();
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    resetDefaults();

    // Parse into copies so a type error part-way through keeps the defaults.
    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    std::string store_path = store_path_;
    backtest::BacktestConfig bt;
    selection::SelectorConfig sel;
    std::map<std::string, strategy::ParamMap> strategy_params;

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level = l.value("level", log_level);
        log_dir = l.value("dir", log_dir);
    }

    if (j.contains("spread")) {
        readSpread(j["spread"], bt.spread);
    }

    if (j.contains("simulator")) {
        bt.simulator.max_bars_forward = j["simulator"].value("max_bars_forward", bt.simulator.max_bars_forward);
    }

    if (j.contains("metrics")) {
        const auto& m = j["metrics"];
        bt.metrics.profit_factor_cap = m.value("profit_factor_cap", bt.metrics.profit_factor_cap);
        bt.metrics.annualization_periods = m.value("annualization_periods", bt.metrics.annualization_periods);
    }

    if (j.contains("backtest")) {
        const auto& b = j["backtest"];
        bt.runner.bars_per_day = b.value("bars_per_day", bt.runner.bars_per_day);
        bt.runner.step_days = b.value("step_days", bt.runner.step_days);
        if (b.contains("window_days")) {
            bt.runner.window_days = b["window_days"].get<std::vector<int>>();
        }
        bt.timeframe = b.value("timeframe", bt.timeframe);
    }

    if (j.contains("walk_forward")) {
        const auto& w = j["walk_forward"];
        bt.walk_forward.split_ratio = w.value("split_ratio", bt.walk_forward.split_ratio);
        bt.walk_forward.window_days = w.value("window_days", bt.walk_forward.window_days);
        bt.walk_forward.min_oos_trades = w.value("min_oos_trades", bt.walk_forward.min_oos_trades);
        bt.walk_forward.degradation_threshold = w.value("degradation_threshold", bt.walk_forward.degradation_threshold);
    }

    if (j.contains("optimizer")) {
        const auto& o = j["optimizer"];
        bt.optimizer.num_samples = o.value("num_samples", bt.optimizer.num_samples);
        bt.optimizer.min_trades = o.value("min_trades", bt.optimizer.min_trades);
        bt.optimizer.window_days = o.value("window_days", bt.optimizer.window_days);
        bt.optimizer.top_n_validate = o.value("top_n_validate", bt.optimizer.top_n_validate);
        bt.optimizer.seed = o.value("seed", bt.optimizer.seed);
        if (o.contains("param_spaces")) {
            readParamSpaces(o["param_spaces"], bt.optimizer);
        }
    }

    if (j.contains("selector")) {
        const auto& s = j["selector"];
        sel.min_trades = s.value("min_trades", sel.min_trades);
        if (s.contains("weights")) {
            readWeights(s["weights"], sel.weights);
        }
        sel.regime.lookback_bars = s.value("regime_lookback_bars", sel.regime.lookback_bars);
        sel.regime.atr_period = s.value("atr_period", sel.regime.atr_period);
        sel.regime.low_percentile = s.value("low_percentile", sel.regime.low_percentile);
        sel.regime.high_percentile = s.value("high_percentile", sel.regime.high_percentile);
        if (s.contains("regime_modifiers")) {
            readRegimeModifiers(s["regime_modifiers"], sel);
        }
        sel.degradation_win_rate_drop = s.value("degradation_win_rate_drop", sel.degradation_win_rate_drop);
        sel.degradation_min_profit_factor = s.value("degradation_min_profit_factor", sel.degradation_min_profit_factor);
        if (s.contains("preferred_windows")) {
            sel.preferred_windows = s["preferred_windows"].get<std::vector<int>>();
        }
        sel.live_blend_weight = s.value("live_blend_weight", sel.live_blend_weight);
        sel.min_live_signals = s.value("min_live_signals", sel.min_live_signals);
        sel.live_weight_win_rate = s.value("live_weight_win_rate", sel.live_weight_win_rate);
        sel.live_weight_profit_factor = s.value("live_weight_profit_factor", sel.live_weight_profit_factor);
        sel.live_weight_rr = s.value("live_weight_rr", sel.live_weight_rr);
        sel.live_profit_factor_cap = s.value("live_profit_factor_cap", sel.live_profit_factor_cap);
        sel.live_rr_cap = s.value("live_rr_cap", sel.live_rr_cap);
        sel.confluence_bonus = s.value("confluence_bonus", sel.confluence_bonus);
        sel.confluence_min_bars = s.value("confluence_min_bars", sel.confluence_min_bars);
        sel.confluence_fast_ema = s.value("confluence_fast_ema", sel.confluence_fast_ema);
        sel.confluence_slow_ema = s.value("confluence_slow_ema", sel.confluence_slow_ema);
    }

    if (j.contains("strategies")) {
        for (const auto& item : j["strategies"].items()) {
            if (!item.value().is_object()) {
                throw std::invalid_argument("strategies." + item.key() + " must be an object");
            }
            auto& params = strategy_params[item.key()];
            for (const auto& param : item.value().items()) {
                params[param.key()] = param.value().get<double>();
            }
        }
    }

    if (j.contains("store")) {
        store_path = j["store"].value("path", store_path);
    }

    log_level_ = log_level;
    log_dir_ = log_dir;
    store_path_ = store_path;
    backtest_config_ = bt;
    selector_config_ = sel;
    strategy_params_ = strategy_params;
    loaded_ = true;

    LOG_INFO("Config loaded: horizons={}, min_trades={}, store={}",
             backtest_config_.runner.window_days.size(), selector_config_.min_trades, store_path_);
}

strategy::ParamMap Config::getStrategyParams(const std::string& name) const {
    auto it = strategy_params_.find(name);
    return it == strategy_params_.end() ? strategy::ParamMap() : it->second;
}

} // namespace stratbench
