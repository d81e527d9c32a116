#pragma once

#include <map>
#include <string>
#include <vector>

namespace stratbench {
namespace backtest {

// Session spreads in price units (XAUUSD: 0.10 = 1 pip)
struct SpreadConfig {
    std::map<std::string, double> session_spreads{
        {"overlap", 0.20},
        {"london", 0.30},
        {"new_york", 0.30},
        {"asian", 0.50}
    };
    double default_spread = 0.50;   // off-session: same as the least liquid session
};

struct SimulatorConfig {
    int max_bars_forward = 72;      // 3 days of H1 bars
};

struct MetricsConfig {
    double profit_factor_cap = 9999.9999;
    int annualization_periods = 252;
};

struct RunnerConfig {
    int bars_per_day = 24;          // H1
    std::vector<int> window_days{30, 60};
    int step_days = 1;
};

struct WalkForwardConfig {
    double split_ratio = 0.8;
    int window_days = 30;
    int min_oos_trades = 5;
    double degradation_threshold = 0.5;
};

// Inclusive grid min, min + step, ... up to max.
struct ParamRange {
    double min = 0.0;
    double max = 0.0;
    double step = 1.0;
};

// parameter name -> search range
using ParamSpace = std::map<std::string, ParamRange>;

struct OptimizerConfig {
    int num_samples = 25;               // includes the unmodified defaults
    int min_trades = 10;
    int window_days = 30;
    int top_n_validate = 3;
    unsigned int seed = 0;              // 0 draws a fresh seed per run

    std::map<std::string, ParamSpace> param_spaces{
        {"liquidity_sweep", {
            {"swing_order", {3, 8, 1}},
            {"lookback", {30, 80, 10}},
            {"stop_atr_mult", {0.3, 1.0, 0.1}},
            {"tp1_rr", {1.0, 2.5, 0.25}},
            {"confirm_bars", {2, 5, 1}}
        }},
        {"trend_continuation", {
            {"ema_fast", {20, 60, 10}},
            {"pullback_atr_mult", {0.5, 2.0, 0.25}},
            {"stop_atr_mult", {1.0, 2.5, 0.25}},
            {"tp1_rr", {1.5, 2.75, 0.25}},
            {"pullback_lookback", {3, 8, 1}}
        }},
        {"breakout_expansion", {
            {"atr_compression", {0.3, 0.7, 0.1}},
            {"min_consolidation_bars", {5, 20, 5}},
            {"volume_mult", {1.0, 2.5, 0.25}},
            {"breakout_body_atr", {1.0, 2.5, 0.25}}
        }},
        {"ema_momentum", {
            {"body_atr_mult", {0.4, 1.0, 0.1}},
            {"stop_atr_mult", {0.5, 1.5, 0.25}},
            {"tp1_rr", {1.0, 2.5, 0.25}},
            {"slope_bars", {3, 8, 1}}
        }}
    };
};

struct BacktestConfig {
    SpreadConfig spread;
    SimulatorConfig simulator;
    MetricsConfig metrics;
    RunnerConfig runner;
    WalkForwardConfig walk_forward;
    OptimizerConfig optimizer;
    std::string timeframe = "H1";
    std::string spread_model_tag = "session_aware";
};

} // namespace backtest
} // namespace stratbench
