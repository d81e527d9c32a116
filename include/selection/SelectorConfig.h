#pragma once

#include "analytics/RegimeDetector.h"
#include <map>
#include <string>
#include <vector>

namespace stratbench {
namespace selection {

struct MetricWeights {
    double win_rate = 0.30;
    double profit_factor = 0.25;
    double sharpe_ratio = 0.15;
    double expectancy = 0.15;
    double max_drawdown = 0.15;     // applied to the inverted value
};

struct SelectorConfig {
    int min_trades = 50;
    MetricWeights weights;
    analytics::RegimeConfig regime;

    // regime -> strategy -> score multiplier
    std::map<analytics::VolatilityRegime, std::map<std::string, double>> regime_modifiers{
        {analytics::VolatilityRegime::HIGH, {{"breakout_expansion", 0.90}}},
        {analytics::VolatilityRegime::LOW, {{"trend_continuation", 0.90}}}
    };

    double degradation_win_rate_drop = 0.15;
    double degradation_min_profit_factor = 1.0;
    std::vector<int> preferred_windows{14, 30, 60, 7};

    double live_blend_weight = 0.30;
    int min_live_signals = 5;
    double live_weight_win_rate = 0.40;
    double live_weight_profit_factor = 0.35;
    double live_weight_rr = 0.25;
    double live_profit_factor_cap = 3.0;
    double live_rr_cap = 5.0;

    double confluence_bonus = 0.05;
    int confluence_min_bars = 200;
    int confluence_fast_ema = 50;
    int confluence_slow_ema = 200;
};

} // namespace selection
} // namespace stratbench
