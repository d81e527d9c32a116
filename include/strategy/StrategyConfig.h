#pragma once

#include <cmath>
#include <map>
#include <string>
#include <type_traits>

namespace stratbench {
namespace strategy {

// Tunable numeric parameters keyed by name, as read from config or sampled
// by the optimizer. Integer fields are rounded on the way in.
using ParamMap = std::map<std::string, double>;

struct EmaMomentumStrategyConfig {
    int ema_fast = 21;
    int ema_mid = 50;
    int ema_slow = 200;
    int atr_period = 14;
    int slope_bars = 5;
    int swing_order = 5;
    int swing_lookback = 20;

    double body_atr_mult = 0.6;         // min candle body as a multiple of ATR
    double stop_atr_mult = 1.0;         // padding beyond the swing extreme
    double max_stop_distance = 15.0;    // price units (150 pips on XAUUSD)
    double tp1_rr = 1.5;
    double tp2_rr = 3.0;

    double base_confidence = 50.0;

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor&& v) {
        v("ema_fast", self.ema_fast);
        v("ema_mid", self.ema_mid);
        v("ema_slow", self.ema_slow);
        v("atr_period", self.atr_period);
        v("slope_bars", self.slope_bars);
        v("swing_order", self.swing_order);
        v("swing_lookback", self.swing_lookback);
        v("body_atr_mult", self.body_atr_mult);
        v("stop_atr_mult", self.stop_atr_mult);
        v("max_stop_distance", self.max_stop_distance);
        v("tp1_rr", self.tp1_rr);
        v("tp2_rr", self.tp2_rr);
        v("base_confidence", self.base_confidence);
    }
};

struct TrendContinuationStrategyConfig {
    int ema_fast = 50;
    int ema_slow = 200;
    int atr_period = 14;
    int pullback_lookback = 5;          // bars searched for the pre-pullback extension
    int swing_order = 5;

    double trend_atr_mult = 0.5;        // min EMA spread that counts as a trend
    double pullback_atr_mult = 1.0;     // width of the EMA zone
    double stop_atr_mult = 1.5;
    double tp1_rr = 2.0;
    double tp2_rr = 3.0;

    double base_confidence = 50.0;

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor&& v) {
        v("ema_fast", self.ema_fast);
        v("ema_slow", self.ema_slow);
        v("atr_period", self.atr_period);
        v("pullback_lookback", self.pullback_lookback);
        v("swing_order", self.swing_order);
        v("trend_atr_mult", self.trend_atr_mult);
        v("pullback_atr_mult", self.pullback_atr_mult);
        v("stop_atr_mult", self.stop_atr_mult);
        v("tp1_rr", self.tp1_rr);
        v("tp2_rr", self.tp2_rr);
        v("base_confidence", self.base_confidence);
    }
};

struct BreakoutExpansionStrategyConfig {
    int min_bars = 70;
    int atr_period = 14;
    int atr_ma_period = 50;
    int min_consolidation_bars = 10;
    int london_open_start = 7;          // UTC hour, inclusive
    int london_open_end = 9;            // UTC hour, exclusive

    double atr_compression = 0.5;       // ATR below this share of its average = compressed
    double volume_mult = 1.5;
    double wide_range_atr_mult = 3.0;   // wider ranges put the stop at the midpoint
    double breakout_body_atr = 1.5;

    double base_confidence = 50.0;

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor&& v) {
        v("min_bars", self.min_bars);
        v("atr_period", self.atr_period);
        v("atr_ma_period", self.atr_ma_period);
        v("min_consolidation_bars", self.min_consolidation_bars);
        v("london_open_start", self.london_open_start);
        v("london_open_end", self.london_open_end);
        v("atr_compression", self.atr_compression);
        v("volume_mult", self.volume_mult);
        v("wide_range_atr_mult", self.wide_range_atr_mult);
        v("breakout_body_atr", self.breakout_body_atr);
        v("base_confidence", self.base_confidence);
    }
};

struct LiquiditySweepStrategyConfig {
    int min_bars = 100;
    int atr_period = 14;
    int swing_order = 5;
    int lookback = 50;                  // bars searched for swing levels
    int confirm_bars = 3;               // bars allowed for the reversal close

    double stop_atr_mult = 0.5;         // padding beyond the sweep wick
    double tp1_rr = 1.5;
    double tp2_rr = 3.0;

    double base_confidence = 50.0;

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor&& v) {
        v("min_bars", self.min_bars);
        v("atr_period", self.atr_period);
        v("swing_order", self.swing_order);
        v("lookback", self.lookback);
        v("confirm_bars", self.confirm_bars);
        v("stop_atr_mult", self.stop_atr_mult);
        v("tp1_rr", self.tp1_rr);
        v("tp2_rr", self.tp2_rr);
        v("base_confidence", self.base_confidence);
    }
};

template <typename StrategyConfigT>
ParamMap toParams(const StrategyConfigT& config) {
    ParamMap params;
    StrategyConfigT::fields(config, [&params](const char* key, const auto& field) {
        params[key] = static_cast<double>(field);
    });
    return params;
}

// Starts from the defaults; keys the config does not know are ignored.
template <typename StrategyConfigT>
StrategyConfigT fromParams(const ParamMap& params) {
    StrategyConfigT config;
    StrategyConfigT::fields(config, [&params](const char* key, auto& field) {
        auto it = params.find(key);
        if (it == params.end()) {
            return;
        }
        using FieldT = std::decay_t<decltype(field)>;
        if constexpr (std::is_integral<FieldT>::value) {
            field = static_cast<FieldT>(std::lround(it->second));
        } else {
            field = static_cast<FieldT>(it->second);
        }
    });
    return config;
}

} // namespace strategy
} // namespace stratbench
