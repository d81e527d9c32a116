#include "strategy/BreakoutExpansionStrategy.h"
#include "backtest/TradeSimulator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace stratbench;

namespace {
// 2024-01-01 00:00:00 UTC
constexpr long long DAY_START_MS = 1704067200000LL;

constexpr int RANGE_START = 30;
constexpr int BREAKOUT = 40;

// ATR over one bar is the bar's true range, so compression can be read
// straight off the candles.
strategy::BreakoutExpansionStrategyConfig smallConfig() {
    strategy::BreakoutExpansionStrategyConfig cfg;
    cfg.min_bars = 20;
    cfg.atr_period = 1;
    cfg.atr_ma_period = 20;
    cfg.min_consolidation_bars = 5;
    return cfg;
}

// 30 bars of 4-point ranges, 10 bars of 1-point ranges around 2000, then a
// 6-point bullish candle on double volume at `breakout_hour` UTC.
std::vector<Candle> compressionSeries(int breakout_hour) {
    const long long first_ts = DAY_START_MS + 2 * MS_PER_DAY + (breakout_hour - BREAKOUT) * MS_PER_HOUR;
    std::vector<Candle> bars;
    for (int i = 0; i < BREAKOUT; ++i) {
        const double half = i < RANGE_START ? 2.0 : 0.5;
        bars.emplace_back(2000.0, 2000.0 + half, 2000.0 - half, 2000.0, 100.0, first_ts + i * MS_PER_HOUR);
    }
    bars.emplace_back(2000.0, 2006.2, 1999.8, 2006.0, 200.0, first_ts + BREAKOUT * MS_PER_HOUR);
    return bars;
}

std::vector<Candle> mirrored(const std::vector<Candle>& bars) {
    const double m = 4000.0;
    std::vector<Candle> out;
    for (const auto& c : bars) {
        out.emplace_back(m - c.open, m - c.low, m - c.high, m - c.close, c.volume, c.timestamp);
    }
    return out;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

}

int main() {
    std::cout << "[TEST] Starting BreakoutExpansionStrategy Test..." << std::endl;

    strategy::BreakoutExpansionStrategy defaults;
    assert(defaults.name() == "breakout_expansion");
    assert(defaults.minBars() == 70);

    const strategy::BreakoutExpansionStrategy strategy(smallConfig());

    // 1. Shorter than min_bars
    {
        auto bars = compressionSeries(8);
        bars.resize(19);
        assert(strategy.analyze(bars).status == strategy::DecisionStatus::INSUFFICIENT_HISTORY);
    }

    // 2. Bullish breakout at the London open
    {
        const auto bars = compressionSeries(8);
        const auto decision = strategy.analyze(bars);
        assert(decision.status == strategy::DecisionStatus::OK);
        assert(decision.candidates.size() == 1);

        const auto& c = decision.candidates.front();
        assert(c.strategy_name == "breakout_expansion");
        assert(c.direction == TradeDirection::BUY);
        assert(c.timestamp == bars.back().timestamp);
        assert(near(c.entry_price, 2006.0));
        // Narrow range: stop at the far edge
        assert(near(c.stop_loss, 1999.5));
        // Targets are one and two range heights
        assert(near(c.take_profit_1, 2007.0));
        assert(near(c.take_profit_2, 2008.0));
        // Volume and London open; the range is short and the body under 1.5 ATR
        assert(near(c.confidence, 70.0));
        assert(!backtest::TradeSimulator::validateCandidate(c));
        std::cout << "  bullish breakout OK" << std::endl;
    }

    // 3. Bearish mirror
    {
        const auto decision = strategy.analyze(mirrored(compressionSeries(8)));
        assert(decision.candidates.size() == 1);
        const auto& c = decision.candidates.front();
        assert(c.direction == TradeDirection::SELL);
        assert(near(c.stop_loss, 2000.5));
        assert(near(c.take_profit_1, 1993.0));
        assert(near(c.take_profit_2, 1992.0));
        assert(!backtest::TradeSimulator::validateCandidate(c));
    }

    // 4. Range wide relative to ATR: stop at the midpoint
    {
        auto cfg = smallConfig();
        cfg.wide_range_atr_mult = 0.1;
        const strategy::BreakoutExpansionStrategy wide(cfg);
        const auto decision = wide.analyze(compressionSeries(13));
        assert(decision.candidates.size() == 1);
        assert(near(decision.candidates[0].stop_loss, 2000.0));
        // Outside the London open window
        assert(near(decision.candidates[0].confidence, 60.0));
    }

    // 5. Consolidation shorter than required
    {
        auto cfg = smallConfig();
        cfg.min_consolidation_bars = 15;
        const strategy::BreakoutExpansionStrategy strict(cfg);
        assert(strict.analyze(compressionSeries(8)).candidates.empty());
    }

    // 6. Expansion bar that closes back inside the range
    {
        auto bars = compressionSeries(8);
        bars.back().close = 2000.3;
        assert(strategy.analyze(bars).candidates.empty());
    }

    std::cout << "[TEST] BreakoutExpansionStrategy Test PASSED!" << std::endl;
    return 0;
}
