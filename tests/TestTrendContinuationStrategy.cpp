#include "strategy/TrendContinuationStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "backtest/TradeSimulator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace stratbench;

namespace {
// 2024-01-01 00:00:00 UTC
constexpr long long DAY_START_MS = 1704067200000LL;

// Pullback bar index; at 13:00 UTC when the series starts at midnight.
constexpr int PULLBACK = 37;

strategy::TrendContinuationStrategyConfig smallConfig() {
    strategy::TrendContinuationStrategyConfig cfg;
    cfg.ema_fast = 5;
    cfg.ema_slow = 20;
    return cfg;
}

// One point per hour up to the pullback, a one-bar dip back to the EMA,
// then a bullish candle closing above the dip.
std::vector<Candle> pullbackSeries(long long first_ts) {
    std::vector<Candle> bars;
    for (int i = 0; i < PULLBACK; ++i) {
        const double close = 2000.0 + i;
        bars.emplace_back(close - 0.5, close + 0.5, close - 0.5, close, 100.0, first_ts + i * MS_PER_HOUR);
    }
    const double k = 2000.0 + PULLBACK;
    bars.emplace_back(k - 1.0, k - 0.8, k - 2.2, k - 2.0, 100.0, first_ts + PULLBACK * MS_PER_HOUR);
    bars.emplace_back(k - 2.0, k + 1.2, k - 2.2, k + 1.0, 100.0, first_ts + (PULLBACK + 1) * MS_PER_HOUR);
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
    std::cout << "[TEST] Starting TrendContinuationStrategy Test..." << std::endl;

    strategy::TrendContinuationStrategy defaults;
    assert(defaults.name() == "trend_continuation");
    assert(defaults.minBars() == 200);

    const strategy::TrendContinuationStrategy strategy(smallConfig());

    // 1. Too short for the slow EMA
    {
        auto bars = pullbackSeries(DAY_START_MS);
        bars.resize(15);
        assert(strategy.analyze(bars).status == strategy::DecisionStatus::INSUFFICIENT_HISTORY);
    }

    // 2. Uptrend pullback confirmed by the next bar
    {
        const auto bars = pullbackSeries(DAY_START_MS);
        assert(utcHourOf(bars[PULLBACK].timestamp) == 13);

        const auto decision = strategy.analyze(bars);
        assert(decision.status == strategy::DecisionStatus::OK);
        assert(decision.candidates.size() == 1);

        const auto& c = decision.candidates.front();
        const auto atr = analytics::TechnicalIndicators::alignSeries(
            analytics::TechnicalIndicators::calculateATRSeries(bars, 14), bars.size());
        const double extreme = analytics::TechnicalIndicators::lowestLow(bars, PULLBACK + 1, 6);
        const double stop = extreme - 1.5 * atr[PULLBACK];
        const double risk = bars.back().close - stop;

        assert(c.strategy_name == "trend_continuation");
        assert(c.direction == TradeDirection::BUY);
        assert(c.timestamp == bars.back().timestamp);
        assert(near(c.entry_price, bars.back().close));
        assert(near(c.stop_loss, stop));
        assert(near(c.take_profit_1, c.entry_price + 2.0 * risk));
        // No confirmed swing high above entry: fixed multiple
        assert(near(c.take_profit_2, c.entry_price + 3.0 * risk));
        // VWAP, shallow pullback and overlap; the EMA spread narrowed
        assert(near(c.confidence, 80.0));
        assert(!backtest::TradeSimulator::validateCandidate(c));
        std::cout << "  bullish pullback OK" << std::endl;
    }

    // 3. Downtrend mirror
    {
        const auto decision = strategy.analyze(mirrored(pullbackSeries(DAY_START_MS)));
        assert(decision.candidates.size() == 1);
        const auto& c = decision.candidates.front();
        assert(c.direction == TradeDirection::SELL);
        assert(c.stop_loss > c.entry_price);
        assert(c.take_profit_2 < c.take_profit_1);
        assert(!backtest::TradeSimulator::validateCandidate(c));
    }

    // 4. Pullback outside London and New York hours
    {
        // Pullback at 03:00 UTC
        const auto bars = pullbackSeries(DAY_START_MS - 10 * MS_PER_HOUR);
        assert(utcHourOf(bars[PULLBACK].timestamp) == 3);
        assert(strategy.analyze(bars).candidates.empty());
    }

    // 5. Confirmation candle fails to close above the pullback high
    {
        auto bars = pullbackSeries(DAY_START_MS);
        bars.back().close = bars[PULLBACK].high - 0.1;
        assert(strategy.analyze(bars).candidates.empty());
    }

    // 6. Pullback bar is the last bar: nothing to confirm yet
    {
        auto bars = pullbackSeries(DAY_START_MS);
        bars.pop_back();
        assert(strategy.analyze(bars).candidates.empty());
    }

    std::cout << "[TEST] TrendContinuationStrategy Test PASSED!" << std::endl;
    return 0;
}
