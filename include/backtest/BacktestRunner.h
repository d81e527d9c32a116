#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/MetricsCalculator.h"
#include "backtest/SpreadModel.h"
#include "backtest/TradeSimulator.h"
#include "strategy/IStrategy.h"
#include "strategy/StrategyRegistry.h"
#include <map>
#include <string>
#include <vector>

namespace stratbench {
namespace backtest {

struct WindowResult {
    int window_days = 0;
    BacktestMetrics metrics;
    std::vector<SimulatedTrade> trades;
    TimestampMs start_timestamp = 0;    // first bar of the evaluated history
    TimestampMs end_timestamp = 0;      // last bar of the evaluated history
};

// strategy name -> one result per evaluated horizon
using StrategyResults = std::map<std::string, std::vector<WindowResult>>;

// Replays a strategy's decision function over rolling windows of history.
// The strategy only ever sees bars up to the end of its window; candidates
// are then simulated on the bars that follow.
class BacktestRunner {
public:
    BacktestRunner() = default;
    explicit BacktestRunner(const BacktestConfig& config);

    std::vector<SimulatedTrade> runRolling(const strategy::IStrategy& strategy,
                                           const std::vector<Candle>& bars,
                                           size_t window_bars,
                                           size_t step_bars) const;

    WindowResult runWindow(const strategy::IStrategy& strategy,
                           const std::vector<Candle>& bars,
                           int window_days,
                           int step_days) const;

    WindowResult runWindow(const strategy::IStrategy& strategy,
                           const std::vector<Candle>& bars,
                           int window_days) const {
        return runWindow(strategy, bars, window_days, config_.runner.step_days);
    }

    // One result per configured horizon.
    std::vector<WindowResult> runFull(const strategy::IStrategy& strategy,
                                      const std::vector<Candle>& bars) const;

    StrategyResults runAllStrategies(const strategy::StrategyRegistry& registry,
                                     const std::vector<Candle>& bars) const;

    const BacktestConfig& config() const { return config_; }

private:
    BacktestConfig config_;
    SpreadModel spread_model_;
    TradeSimulator simulator_;
    MetricsCalculator metrics_calculator_;
};

} // namespace backtest
} // namespace stratbench
