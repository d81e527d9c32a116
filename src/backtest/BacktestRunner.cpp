#include "backtest/BacktestRunner.h"
#include "common/Logger.h"

#include <algorithm>
#include <exception>

namespace stratbench {
namespace backtest {

BacktestRunner::BacktestRunner(const BacktestConfig& config)
    : config_(config)
    , spread_model_(config.spread)
    , simulator_(config.simulator)
    , metrics_calculator_(config.metrics)
{}

std::vector<SimulatedTrade> BacktestRunner::runRolling(const strategy::IStrategy& strategy,
                                                       const std::vector<Candle>& bars,
                                                       size_t window_bars,
                                                       size_t step_bars) const {
    std::vector<SimulatedTrade> trades;
    const std::string name = strategy.name();
    const size_t forward = static_cast<size_t>(std::max(simulator_.maxBarsForward(), 0));

    if (window_bars == 0) {
        LOG_WARN("[{}] Window of zero bars requested", name);
        return trades;
    }
    step_bars = std::max<size_t>(step_bars, 1);

    const size_t min_required = window_bars + forward;
    if (bars.size() < min_required) {
        LOG_WARN("[{}] Insufficient bars for rolling backtest: have {}, need {} (window={} + {} forward)",
                 name, bars.size(), min_required, window_bars, forward);
        return trades;
    }

    const size_t last_start = bars.size() - min_required;  // exclusive
    std::vector<Candle> window;
    window.reserve(window_bars);

    for (size_t start = 0; start < last_start; start += step_bars) {
        const size_t end = start + window_bars;
        window.assign(bars.begin() + start, bars.begin() + end);

        strategy::StrategyDecision decision;
        try {
            decision = strategy.analyze(window);
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] analyze() failed at window start {}: {}", name, start, e.what());
            continue;
        }

        if (decision.status == strategy::DecisionStatus::INSUFFICIENT_HISTORY) {
            LOG_DEBUG("[{}] Skipping window at {}: insufficient history", name, start);
            continue;
        }

        const size_t signal_bar = end - 1;
        for (const auto& candidate : decision.candidates) {
            const double spread = spread_model_.getSpread(candidate.timestamp);
            auto trade = simulator_.simulate(candidate, bars, signal_bar, spread);
            if (trade) {
                trades.push_back(std::move(*trade));
            }
        }
    }

    return trades;
}

WindowResult BacktestRunner::runWindow(const strategy::IStrategy& strategy,
                                       const std::vector<Candle>& bars,
                                       int window_days,
                                       int step_days) const {
    WindowResult result;
    result.window_days = window_days;
    if (!bars.empty()) {
        result.start_timestamp = bars.front().timestamp;
        result.end_timestamp = bars.back().timestamp;
    }

    const size_t per_day = static_cast<size_t>(std::max(config_.runner.bars_per_day, 1));
    const size_t window_bars = static_cast<size_t>(std::max(window_days, 0)) * per_day;
    const size_t step_bars = static_cast<size_t>(std::max(step_days, 1)) * per_day;

    result.trades = runRolling(strategy, bars, window_bars, step_bars);
    result.metrics = metrics_calculator_.compute(result.trades);

    LOG_INFO("Backtest complete: strategy={}, window={}d, trades={}, win_rate={:.4f}, profit_factor={:.4f}",
             strategy.name(), window_days, result.metrics.total_trades,
             result.metrics.win_rate, result.metrics.profit_factor);
    return result;
}

std::vector<WindowResult> BacktestRunner::runFull(const strategy::IStrategy& strategy,
                                                  const std::vector<Candle>& bars) const {
    std::vector<WindowResult> results;
    results.reserve(config_.runner.window_days.size());
    for (int days : config_.runner.window_days) {
        results.push_back(runWindow(strategy, bars, days, config_.runner.step_days));
    }
    return results;
}

StrategyResults BacktestRunner::runAllStrategies(const strategy::StrategyRegistry& registry,
                                                 const std::vector<Candle>& bars) const {
    StrategyResults results;
    for (const auto& strategy : registry.all()) {
        const auto name = strategy->name();
        try {
            results[name] = runFull(*strategy, bars);
        } catch (const std::exception& e) {
            LOG_ERROR("Backtest failed for strategy '{}': {}", name, e.what());
        }
    }
    return results;
}

} // namespace backtest
} // namespace stratbench
