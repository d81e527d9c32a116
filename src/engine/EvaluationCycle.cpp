#include "engine/EvaluationCycle.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace stratbench {
namespace engine {

namespace {
long long getCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string lastDirectionOf(const std::vector<backtest::SimulatedTrade>& trades) {
    return trades.empty() ? std::string() : directionToString(trades.back().candidate().direction);
}
}

EvaluationCycle::EvaluationCycle(const backtest::BacktestConfig& config,
                                 const strategy::StrategyRegistry& registry,
                                 storage::IResultStore& store)
    : config_(config)
    , registry_(registry)
    , store_(store)
    , runner_(config)
    , validator_(config)
{}

CycleSummary EvaluationCycle::run(const std::vector<Candle>& bars) {
    return run(bars, getCurrentTimeMs());
}

CycleSummary EvaluationCycle::run(const std::vector<Candle>& bars, long long evaluated_at_ms) {
    CycleSummary summary;
    summary.cycle_id = "cycle-" + std::to_string(evaluated_at_ms);

    if (bars.empty()) {
        throw std::runtime_error("Evaluation cycle: price history is empty");
    }

    if (backtest::DataHistory::hasGaps(bars, MS_PER_DAY / std::max(config_.runner.bars_per_day, 1))) {
        LOG_WARN("Price history has gaps; evaluating as-is");
    }

    const auto& horizons = config_.runner.window_days;
    const int shortest = horizons.empty() ? config_.walk_forward.window_days
                                          : *std::min_element(horizons.begin(), horizons.end());
    const size_t min_bars = static_cast<size_t>(shortest) * config_.runner.bars_per_day +
                            static_cast<size_t>(config_.simulator.max_bars_forward);
    if (bars.size() < min_bars) {
        LOG_WARN("Insufficient history for evaluation: have {} bars, need {} -- skipping cycle",
                 bars.size(), min_bars);
        summary.skipped = true;
        return summary;
    }

    LOG_INFO("Evaluation cycle {} started: {} strategies, {} bars",
             summary.cycle_id, registry_.size(), bars.size());

    for (const auto& strategy : registry_.all()) {
        const auto name = strategy->name();
        std::vector<storage::BacktestRecord> strategy_records;

        try {
            for (const auto& result : runner_.runFull(*strategy, bars)) {
                if (result.metrics.total_trades == 0) {
                    LOG_INFO("[{}] {}d window produced no trades, not persisted", name, result.window_days);
                    continue;
                }
                strategy_records.push_back(makeRecord(summary.cycle_id, name, result, evaluated_at_ms));
            }

            const auto wf = validator_.validate(*strategy, bars);
            if (wf.out_of_sample.metrics.total_trades > 0) {
                auto record = makeRecord(summary.cycle_id, name, wf.out_of_sample, evaluated_at_ms);
                record.is_walk_forward = true;
                record.start_timestamp = bars.front().timestamp;
                record.is_overfitted = wf.is_overfitted;
                record.insufficient_oos_trades = wf.insufficient_oos_trades;
                record.wfe_win_rate = wf.wfe_win_rate;
                record.wfe_profit_factor = wf.wfe_profit_factor;
                record.walk_forward_efficiency = wf.averageEfficiency();
                strategy_records.push_back(std::move(record));
                summary.walk_forward_records++;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Evaluation of strategy '{}' failed: {}", name, e.what());
            summary.strategies_failed++;
            continue;
        }

        summary.strategies_evaluated++;
        summary.records.insert(summary.records.end(), strategy_records.begin(), strategy_records.end());
    }

    if (!store_.commitCycle(summary.records)) {
        throw std::runtime_error("Evaluation cycle " + summary.cycle_id + ": result commit failed");
    }
    summary.records_written = static_cast<int>(summary.records.size());

    for (const auto& record : summary.records) {
        Logger::getInstance().logEvaluation(record.strategy_name, record.window_days,
                                            record.is_walk_forward, record.total_trades,
                                            record.win_rate, record.profit_factor, record.expectancy);
    }

    LOG_INFO("Evaluation cycle {} complete: {} strategies, {} records ({} walk-forward), {} failed",
             summary.cycle_id, summary.strategies_evaluated, summary.records_written,
             summary.walk_forward_records, summary.strategies_failed);
    return summary;
}

storage::BacktestRecord EvaluationCycle::makeRecord(const std::string& cycle_id,
                                                    const std::string& strategy,
                                                    const backtest::WindowResult& result,
                                                    long long evaluated_at_ms) const {
    storage::BacktestRecord record;
    record.cycle_id = cycle_id;
    record.strategy_name = strategy;
    record.timeframe = config_.timeframe;
    record.window_days = result.window_days;
    record.start_timestamp = result.start_timestamp;
    record.end_timestamp = result.end_timestamp;
    record.win_rate = result.metrics.win_rate;
    record.profit_factor = result.metrics.profit_factor;
    record.sharpe_ratio = result.metrics.sharpe_ratio;
    record.max_drawdown = result.metrics.max_drawdown;
    record.max_drawdown_pct = result.metrics.max_drawdown_pct;
    record.expectancy = result.metrics.expectancy;
    record.total_trades = result.metrics.total_trades;
    record.spread_model = config_.spread_model_tag;
    record.last_direction = lastDirectionOf(result.trades);
    record.evaluated_at_ms = evaluated_at_ms;
    return record;
}

} // namespace engine
} // namespace stratbench
