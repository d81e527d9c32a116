#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestRunner.h"
#include "backtest/WalkForwardValidator.h"
#include "storage/IResultStore.h"
#include "strategy/StrategyRegistry.h"
#include <string>
#include <vector>

namespace stratbench {
namespace engine {

struct CycleSummary {
    std::string cycle_id;
    bool skipped = false;                   // history too short, nothing evaluated
    int strategies_evaluated = 0;
    int strategies_failed = 0;
    int records_written = 0;
    int walk_forward_records = 0;
    std::vector<storage::BacktestRecord> records;
};

// Daily batch job: backtests every registered strategy on each horizon,
// validates it walk-forward and commits all resulting records at once.
class EvaluationCycle {
public:
    EvaluationCycle(const backtest::BacktestConfig& config,
                    const strategy::StrategyRegistry& registry,
                    storage::IResultStore& store);

    // Throws std::runtime_error on empty history or a failed commit.
    CycleSummary run(const std::vector<Candle>& bars);
    CycleSummary run(const std::vector<Candle>& bars, long long evaluated_at_ms);

private:
    storage::BacktestRecord makeRecord(const std::string& cycle_id,
                                       const std::string& strategy,
                                       const backtest::WindowResult& result,
                                       long long evaluated_at_ms) const;

    backtest::BacktestConfig config_;
    const strategy::StrategyRegistry& registry_;
    storage::IResultStore& store_;
    backtest::BacktestRunner runner_;
    backtest::WalkForwardValidator validator_;
};

} // namespace engine
} // namespace stratbench
