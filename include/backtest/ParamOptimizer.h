#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestRunner.h"
#include "backtest/WalkForwardValidator.h"
#include "strategy/StrategyConfig.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stratbench {
namespace backtest {

struct OptimizationResult {
    std::string strategy_name;
    strategy::ParamMap best_params;
    BacktestMetrics metrics;
    double score = 0.0;
    std::optional<double> wfe_ratio;    // mean walk-forward efficiency, when computable
    bool is_overfitted = false;         // every validated candidate failed walk-forward
    int combinations_tested = 0;
};

// Searches a strategy's parameter space: Latin hypercube samples around the
// defaults are backtested on one horizon, ranked by a fixed-scale composite
// score, and the leaders re-checked walk-forward.
class ParamOptimizer {
public:
    using StrategyBuilder = std::function<strategy::StrategyPtr(const std::string&, const strategy::ParamMap&)>;

    explicit ParamOptimizer(const BacktestConfig& config);
    ParamOptimizer(const BacktestConfig& config, StrategyBuilder builder);

    // Defaults come from the shipped strategy of that name.
    std::optional<OptimizationResult> optimize(const std::string& strategy_name,
                                               const std::vector<Candle>& bars) const;

    // std::nullopt when the strategy has no search space, cannot be built,
    // or no sample reaches the minimum trade count.
    std::optional<OptimizationResult> optimize(const std::string& strategy_name,
                                               const std::vector<Candle>& bars,
                                               const strategy::ParamMap& defaults) const;

    // defaults first, then num_samples - 1 Latin hypercube samples.
    std::vector<strategy::ParamMap> generateCandidates(const ParamSpace& space,
                                                       const strategy::ParamMap& defaults) const;

    static std::vector<double> gridValues(const ParamRange& range);

    // Weighted sum of metrics mapped onto fixed [0, 1] scales, so scores are
    // comparable across runs (unlike the selector's min-max ranking).
    static double compositeScore(const BacktestMetrics& metrics);

private:
    OptimizerConfig config_;
    BacktestRunner runner_;
    WalkForwardValidator validator_;
    StrategyBuilder builder_;
};

} // namespace backtest
} // namespace stratbench
