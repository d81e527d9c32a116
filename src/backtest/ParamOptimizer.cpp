#include "backtest/ParamOptimizer.h"
#include "strategy/StrategyFactory.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace stratbench {
namespace backtest {

namespace {

WalkForwardConfig walkForwardFor(const BacktestConfig& config) {
    WalkForwardConfig wf = config.walk_forward;
    wf.window_days = config.optimizer.window_days;
    return wf;
}

std::string describe(const strategy::ParamMap& params, const ParamSpace& space) {
    std::string out;
    for (const auto& kv : space) {
        auto it = params.find(kv.first);
        if (it == params.end()) continue;
        if (!out.empty()) out += ", ";
        out += fmt::format("{}={}", kv.first, it->second);
    }
    return out;
}

struct ScoredCandidate {
    strategy::ParamMap params;
    BacktestMetrics metrics;
    double score;
};

} // namespace

ParamOptimizer::ParamOptimizer(const BacktestConfig& config)
    : ParamOptimizer(config, [](const std::string& name, const strategy::ParamMap& params) {
          return strategy::StrategyFactory::create(name, params);
      })
{}

ParamOptimizer::ParamOptimizer(const BacktestConfig& config, StrategyBuilder builder)
    : config_(config.optimizer)
    , runner_(config)
    , validator_(walkForwardFor(config), BacktestRunner(config))
    , builder_(std::move(builder))
{}

std::vector<double> ParamOptimizer::gridValues(const ParamRange& range) {
    std::vector<double> values;
    if (!(range.step > 0.0) || range.max < range.min) {
        values.push_back(range.min);
        return values;
    }
    // Tolerance keeps the upper bound despite accumulated rounding.
    for (double v = range.min; v <= range.max + range.step * 0.01; v += range.step) {
        values.push_back(std::round(v * 10000.0) / 10000.0);
    }
    return values;
}

std::vector<strategy::ParamMap> ParamOptimizer::generateCandidates(const ParamSpace& space,
                                                                   const strategy::ParamMap& defaults) const {
    std::vector<strategy::ParamMap> candidates{defaults};
    const int samples = config_.num_samples - 1;
    if (samples <= 0 || space.empty()) {
        return candidates;
    }

    std::mt19937 rng(config_.seed != 0 ? config_.seed : std::random_device{}());
    std::uniform_real_distribution<double> jitter(0.0, 1.0);

    candidates.resize(static_cast<size_t>(samples) + 1, defaults);
    std::vector<int> strata(static_cast<size_t>(samples));

    // One stratum per sample in every dimension, shuffled independently.
    for (const auto& kv : space) {
        const auto values = gridValues(kv.second);
        std::iota(strata.begin(), strata.end(), 0);
        std::shuffle(strata.begin(), strata.end(), rng);

        for (int k = 0; k < samples; ++k) {
            const double position = (strata[k] + jitter(rng)) / samples;
            const size_t index = std::min(static_cast<size_t>(position * values.size()), values.size() - 1);
            candidates[static_cast<size_t>(k) + 1][kv.first] = values[index];
        }
    }
    return candidates;
}

double ParamOptimizer::compositeScore(const BacktestMetrics& metrics) {
    const double win_rate = metrics.win_rate;
    const double profit_factor = std::min(metrics.profit_factor, 3.0) / 3.0;
    const double sharpe = (std::clamp(metrics.sharpe_ratio, -1.0, 3.0) + 1.0) / 4.0;
    const double expectancy = (std::clamp(metrics.expectancy, -20.0, 50.0) + 20.0) / 70.0;
    const double drawdown = 1.0 - std::clamp(metrics.max_drawdown_pct, 0.0, 1.0);

    return 0.30 * win_rate
         + 0.25 * profit_factor
         + 0.15 * sharpe
         + 0.15 * expectancy
         + 0.15 * drawdown;
}

std::optional<OptimizationResult> ParamOptimizer::optimize(const std::string& strategy_name,
                                                           const std::vector<Candle>& bars) const {
    return optimize(strategy_name, bars, strategy::StrategyFactory::defaultParams(strategy_name));
}

std::optional<OptimizationResult> ParamOptimizer::optimize(const std::string& strategy_name,
                                                           const std::vector<Candle>& bars,
                                                           const strategy::ParamMap& defaults) const {
    auto space_it = config_.param_spaces.find(strategy_name);
    if (space_it == config_.param_spaces.end()) {
        LOG_WARN("Optimizer: no parameter space for strategy '{}', skipping", strategy_name);
        return std::nullopt;
    }
    const ParamSpace& space = space_it->second;

    const auto candidates = generateCandidates(space, defaults);
    LOG_INFO("Optimizer: {} candidates for '{}' (including defaults)", candidates.size(), strategy_name);

    std::vector<ScoredCandidate> scored;
    for (size_t i = 0; i < candidates.size(); ++i) {
        auto strategy = builder_(strategy_name, candidates[i]);
        if (!strategy) {
            LOG_ERROR("Optimizer: cannot build strategy '{}'", strategy_name);
            return std::nullopt;
        }

        const auto result = runner_.runWindow(*strategy, bars, config_.window_days);
        if (result.metrics.total_trades < config_.min_trades) {
            LOG_DEBUG("Optimizer: candidate #{} for '{}' has {} trades (< {})",
                      i, strategy_name, result.metrics.total_trades, config_.min_trades);
            continue;
        }
        scored.push_back({candidates[i], result.metrics, compositeScore(result.metrics)});
    }

    if (scored.empty()) {
        LOG_WARN("Optimizer: no viable candidates for '{}' (all had < {} trades)",
                 strategy_name, config_.min_trades);
        return std::nullopt;
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) { return a.score > b.score; });

    OptimizationResult out;
    out.strategy_name = strategy_name;
    out.combinations_tested = static_cast<int>(candidates.size());

    const size_t top_n = std::min(scored.size(), static_cast<size_t>(std::max(config_.top_n_validate, 0)));
    for (size_t i = 0; i < top_n; ++i) {
        const auto& candidate = scored[i];
        auto strategy = builder_(strategy_name, candidate.params);
        if (!strategy) {
            continue;
        }
        const auto wf = validator_.validate(*strategy, bars);
        if (wf.is_overfitted) {
            LOG_INFO("Optimizer: candidate for '{}' flagged as overfitted, trying next", strategy_name);
            continue;
        }

        out.best_params = candidate.params;
        out.metrics = candidate.metrics;
        out.score = candidate.score;
        out.wfe_ratio = wf.averageEfficiency();
        out.is_overfitted = false;
        LOG_INFO("Optimizer: best params for '{}': {} (score={:.4f}, trades={}, wfe={:.3f})",
                 strategy_name, describe(candidate.params, space), candidate.score,
                 candidate.metrics.total_trades, out.wfe_ratio.value_or(0.0));
        return out;
    }

    LOG_WARN("Optimizer: all top candidates for '{}' are overfitted, returning best with is_overfitted=true",
             strategy_name);
    out.best_params = scored.front().params;
    out.metrics = scored.front().metrics;
    out.score = scored.front().score;
    out.is_overfitted = true;
    return out;
}

} // namespace backtest
} // namespace stratbench
