#include "backtest/ParamOptimizer.h"
#include "strategy/StrategyFactory.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>

using namespace stratbench;

namespace {
// 2024-01-01 00:00:00 UTC
constexpr long long DAY_START_MS = 1704067200000LL;

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

// One point per hour up to `peak`, then one point down per hour.
std::vector<Candle> peakBars(int count, int peak) {
    std::vector<Candle> bars;
    for (int i = 0; i < count; ++i) {
        const double close = 2000.0 + (i <= peak ? i : 2 * peak - i);
        bars.emplace_back(close, close + 0.5, close - 0.5, close, 100.0, DAY_START_MS + i * MS_PER_HOUR);
    }
    return bars;
}

// Long at the window close: stop 10 below, targets `target` and `target` + 10 above.
class ScaledLongStrategy : public strategy::IStrategy {
public:
    explicit ScaledLongStrategy(double target) : target_(target) {}

    strategy::StrategyInfo getInfo() const override {
        strategy::StrategyInfo info;
        info.name = "scaled_long";
        info.timeframe = "H1";
        info.min_bars = 1;
        return info;
    }

    strategy::StrategyDecision analyze(const std::vector<Candle>& window) const override {
        strategy::TradeCandidate c;
        c.strategy_name = "scaled_long";
        c.direction = TradeDirection::BUY;
        c.entry_price = window.back().close;
        c.stop_loss = c.entry_price - 10.0;
        c.take_profit_1 = c.entry_price + target_;
        c.take_profit_2 = c.entry_price + target_ + 10.0;
        c.timestamp = window.back().timestamp;

        strategy::StrategyDecision decision;
        decision.candidates.push_back(c);
        return decision;
    }

private:
    double target_;
};

strategy::StrategyPtr buildScaledLong(const std::string& name, const strategy::ParamMap& params) {
    if (name != "scaled_long") {
        return nullptr;
    }
    auto it = params.find("target");
    return std::make_shared<ScaledLongStrategy>(it == params.end() ? 20.0 : it->second);
}

backtest::BacktestConfig optimizerConfig() {
    backtest::BacktestConfig cfg;
    cfg.optimizer.window_days = 1;
    cfg.optimizer.min_trades = 10;
    cfg.optimizer.seed = 42;
    cfg.optimizer.param_spaces = {{"scaled_long", {{"target", {10.0, 40.0, 10.0}}}}};
    cfg.walk_forward.min_oos_trades = 3;
    return cfg;
}

}

void testGridAndScore() {
    const auto grid = backtest::ParamOptimizer::gridValues({0.3, 1.0, 0.1});
    assert(grid.size() == 8);
    assert(near(grid.front(), 0.3));
    assert(near(grid.back(), 1.0));
    assert(backtest::ParamOptimizer::gridValues({5.0, 5.0, 1.0}).size() == 1);
    // Degenerate steps collapse to the lower bound
    assert((backtest::ParamOptimizer::gridValues({2.0, 4.0, 0.0}) == std::vector<double>{2.0}));

    backtest::BacktestMetrics m;
    m.win_rate = 0.5;
    m.profit_factor = 6.0;          // capped at 3
    m.sharpe_ratio = 5.0;           // capped at 3
    m.expectancy = -30.0;           // floored at -20
    m.max_drawdown_pct = 0.2;
    assert(near(backtest::ParamOptimizer::compositeScore(m), 0.15 + 0.25 + 0.15 + 0.0 + 0.12));

    backtest::BacktestMetrics empty;
    assert(near(backtest::ParamOptimizer::compositeScore(empty), 0.15 * 0.25 + 0.15 * (20.0 / 70.0) + 0.15));
    std::cout << "  grid / score OK" << std::endl;
}

void testCandidates() {
    const auto cfg = optimizerConfig();
    const backtest::ParamOptimizer optimizer(cfg, buildScaledLong);
    const strategy::ParamMap defaults{{"target", 25.0}, {"fixed", 7.0}};
    const auto& space = cfg.optimizer.param_spaces.at("scaled_long");

    const auto candidates = optimizer.generateCandidates(space, defaults);
    assert(candidates.size() == 25);
    assert(candidates.front() == defaults);

    // Latin hypercube: 24 samples over 4 grid values hit each value 6 times
    std::map<double, int> counts;
    for (size_t i = 1; i < candidates.size(); ++i) {
        counts[candidates[i].at("target")]++;
        // Parameters outside the space keep their defaults
        assert(candidates[i].at("fixed") == 7.0);
    }
    assert(counts.size() == 4);
    for (const auto& kv : counts) {
        assert(kv.second == 6);
    }

    // A fixed seed reproduces the same samples
    assert(optimizer.generateCandidates(space, defaults) == candidates);

    // No space or a single sample: only the defaults
    assert(optimizer.generateCandidates({}, defaults).size() == 1);
    auto single = cfg;
    single.optimizer.num_samples = 1;
    assert(backtest::ParamOptimizer(single, buildScaledLong).generateCandidates(space, defaults).size() == 1);
    std::cout << "  candidates OK" << std::endl;
}

void testOptimizeSelectsBest() {
    const backtest::ParamOptimizer optimizer(optimizerConfig(), buildScaledLong);
    const auto bars = peakBars(960, 960);

    const auto result = optimizer.optimize("scaled_long", bars, {{"target", 20.0}});
    assert(result);
    assert(result->strategy_name == "scaled_long");
    assert(result->combinations_tested == 25);
    // Every target wins on a steady rise; the widest one earns the most
    assert(result->best_params.at("target") == 40.0);
    assert(result->metrics.total_trades == 36);
    assert(near(result->metrics.win_rate, 1.0));
    assert(near(result->score, backtest::ParamOptimizer::compositeScore(result->metrics)));
    assert(!result->is_overfitted);
    assert(result->wfe_ratio && near(*result->wfe_ratio, 1.0));
    std::cout << "  best candidate OK" << std::endl;
}

void testOptimizeOverfitted() {
    const backtest::ParamOptimizer optimizer(optimizerConfig(), buildScaledLong);
    // In-sample rises; out-of-sample falls and every trade is stopped out
    const auto bars = peakBars(1000, 800);

    const auto result = optimizer.optimize("scaled_long", bars, {{"target", 20.0}});
    assert(result);
    assert(result->is_overfitted);
    assert(!result->wfe_ratio);
    assert(result->metrics.total_trades >= 10);
    assert(near(result->score, backtest::ParamOptimizer::compositeScore(result->metrics)));
    std::cout << "  overfitted fallback OK" << std::endl;
}

void testOptimizeRejects() {
    const auto bars = peakBars(960, 960);

    // Not enough trades anywhere
    auto strict = optimizerConfig();
    strict.optimizer.min_trades = 100;
    assert(!backtest::ParamOptimizer(strict, buildScaledLong).optimize("scaled_long", bars, {}));

    const backtest::ParamOptimizer optimizer(optimizerConfig(), buildScaledLong);
    // No search space configured
    assert(!optimizer.optimize("ema_momentum", bars, {}));

    // Space present but the strategy cannot be built
    auto orphan = optimizerConfig();
    orphan.optimizer.param_spaces["missing"] = {{"x", {1.0, 2.0, 1.0}}};
    assert(!backtest::ParamOptimizer(orphan, buildScaledLong).optimize("missing", bars, {}));
    std::cout << "  rejections OK" << std::endl;
}

void testBuiltinSpaces() {
    // Shipped spaces name parameters the strategies actually have
    const backtest::OptimizerConfig cfg;
    for (const auto& name : strategy::StrategyFactory::builtinNames()) {
        const auto defaults = strategy::StrategyFactory::defaultParams(name);
        const auto& space = cfg.param_spaces.at(name);
        for (const auto& kv : space) {
            assert(defaults.count(kv.first) == 1);
            assert(kv.second.min <= kv.second.max);
        }
    }
    std::cout << "  builtin spaces OK" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting ParamOptimizer Test..." << std::endl;

    testGridAndScore();
    testCandidates();
    testOptimizeSelectsBest();
    testOptimizeOverfitted();
    testOptimizeRejects();
    testBuiltinSpaces();

    std::cout << "[TEST] ParamOptimizer Test PASSED!" << std::endl;
    return 0;
}
