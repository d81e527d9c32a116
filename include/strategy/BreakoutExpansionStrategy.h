#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <optional>

namespace stratbench {
namespace strategy {

// Volatility contraction then expansion on H1: a run of bars with ATR well
// under its moving average defines a range, and the first bar that leaves
// the compression and closes outside the range is the breakout.
class BreakoutExpansionStrategy : public IStrategy {
public:
    BreakoutExpansionStrategy() = default;
    explicit BreakoutExpansionStrategy(BreakoutExpansionStrategyConfig config) : config_(config) {}

    StrategyInfo getInfo() const override;
    StrategyDecision analyze(const std::vector<Candle>& window) const override;

private:
    std::optional<TradeCandidate> checkBreakout(const std::vector<Candle>& bars,
                                                size_t i,
                                                size_t range_start,
                                                double atr,
                                                bool has_volume) const;

    BreakoutExpansionStrategyConfig config_;
};

} // namespace strategy
} // namespace stratbench
