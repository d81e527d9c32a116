#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <optional>

namespace stratbench {
namespace strategy {

// Stop hunts on H1: a candle wicks through a recent swing level and closes
// back inside, then a close beyond the sweep candle confirms the reversal.
class LiquiditySweepStrategy : public IStrategy {
public:
    LiquiditySweepStrategy() = default;
    explicit LiquiditySweepStrategy(LiquiditySweepStrategyConfig config) : config_(config) {}

    StrategyInfo getInfo() const override;
    StrategyDecision analyze(const std::vector<Candle>& window) const override;

private:
    std::optional<TradeCandidate> checkSweep(const std::vector<Candle>& bars,
                                             size_t i,
                                             const std::vector<size_t>& swings,
                                             double atr,
                                             TradeDirection direction) const;

    LiquiditySweepStrategyConfig config_;
};

} // namespace strategy
} // namespace stratbench
