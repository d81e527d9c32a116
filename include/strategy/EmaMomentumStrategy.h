#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace stratbench {
namespace strategy {

// Trend-following momentum on H1: EMA21/50/200 stacked and sloping the same
// way, confirmed by a strong candle during London or New York hours.
// Every bar from min_bars to the end of the window is scanned.
class EmaMomentumStrategy : public IStrategy {
public:
    EmaMomentumStrategy() = default;
    explicit EmaMomentumStrategy(EmaMomentumStrategyConfig config) : config_(config) {}

    StrategyInfo getInfo() const override;
    StrategyDecision analyze(const std::vector<Candle>& window) const override;

private:
    struct Snapshot {
        double ema_fast;
        double ema_mid;
        double ema_slow;
        double atr;
    };

    TradeCandidate buildCandidate(const std::vector<Candle>& window,
                                  size_t index,
                                  const std::vector<size_t>& swings,
                                  TradeDirection direction,
                                  const Snapshot& snap) const;
    double computeConfidence(double entry, const Snapshot& snap, long long timestamp) const;

    EmaMomentumStrategyConfig config_;
};

} // namespace strategy
} // namespace stratbench
