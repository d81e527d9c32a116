#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <optional>

namespace stratbench {
namespace strategy {

// EMA50/200 trend pullbacks on H1: price stretches away from the EMA50,
// pulls back into its zone, then a confirmation candle closes beyond the
// pullback bar in the trend direction.
class TrendContinuationStrategy : public IStrategy {
public:
    TrendContinuationStrategy() = default;
    explicit TrendContinuationStrategy(TrendContinuationStrategyConfig config) : config_(config) {}

    StrategyInfo getInfo() const override;
    StrategyDecision analyze(const std::vector<Candle>& window) const override;

private:
    struct Context {
        const std::vector<Candle>& bars;
        const std::vector<double>& ema_fast;
        const std::vector<double>& ema_slow;
        const std::vector<double>& atr;
        const std::vector<double>& vwap;        // empty without volume
        const std::vector<size_t>& swing_highs;
        const std::vector<size_t>& swing_lows;
    };

    // Pullback at bar `i`, confirmed by bar i + 1.
    std::optional<TradeCandidate> checkContinuation(const Context& ctx, size_t i, TradeDirection direction) const;

    std::optional<double> findSwingTarget(const Context& ctx, size_t i, double entry, TradeDirection direction) const;

    TrendContinuationStrategyConfig config_;
};

} // namespace strategy
} // namespace stratbench
