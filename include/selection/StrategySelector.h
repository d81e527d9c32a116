#pragma once

#include "analytics/RegimeDetector.h"
#include "selection/SelectorConfig.h"
#include "storage/BacktestRecord.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stratbench {
namespace selection {

// Recent live results of a strategy, as tracked outside the evaluation core.
struct LivePerformance {
    int total_signals = 0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double avg_rr = 0.0;
};

struct SelectionInput {
    std::vector<std::string> strategies;                // candidates to rank
    std::vector<storage::BacktestRecord> records;       // stored results snapshot
    std::vector<Candle> recent_bars;                    // primary timeframe, for regime
    std::vector<Candle> higher_timeframe_bars;          // optional; empty disables confluence
    std::map<std::string, LivePerformance> live;        // optional
};

struct StrategyScore {
    std::string strategy_name;
    double composite_score = 0.0;

    double win_rate = 0.0;
    double profit_factor = 0.0;
    double sharpe_ratio = 0.0;
    double expectancy = 0.0;
    double max_drawdown = 0.0;
    int total_trades = 0;
    int window_days = 0;
    std::uint64_t record_id = 0;
    std::string last_direction;

    analytics::VolatilityRegime regime = analytics::VolatilityRegime::MEDIUM;
    bool is_degraded = false;
    std::string degradation_reason;     // empty when not degraded
    bool live_blended = false;
    bool has_confluence = false;
};

// Ranks strategies from their stored backtest results. Holds no state
// between calls; identical input always gives the identical ranking.
class StrategySelector {
public:
    StrategySelector() = default;
    explicit StrategySelector(SelectorConfig config) : config_(std::move(config)) {}

    std::optional<StrategyScore> selectBest(const SelectionInput& input) const;

    // Non-degraded strategies first, then by composite score descending.
    std::vector<StrategyScore> selectAllRanked(const SelectionInput& input) const;

    // EMA fast/slow trend on the higher timeframe agrees with the direction.
    // False when there are too few bars.
    bool checkHigherTimeframeConfluence(const std::vector<Candle>& bars, TradeDirection direction) const;

    double scoreLivePerformance(const LivePerformance& live) const;

    const SelectorConfig& config() const { return config_; }

private:
    std::vector<StrategyScore> computeScores(const std::vector<storage::BacktestRecord>& qualified) const;
    void applyRegimeModifier(std::vector<StrategyScore>& scores, analytics::VolatilityRegime regime) const;
    void applyLiveBlend(std::vector<StrategyScore>& scores,
                        const std::map<std::string, LivePerformance>& live) const;
    void checkDegradation(StrategyScore& score,
                          const storage::BacktestRecord& current,
                          const std::optional<storage::BacktestRecord>& baseline) const;

    SelectorConfig config_;
};

} // namespace selection
} // namespace stratbench
