#pragma once

#include "common/Types.h"
#include <string>
#include <vector>
#include <memory>

namespace stratbench {
namespace strategy {

// Proposed trade produced by a strategy's decision function.
struct TradeCandidate {
    std::string strategy_name;
    std::string symbol;
    std::string timeframe;              // e.g. "H1"
    TradeDirection direction;
    double entry_price;
    double stop_loss;
    double take_profit_1;
    double take_profit_2;               // further from entry than take_profit_1
    double risk_reward;
    double confidence;                  // 0 ~ 100
    std::string reasoning;
    long long timestamp;                // bar that triggered the candidate (ms)

    TradeCandidate()
        : symbol("XAUUSD")
        , timeframe("H1")
        , direction(TradeDirection::BUY)
        , entry_price(0.0)
        , stop_loss(0.0)
        , take_profit_1(0.0)
        , take_profit_2(0.0)
        , risk_reward(0.0)
        , confidence(0.0)
        , timestamp(0)
    {}
};

enum class DecisionStatus {
    OK,
    INSUFFICIENT_HISTORY    // window shorter than the strategy's declared minimum
};

struct StrategyDecision {
    DecisionStatus status = DecisionStatus::OK;
    std::vector<TradeCandidate> candidates;

    static StrategyDecision insufficientHistory() {
        StrategyDecision decision;
        decision.status = DecisionStatus::INSUFFICIENT_HISTORY;
        return decision;
    }
};

struct StrategyInfo {
    std::string name;
    std::string description;
    std::string timeframe;
    int min_bars;

    StrategyInfo() : min_bars(0) {}
};

// Strategy decision-function contract. The backtester and the live signal
// path call the same analyze() with the same bounded window.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // window: bars ending at "now" for this decision, oldest first.
    virtual StrategyDecision analyze(const std::vector<Candle>& window) const = 0;

    std::string name() const { return getInfo().name; }
    int minBars() const { return getInfo().min_bars; }
};

using StrategyPtr = std::shared_ptr<IStrategy>;

} // namespace strategy
} // namespace stratbench
