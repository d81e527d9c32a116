#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/SpreadModel.h"
#include "strategy/IStrategy.h"
#include <optional>
#include <string>
#include <vector>

namespace stratbench {
namespace backtest {

enum class TradeOutcome {
    TP1_HIT,
    TP2_HIT,
    SL_HIT,
    EXPIRED
};

std::string outcomeToString(TradeOutcome outcome);

// Result of walking one candidate through subsequent bars. No setters: a new
// simulation run produces a fresh set of trades.
class SimulatedTrade {
public:
    SimulatedTrade(strategy::TradeCandidate candidate,
                   TradeOutcome outcome,
                   double exit_price,
                   double pnl,
                   int bars_held,
                   double spread_cost,
                   size_t signal_bar_index)
        : candidate_(std::move(candidate))
        , outcome_(outcome)
        , exit_price_(exit_price)
        , pnl_(pnl)
        , bars_held_(bars_held)
        , spread_cost_(spread_cost)
        , signal_bar_index_(signal_bar_index)
    {}

    const strategy::TradeCandidate& candidate() const { return candidate_; }
    TradeOutcome outcome() const { return outcome_; }
    double exitPrice() const { return exit_price_; }
    double pnl() const { return pnl_; }                 // price distance, signed
    int barsHeld() const { return bars_held_; }
    double spreadCost() const { return spread_cost_; }
    size_t signalBarIndex() const { return signal_bar_index_; }

    bool isWin() const {
        return outcome_ == TradeOutcome::TP1_HIT || outcome_ == TradeOutcome::TP2_HIT;
    }

private:
    strategy::TradeCandidate candidate_;
    TradeOutcome outcome_;
    double exit_price_;
    double pnl_;
    int bars_held_;
    double spread_cost_;
    size_t signal_bar_index_;
};

class TradeSimulator {
public:
    TradeSimulator() = default;
    explicit TradeSimulator(SimulatorConfig config) : config_(config) {}

    // Reason the candidate is malformed, or nullopt when it is well-formed.
    static std::optional<std::string> validateCandidate(const strategy::TradeCandidate& candidate);

    // Walks bars (signal_bar_index, signal_bar_index + max_bars_forward].
    // Malformed candidates are logged and rejected with nullopt.
    std::optional<SimulatedTrade> simulate(const strategy::TradeCandidate& candidate,
                                           const std::vector<Candle>& bars,
                                           size_t signal_bar_index,
                                           double spread) const;

    // Locates each candidate's own bar by timestamp and prices it with the
    // spread of its own timestamp. Rejected candidates are dropped.
    std::vector<SimulatedTrade> simulateMany(const std::vector<strategy::TradeCandidate>& candidates,
                                             const std::vector<Candle>& bars,
                                             const SpreadModel& spread_model) const;

    // Index of the last bar with timestamp <= timestamp_ms.
    static std::optional<size_t> findSignalBarIndex(const std::vector<Candle>& bars,
                                                    TimestampMs timestamp_ms);

    int maxBarsForward() const { return config_.max_bars_forward; }

private:
    SimulatorConfig config_;
};

} // namespace backtest
} // namespace stratbench
