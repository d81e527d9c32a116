#include "backtest/TradeSimulator.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace stratbench {
namespace backtest {

namespace {

bool isUsablePrice(double value) {
    return std::isfinite(value) && value > 0.0;
}

double directionalPnl(bool is_buy, double entry, double exit) {
    return is_buy ? (exit - entry) : (entry - exit);
}

} // namespace

std::string outcomeToString(TradeOutcome outcome) {
    switch (outcome) {
        case TradeOutcome::TP1_HIT: return "TP1_HIT";
        case TradeOutcome::TP2_HIT: return "TP2_HIT";
        case TradeOutcome::SL_HIT: return "SL_HIT";
        case TradeOutcome::EXPIRED: return "EXPIRED";
    }
    return "EXPIRED";
}

std::optional<std::string> TradeSimulator::validateCandidate(const strategy::TradeCandidate& candidate) {
    if (!isUsablePrice(candidate.entry_price) || !isUsablePrice(candidate.stop_loss) ||
        !isUsablePrice(candidate.take_profit_1) || !isUsablePrice(candidate.take_profit_2)) {
        return std::string("prices must be positive and finite");
    }

    if (candidate.direction == TradeDirection::BUY) {
        if (!(candidate.stop_loss < candidate.entry_price &&
              candidate.entry_price < candidate.take_profit_1 &&
              candidate.take_profit_1 < candidate.take_profit_2)) {
            return std::string("BUY requires stop < entry < tp1 < tp2");
        }
    } else {
        if (!(candidate.take_profit_2 < candidate.take_profit_1 &&
              candidate.take_profit_1 < candidate.entry_price &&
              candidate.entry_price < candidate.stop_loss)) {
            return std::string("SELL requires tp2 < tp1 < entry < stop");
        }
    }
    return std::nullopt;
}

std::optional<SimulatedTrade> TradeSimulator::simulate(const strategy::TradeCandidate& candidate,
                                                       const std::vector<Candle>& bars,
                                                       size_t signal_bar_index,
                                                       double spread) const {
    if (auto reason = validateCandidate(candidate)) {
        LOG_WARN("[{}] Rejected candidate at {}: {}",
                 candidate.strategy_name, candidate.timestamp, *reason);
        return std::nullopt;
    }
    if (signal_bar_index >= bars.size()) {
        LOG_WARN("[{}] Signal bar index {} outside series of {} bars",
                 candidate.strategy_name, signal_bar_index, bars.size());
        return std::nullopt;
    }

    const bool is_buy = candidate.direction == TradeDirection::BUY;
    const double stop = candidate.stop_loss;
    const double tp1 = candidate.take_profit_1;
    const double tp2 = candidate.take_profit_2;

    // BUY fills at the ask; SELL fills at the bid and is closed at the ask.
    const double entry = is_buy ? candidate.entry_price + spread : candidate.entry_price;

    const size_t max_forward = static_cast<size_t>(std::max(config_.max_bars_forward, 0));
    const size_t start = signal_bar_index + 1;
    const size_t end = std::min(start + max_forward, bars.size());

    for (size_t i = start; i < end; ++i) {
        const Candle& bar = bars[i];
        const int held = static_cast<int>(i - signal_bar_index);

        // Intra-bar order is unknown: stop first, then TP2, then TP1.
        const bool stop_hit = is_buy ? (bar.low <= stop) : (bar.high + spread >= stop);
        if (stop_hit) {
            return SimulatedTrade(candidate, TradeOutcome::SL_HIT, stop,
                                  directionalPnl(is_buy, entry, stop), held, spread, signal_bar_index);
        }

        const bool tp2_hit = is_buy ? (bar.high >= tp2) : (bar.low <= tp2);
        if (tp2_hit) {
            return SimulatedTrade(candidate, TradeOutcome::TP2_HIT, tp2,
                                  directionalPnl(is_buy, entry, tp2), held, spread, signal_bar_index);
        }

        const bool tp1_hit = is_buy ? (bar.high >= tp1) : (bar.low <= tp1);
        if (tp1_hit) {
            return SimulatedTrade(candidate, TradeOutcome::TP1_HIT, tp1,
                                  directionalPnl(is_buy, entry, tp1), held, spread, signal_bar_index);
        }
    }

    double exit_price = entry;
    int held = 0;
    if (end > start) {
        exit_price = bars[end - 1].close;
        held = static_cast<int>(end - 1 - signal_bar_index);
    }

    return SimulatedTrade(candidate, TradeOutcome::EXPIRED, exit_price,
                          directionalPnl(is_buy, entry, exit_price), held, spread, signal_bar_index);
}

std::optional<size_t> TradeSimulator::findSignalBarIndex(const std::vector<Candle>& bars,
                                                         TimestampMs timestamp_ms) {
    auto it = std::upper_bound(bars.begin(), bars.end(), timestamp_ms,
                               [](TimestampMs ts, const Candle& bar) { return ts < bar.timestamp; });
    if (it == bars.begin()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(bars.begin(), it) - 1);
}

std::vector<SimulatedTrade> TradeSimulator::simulateMany(const std::vector<strategy::TradeCandidate>& candidates,
                                                         const std::vector<Candle>& bars,
                                                         const SpreadModel& spread_model) const {
    std::vector<SimulatedTrade> trades;
    trades.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        auto index = findSignalBarIndex(bars, candidate.timestamp);
        if (!index) {
            LOG_WARN("[{}] Candidate timestamp {} precedes the price history",
                     candidate.strategy_name, candidate.timestamp);
            continue;
        }

        auto trade = simulate(candidate, bars, *index, spread_model.getSpread(candidate.timestamp));
        if (trade) {
            trades.push_back(std::move(*trade));
        }
    }
    return trades;
}

} // namespace backtest
} // namespace stratbench
