#include "strategy/LiquiditySweepStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/TradingSessions.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace stratbench {
namespace strategy {

using analytics::TechnicalIndicators;
using analytics::TradingSessions;

namespace {
constexpr size_t MIN_SCAN_START = 20;
}

StrategyInfo LiquiditySweepStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "liquidity_sweep";
    info.description = "Swing-level liquidity sweep reversal";
    info.timeframe = "H1";
    info.min_bars = config_.min_bars;
    return info;
}

StrategyDecision LiquiditySweepStrategy::analyze(const std::vector<Candle>& window) const {
    const size_t min_bars = static_cast<size_t>(std::max(getInfo().min_bars, 0));
    if (window.size() < min_bars) {
        return StrategyDecision::insufficientHistory();
    }

    const size_t n = window.size();
    const auto atr = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateATRSeries(window, config_.atr_period), n);
    const auto swing_lows = TechnicalIndicators::findSwingLows(window, config_.swing_order, n);
    const auto swing_highs = TechnicalIndicators::findSwingHighs(window, config_.swing_order, n);

    StrategyDecision decision;
    for (size_t i = std::max(min_bars, MIN_SCAN_START); i < n; ++i) {
        if (std::isnan(atr[i]) || !(atr[i] > 0.0)) {
            continue;
        }
        if (!TradingSessions::isInSession(window[i].timestamp, "london") &&
            !TradingSessions::isInSession(window[i].timestamp, "new_york")) {
            continue;
        }

        // At most one candidate per sweep candle; the bullish reading wins.
        auto candidate = checkSweep(window, i, swing_lows, atr[i], TradeDirection::BUY);
        if (!candidate) {
            candidate = checkSweep(window, i, swing_highs, atr[i], TradeDirection::SELL);
        }
        if (candidate) {
            decision.candidates.push_back(std::move(*candidate));
        }
    }
    return decision;
}

std::optional<TradeCandidate> LiquiditySweepStrategy::checkSweep(const std::vector<Candle>& bars,
                                                                 size_t i,
                                                                 const std::vector<size_t>& swings,
                                                                 double atr,
                                                                 TradeDirection direction) const {
    const bool is_buy = direction == TradeDirection::BUY;
    const Candle& sweep = bars[i];
    const size_t lookback = static_cast<size_t>(std::max(config_.lookback, 0));
    const size_t from = i > lookback ? i - lookback : 0;
    const size_t order = static_cast<size_t>(std::max(config_.swing_order, 0));

    // Levels wicked through with the close back on the near side.
    int swept = 0;
    double level = 0.0;
    for (size_t s : swings) {
        if (s < from || s >= i || s + order > i) continue;
        const double candidate_level = is_buy ? bars[s].low : bars[s].high;
        const bool taken = is_buy
            ? (sweep.low < candidate_level && candidate_level <= sweep.close)
            : (sweep.high > candidate_level && candidate_level >= sweep.close);
        if (!taken) continue;
        if (swept == 0 || (is_buy ? candidate_level < level : candidate_level > level)) {
            level = candidate_level;
        }
        ++swept;
    }
    if (swept == 0) {
        return std::nullopt;
    }

    const size_t confirm_end = std::min(i + 1 + static_cast<size_t>(std::max(config_.confirm_bars, 0)), bars.size());
    std::optional<size_t> confirm_index;
    for (size_t j = i + 1; j < confirm_end; ++j) {
        if (is_buy ? bars[j].close > sweep.high : bars[j].close < sweep.low) {
            confirm_index = j;
            break;
        }
    }
    if (!confirm_index) {
        return std::nullopt;
    }

    const Candle& confirm = bars[*confirm_index];
    const double entry = confirm.close;
    const double stop = is_buy ? sweep.low - config_.stop_atr_mult * atr
                               : sweep.high + config_.stop_atr_mult * atr;
    const double risk = std::abs(entry - stop);
    if (!(risk > 0.0)) {
        return std::nullopt;
    }

    double score = config_.base_confidence;
    const double wick = is_buy ? level - sweep.low : sweep.high - level;
    if (wick > atr) {
        score += 10.0;
    }
    const double range = confirm.high - confirm.low;
    if (range > 0.0) {
        const double close_position = is_buy ? (confirm.close - confirm.low) / range
                                             : (confirm.high - confirm.close) / range;
        if (close_position > 0.7) {
            score += 10.0;
        }
    }
    if (TradingSessions::isInSession(sweep.timestamp, "overlap")) {
        score += 10.0;
    }
    if (swept >= 2) {
        score += 10.0;
    }

    TradeCandidate candidate;
    candidate.strategy_name = getInfo().name;
    candidate.timeframe = getInfo().timeframe;
    candidate.direction = direction;
    candidate.entry_price = entry;
    candidate.stop_loss = stop;
    candidate.take_profit_1 = is_buy ? entry + config_.tp1_rr * risk : entry - config_.tp1_rr * risk;
    candidate.take_profit_2 = is_buy ? entry + config_.tp2_rr * risk : entry - config_.tp2_rr * risk;
    candidate.risk_reward = config_.tp1_rr;
    candidate.confidence = std::min(score, 100.0);
    candidate.timestamp = confirm.timestamp;

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2)
           << (is_buy ? "Bullish" : "Bearish") << " liquidity sweep "
           << (is_buy ? "below swing low " : "above swing high ") << level
           << ", reversal confirmed at " << entry << ", SL " << stop;
    candidate.reasoning = reason.str();
    return candidate;
}

} // namespace strategy
} // namespace stratbench
