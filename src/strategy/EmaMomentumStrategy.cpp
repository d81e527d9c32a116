#include "strategy/EmaMomentumStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/TradingSessions.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace stratbench {
namespace strategy {

using analytics::TechnicalIndicators;
using analytics::TradingSessions;

StrategyInfo EmaMomentumStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "ema_momentum";
    info.description = "EMA21/50/200 momentum with strong-candle confirmation";
    info.timeframe = "H1";
    info.min_bars = config_.ema_slow;
    return info;
}

StrategyDecision EmaMomentumStrategy::analyze(const std::vector<Candle>& window) const {
    const size_t min_bars = static_cast<size_t>(std::max(getInfo().min_bars, 0));
    if (window.size() < min_bars ||
        window.size() < static_cast<size_t>(config_.ema_mid + config_.slope_bars)) {
        return StrategyDecision::insufficientHistory();
    }

    const size_t n = window.size();
    const auto closes = TechnicalIndicators::extractClosePrices(window);
    const auto fast = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateEMAVector(closes, config_.ema_fast), n);
    const auto mid = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateEMAVector(closes, config_.ema_mid), n);
    const auto slow = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateEMAVector(closes, config_.ema_slow), n);
    const auto atr = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateATRSeries(window, config_.atr_period), n);
    const auto swing_lows = TechnicalIndicators::findSwingLows(window, config_.swing_order, n);
    const auto swing_highs = TechnicalIndicators::findSwingHighs(window, config_.swing_order, n);

    const size_t slope = static_cast<size_t>(std::max(config_.slope_bars, 0));
    StrategyDecision decision;

    for (size_t i = std::max(min_bars, slope); i < n; ++i) {
        const Candle& bar = window[i];

        Snapshot snap;
        snap.ema_fast = fast[i];
        snap.ema_mid = mid[i];
        snap.ema_slow = slow[i];
        snap.atr = atr[i];
        if (std::isnan(snap.atr) || !(snap.atr > 0.0) ||
            std::isnan(snap.ema_fast) || std::isnan(snap.ema_mid) || std::isnan(snap.ema_slow)) {
            continue;
        }

        if (!TradingSessions::isInSession(bar.timestamp, "london") &&
            !TradingSessions::isInSession(bar.timestamp, "new_york")) {
            continue;
        }

        const double body = std::abs(bar.close - bar.open);
        if (body < config_.body_atr_mult * snap.atr) {
            continue;
        }

        const double fast_prev = fast[i - slope];
        const double mid_prev = mid[i - slope];
        if (std::isnan(fast_prev) || std::isnan(mid_prev)) {
            continue;
        }

        const bool bullish = snap.ema_fast > snap.ema_mid && snap.ema_mid > snap.ema_slow &&
                             snap.ema_fast > fast_prev && snap.ema_mid > mid_prev &&
                             bar.close > bar.open && bar.close > snap.ema_fast;

        const bool bearish = snap.ema_fast < snap.ema_mid && snap.ema_mid < snap.ema_slow &&
                             snap.ema_fast < fast_prev && snap.ema_mid < mid_prev &&
                             bar.close < bar.open && bar.close < snap.ema_fast;

        if (bullish) {
            decision.candidates.push_back(buildCandidate(window, i, swing_lows, TradeDirection::BUY, snap));
        } else if (bearish) {
            decision.candidates.push_back(buildCandidate(window, i, swing_highs, TradeDirection::SELL, snap));
        }
    }
    return decision;
}

TradeCandidate EmaMomentumStrategy::buildCandidate(const std::vector<Candle>& window,
                                                   size_t index,
                                                   const std::vector<size_t>& swings,
                                                   TradeDirection direction,
                                                   const Snapshot& snap) const {
    const Candle& bar = window[index];
    const bool is_buy = direction == TradeDirection::BUY;
    const double entry = bar.close;
    const size_t lookback = static_cast<size_t>(std::max(config_.swing_lookback, 0));
    const size_t from = index > lookback ? index - lookback : 0;
    const size_t order = static_cast<size_t>(std::max(config_.swing_order, 0));

    // Most extreme confirmed swing in the lookback, else the raw extreme
    // including the signal bar.
    bool found = false;
    double extreme = 0.0;
    for (size_t s : swings) {
        if (s < from || s >= index || s + order > index) continue;
        const double level = is_buy ? window[s].low : window[s].high;
        if (!found || (is_buy ? level < extreme : level > extreme)) {
            extreme = level;
            found = true;
        }
    }
    if (!found) {
        extreme = is_buy
            ? TechnicalIndicators::lowestLow(window, index + 1, static_cast<int>(lookback) + 1)
            : TechnicalIndicators::highestHigh(window, index + 1, static_cast<int>(lookback) + 1);
    }

    double stop = is_buy ? extreme - config_.stop_atr_mult * snap.atr
                         : extreme + config_.stop_atr_mult * snap.atr;

    double risk = std::abs(entry - stop);
    if (risk > config_.max_stop_distance) {
        stop = is_buy ? entry - config_.max_stop_distance : entry + config_.max_stop_distance;
        risk = config_.max_stop_distance;
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
    candidate.confidence = computeConfidence(entry, snap, bar.timestamp);
    candidate.timestamp = bar.timestamp;

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2)
           << (is_buy ? "Bullish" : "Bearish") << " EMA momentum: EMA" << config_.ema_fast << " " << snap.ema_fast
           << (is_buy ? " > " : " < ") << "EMA" << config_.ema_mid << " " << snap.ema_mid
           << (is_buy ? " > " : " < ") << "EMA" << config_.ema_slow << " " << snap.ema_slow
           << ", strong candle at " << entry << ", SL " << stop;
    candidate.reasoning = reason.str();
    return candidate;
}

double EmaMomentumStrategy::computeConfidence(double entry, const Snapshot& snap, long long timestamp) const {
    double score = config_.base_confidence;

    if (std::abs(snap.ema_fast - snap.ema_mid) > 1.0 * snap.atr) {
        score += 10.0;
    }
    if (std::abs(entry - snap.ema_fast) > 0.3 * snap.atr) {
        score += 10.0;
    }
    if (TradingSessions::isInSession(timestamp, "overlap")) {
        score += 10.0;
    }
    if (std::abs(snap.ema_mid - snap.ema_slow) > 2.0 * snap.atr) {
        score += 10.0;
    }
    return std::min(score, 100.0);
}

} // namespace strategy
} // namespace stratbench
