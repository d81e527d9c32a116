#include "strategy/TrendContinuationStrategy.h"
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
constexpr size_t SPREAD_TREND_BARS = 10;
}

StrategyInfo TrendContinuationStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "trend_continuation";
    info.description = "EMA50/200 trend pullback with momentum confirmation";
    info.timeframe = "H1";
    info.min_bars = config_.ema_slow;
    return info;
}

StrategyDecision TrendContinuationStrategy::analyze(const std::vector<Candle>& window) const {
    const size_t min_bars = static_cast<size_t>(std::max(getInfo().min_bars, 0));
    if (window.size() < min_bars || window.size() < static_cast<size_t>(std::max(config_.ema_fast, 0))) {
        return StrategyDecision::insufficientHistory();
    }

    const size_t n = window.size();
    const auto closes = TechnicalIndicators::extractClosePrices(window);
    const auto ema_fast = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateEMAVector(closes, config_.ema_fast), n);
    const auto ema_slow = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateEMAVector(closes, config_.ema_slow), n);
    const auto atr = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateATRSeries(window, config_.atr_period), n);
    const auto vwap = TechnicalIndicators::calculateVWAPSeries(window);
    const auto swing_highs = TechnicalIndicators::findSwingHighs(window, config_.swing_order, n);
    const auto swing_lows = TechnicalIndicators::findSwingLows(window, config_.swing_order, n);

    const Context ctx{window, ema_fast, ema_slow, atr, vwap, swing_highs, swing_lows};
    StrategyDecision decision;

    // The last bar has no confirmation candle yet.
    for (size_t i = min_bars; i + 1 < n; ++i) {
        const double atr_val = atr[i];
        const double fast = ema_fast[i];
        const double slow = ema_slow[i];
        if (std::isnan(atr_val) || !(atr_val > 0.0) || std::isnan(fast) || std::isnan(slow)) {
            continue;
        }

        if (!TradingSessions::isInSession(window[i].timestamp, "london") &&
            !TradingSessions::isInSession(window[i].timestamp, "new_york")) {
            continue;
        }

        if (std::abs(fast - slow) < config_.trend_atr_mult * atr_val) {
            continue;
        }

        const auto direction = fast > slow ? TradeDirection::BUY : TradeDirection::SELL;
        if (auto candidate = checkContinuation(ctx, i, direction)) {
            decision.candidates.push_back(std::move(*candidate));
        }
    }
    return decision;
}

std::optional<TradeCandidate> TrendContinuationStrategy::checkContinuation(const Context& ctx,
                                                                           size_t i,
                                                                           TradeDirection direction) const {
    const auto& bars = ctx.bars;
    const bool is_buy = direction == TradeDirection::BUY;
    const double ema = ctx.ema_fast[i];
    const double atr = ctx.atr[i];
    const double zone = config_.pullback_atr_mult * atr;
    const size_t lookback = static_cast<size_t>(std::max(config_.pullback_lookback, 0));
    const size_t from = i > lookback ? i - lookback : 0;

    // Price was stretched beyond the zone shortly before.
    bool was_extended = false;
    for (size_t j = from; j < i && !was_extended; ++j) {
        was_extended = is_buy ? bars[j].close > ema + zone : bars[j].close < ema - zone;
    }
    if (!was_extended) {
        return std::nullopt;
    }

    const Candle& pullback = bars[i];
    if (pullback.close < ema - zone || pullback.close > ema + zone) {
        return std::nullopt;
    }

    const Candle& confirm = bars[i + 1];
    const bool confirmed = is_buy
        ? (confirm.close > confirm.open && confirm.close > pullback.high)
        : (confirm.close < confirm.open && confirm.close < pullback.low);
    if (!confirmed) {
        return std::nullopt;
    }

    const double entry = confirm.close;
    const double extreme = is_buy
        ? TechnicalIndicators::lowestLow(bars, i + 1, static_cast<int>(i + 1 - from))
        : TechnicalIndicators::highestHigh(bars, i + 1, static_cast<int>(i + 1 - from));
    const double min_risk = config_.stop_atr_mult * atr;

    double stop = is_buy ? extreme - min_risk : extreme + min_risk;
    double risk = std::abs(entry - stop);
    if (risk < min_risk) {
        stop = is_buy ? entry - min_risk : entry + min_risk;
        risk = min_risk;
    }
    if (!(risk > 0.0)) {
        return std::nullopt;
    }

    const double tp1 = is_buy ? entry + config_.tp1_rr * risk : entry - config_.tp1_rr * risk;
    double tp2 = is_buy ? entry + config_.tp2_rr * risk : entry - config_.tp2_rr * risk;
    if (auto swing = findSwingTarget(ctx, i, entry, direction)) {
        if (is_buy ? *swing > tp1 : *swing < tp1) {
            tp2 = *swing;
        }
    }

    double score = config_.base_confidence;
    if (!ctx.vwap.empty() && !std::isnan(ctx.vwap[i + 1])) {
        if (is_buy ? entry > ctx.vwap[i + 1] : entry < ctx.vwap[i + 1]) {
            score += 10.0;
        }
    }
    if (std::abs(pullback.close - ema) < 0.5 * atr) {
        score += 10.0;
    }
    if (TradingSessions::isInSession(pullback.timestamp, "overlap")) {
        score += 10.0;
    }
    if (i >= SPREAD_TREND_BARS && !std::isnan(ctx.ema_slow[i - SPREAD_TREND_BARS])) {
        const double spread_now = std::abs(ema - ctx.ema_slow[i]);
        const double spread_before = std::abs(ctx.ema_fast[i - SPREAD_TREND_BARS] - ctx.ema_slow[i - SPREAD_TREND_BARS]);
        if (spread_now > spread_before) {
            score += 10.0;
        }
    }

    TradeCandidate candidate;
    candidate.strategy_name = getInfo().name;
    candidate.timeframe = getInfo().timeframe;
    candidate.direction = direction;
    candidate.entry_price = entry;
    candidate.stop_loss = stop;
    candidate.take_profit_1 = tp1;
    candidate.take_profit_2 = tp2;
    candidate.risk_reward = config_.tp1_rr;
    candidate.confidence = std::min(score, 100.0);
    candidate.timestamp = confirm.timestamp;

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2)
           << (is_buy ? "Bullish" : "Bearish") << " trend continuation: EMA" << config_.ema_fast << " " << ema
           << (is_buy ? " above " : " below ") << "EMA" << config_.ema_slow << " " << ctx.ema_slow[i]
           << ", pullback into the EMA zone confirmed at " << entry << ", SL " << stop;
    candidate.reasoning = reason.str();
    return candidate;
}

std::optional<double> TrendContinuationStrategy::findSwingTarget(const Context& ctx,
                                                                 size_t i,
                                                                 double entry,
                                                                 TradeDirection direction) const {
    const bool is_buy = direction == TradeDirection::BUY;
    const auto& swings = is_buy ? ctx.swing_highs : ctx.swing_lows;
    const size_t order = static_cast<size_t>(std::max(config_.swing_order, 0));

    // Nearest confirmed swing beyond entry.
    std::optional<double> target;
    for (size_t s : swings) {
        if (s >= i || s + order > i) continue;
        const double level = is_buy ? ctx.bars[s].high : ctx.bars[s].low;
        if (is_buy ? level <= entry : level >= entry) continue;
        if (!target || (is_buy ? level < *target : level > *target)) {
            target = level;
        }
    }
    return target;
}

} // namespace strategy
} // namespace stratbench
