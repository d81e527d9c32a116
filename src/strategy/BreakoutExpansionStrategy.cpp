#include "strategy/BreakoutExpansionStrategy.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace stratbench {
namespace strategy {

using analytics::TechnicalIndicators;

StrategyInfo BreakoutExpansionStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "breakout_expansion";
    info.description = "ATR compression range breakout";
    info.timeframe = "H1";
    info.min_bars = config_.min_bars;
    return info;
}

StrategyDecision BreakoutExpansionStrategy::analyze(const std::vector<Candle>& window) const {
    const size_t min_bars = static_cast<size_t>(std::max(getInfo().min_bars, 0));
    if (window.size() < min_bars) {
        return StrategyDecision::insufficientHistory();
    }

    const size_t n = window.size();
    const auto atr = TechnicalIndicators::alignSeries(
        TechnicalIndicators::calculateATRSeries(window, config_.atr_period), n);
    const auto atr_ma = TechnicalIndicators::rollingMean(atr, config_.atr_ma_period);
    const bool has_volume = std::any_of(window.begin(), window.end(),
                                        [](const Candle& c) { return c.volume > 0.0; });

    StrategyDecision decision;
    std::optional<size_t> range_start;

    for (size_t i = min_bars; i < n; ++i) {
        if (std::isnan(atr[i]) || std::isnan(atr_ma[i]) || !(atr_ma[i] > 0.0)) {
            range_start.reset();
            continue;
        }

        if (atr[i] < config_.atr_compression * atr_ma[i]) {
            if (!range_start) {
                range_start = i;
            }
            continue;
        }

        // First bar out of compression.
        if (range_start && i - *range_start >= static_cast<size_t>(std::max(config_.min_consolidation_bars, 0))) {
            if (auto candidate = checkBreakout(window, i, *range_start, atr[i], has_volume)) {
                decision.candidates.push_back(std::move(*candidate));
            }
        }
        range_start.reset();
    }
    return decision;
}

std::optional<TradeCandidate> BreakoutExpansionStrategy::checkBreakout(const std::vector<Candle>& bars,
                                                                       size_t i,
                                                                       size_t range_start,
                                                                       double atr,
                                                                       bool has_volume) const {
    const int length = static_cast<int>(i - range_start);
    const double range_high = TechnicalIndicators::highestHigh(bars, i, length);
    const double range_low = TechnicalIndicators::lowestLow(bars, i, length);
    const double height = range_high - range_low;
    if (!(height > 0.0)) {
        return std::nullopt;
    }

    const Candle& bar = bars[i];
    const bool bullish = bar.close > range_high;
    const bool bearish = bar.close < range_low;
    if (!bullish && !bearish) {
        return std::nullopt;
    }

    bool volume_confirms = false;
    if (has_volume) {
        double total = 0.0;
        for (size_t j = range_start; j < i; ++j) {
            total += bars[j].volume;
        }
        const double average = total / length;
        volume_confirms = average > 0.0 && bar.volume > config_.volume_mult * average;
    }

    const int hour = utcHourOf(bar.timestamp);
    const bool london_open = config_.london_open_start <= hour && hour < config_.london_open_end;
    const double body = std::abs(bar.close - bar.open);

    const double entry = bar.close;
    const double midpoint = (range_high + range_low) / 2.0;
    const bool wide = height > config_.wide_range_atr_mult * atr;
    const double stop = wide ? midpoint : (bullish ? range_low : range_high);
    double risk = std::abs(entry - stop);
    if (!(risk > 0.0)) {
        risk = atr;
    }

    double score = config_.base_confidence;
    if (length > 20) score += 10.0;
    if (atr > 0.0 && body > config_.breakout_body_atr * atr) score += 10.0;
    if (volume_confirms) score += 10.0;
    if (london_open) score += 10.0;

    TradeCandidate candidate;
    candidate.strategy_name = getInfo().name;
    candidate.timeframe = getInfo().timeframe;
    candidate.direction = bullish ? TradeDirection::BUY : TradeDirection::SELL;
    candidate.entry_price = entry;
    candidate.stop_loss = stop;
    candidate.take_profit_1 = bullish ? entry + height : entry - height;
    candidate.take_profit_2 = bullish ? entry + 2.0 * height : entry - 2.0 * height;
    candidate.risk_reward = height / risk;
    candidate.confidence = std::min(score, 100.0);
    candidate.timestamp = bar.timestamp;

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2)
           << (bullish ? "Bullish" : "Bearish") << " breakout from " << length << "-bar consolidation ("
           << range_low << "-" << range_high << "), entry " << entry << ", SL " << stop;
    candidate.reasoning = reason.str();
    return candidate;
}

} // namespace strategy
} // namespace stratbench
