#include "analytics/RegimeDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>

namespace stratbench {
namespace analytics {

std::string regimeToString(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::LOW: return "low";
        case VolatilityRegime::MEDIUM: return "medium";
        case VolatilityRegime::HIGH: return "high";
    }
    return "medium";
}

std::optional<VolatilityRegime> regimeFromString(const std::string& value) {
    if (value == "low" || value == "LOW") return VolatilityRegime::LOW;
    if (value == "medium" || value == "MEDIUM") return VolatilityRegime::MEDIUM;
    if (value == "high" || value == "HIGH") return VolatilityRegime::HIGH;
    return std::nullopt;
}

RegimeAnalysis RegimeDetector::detectVolatilityRegime(const std::vector<Candle>& candles) const {
    RegimeAnalysis result;

    if (candles.size() < static_cast<size_t>(config_.min_bars)) {
        LOG_WARN("Insufficient candles for regime detection ({}/{}) -- defaulting to MEDIUM",
                 candles.size(), config_.min_bars);
        result.description = "Insufficient Data";
        return result;
    }

    const size_t lookback = static_cast<size_t>(std::max(config_.lookback_bars, 1));
    const auto begin = (candles.size() > lookback) ? candles.end() - lookback : candles.begin();
    const std::vector<Candle> recent(begin, candles.end());

    const auto atr_values = TechnicalIndicators::calculateATRSeries(recent, config_.atr_period);
    if (atr_values.size() < 2) {
        LOG_WARN("ATR series too short ({}) -- defaulting to MEDIUM", atr_values.size());
        result.description = "ATR Series Too Short";
        return result;
    }

    const double current_atr = atr_values.back();
    const auto below = std::count_if(atr_values.begin(), atr_values.end(),
                                     [current_atr](double v) { return v < current_atr; });
    const double percentile = static_cast<double>(below) / static_cast<double>(atr_values.size()) * 100.0;

    result.current_atr = current_atr;
    result.percentile = percentile;
    result.sample_size = static_cast<int>(atr_values.size());

    if (percentile <= config_.low_percentile) {
        result.regime = VolatilityRegime::LOW;
        result.description = "Low Volatility";
    } else if (percentile >= config_.high_percentile) {
        result.regime = VolatilityRegime::HIGH;
        result.description = "High Volatility";
    } else {
        result.regime = VolatilityRegime::MEDIUM;
        result.description = "Medium Volatility";
    }

    LOG_DEBUG("ATR regime: current={:.4f}, percentile={:.1f}%, series_len={}, regime={}",
              current_atr, percentile, atr_values.size(), regimeToString(result.regime));
    return result;
}

} // namespace analytics
} // namespace stratbench
