#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>

namespace stratbench {
namespace analytics {

namespace {
std::vector<double> trueRanges(const std::vector<Candle>& candles) {
    std::vector<double> tr_values;
    if (candles.size() < 2) {
        return tr_values;
    }
    tr_values.reserve(candles.size() - 1);

    // First TR is between candle 0 and candle 1
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i - 1];

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }
    return tr_values;
}
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    const auto series = calculateATRSeries(candles, period);
    return series.empty() ? 0.0 : series.back();
}

std::vector<double> TechnicalIndicators::calculateATRSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> atr_values;
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return atr_values;
    }

    const auto tr_values = trueRanges(candles);
    if (tr_values.size() < static_cast<size_t>(period)) return atr_values;

    // Seed: SMA of the first period TRs
    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;
    atr_values.reserve(tr_values.size() - period + 1);
    atr_values.push_back(atr);

    // Wilder smoothing
    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
        atr_values.push_back(atr);
    }

    return atr_values;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return prices.back();

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += prices[i];
    }
    ema /= period;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema;
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return ema_values;

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;

    ema_values.reserve(prices.size() - period + 1);
    ema_values.push_back(ema);

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

double TechnicalIndicators::lowestLow(const std::vector<Candle>& candles, size_t end_index, int lookback) {
    end_index = std::min(end_index, candles.size());
    const size_t begin = (end_index > static_cast<size_t>(lookback)) ? end_index - lookback : 0;
    double lowest = std::numeric_limits<double>::max();
    for (size_t i = begin; i < end_index; ++i) {
        lowest = std::min(lowest, candles[i].low);
    }
    return lowest;
}

double TechnicalIndicators::highestHigh(const std::vector<Candle>& candles, size_t end_index, int lookback) {
    end_index = std::min(end_index, candles.size());
    const size_t begin = (end_index > static_cast<size_t>(lookback)) ? end_index - lookback : 0;
    double highest = std::numeric_limits<double>::lowest();
    for (size_t i = begin; i < end_index; ++i) {
        highest = std::max(highest, candles[i].high);
    }
    return highest;
}

std::vector<double> TechnicalIndicators::alignSeries(const std::vector<double>& series, size_t candle_count) {
    std::vector<double> aligned(candle_count, std::numeric_limits<double>::quiet_NaN());
    const size_t n = std::min(series.size(), candle_count);
    std::copy(series.end() - n, series.end(), aligned.end() - n);
    return aligned;
}

std::vector<double> TechnicalIndicators::rollingMean(const std::vector<double>& aligned, int period) {
    std::vector<double> out(aligned.size(), std::numeric_limits<double>::quiet_NaN());
    if (period <= 0) return out;

    double sum = 0.0;
    int valid = 0;
    for (size_t i = 0; i < aligned.size(); ++i) {
        if (std::isnan(aligned[i])) {
            sum = 0.0;
            valid = 0;
            continue;
        }
        sum += aligned[i];
        ++valid;
        if (valid > period) {
            sum -= aligned[i - period];
            valid = period;
        }
        if (valid == period) {
            out[i] = sum / period;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateVWAPSeries(const std::vector<Candle>& candles) {
    const bool has_volume = std::any_of(candles.begin(), candles.end(),
                                        [](const Candle& c) { return c.volume > 0.0; });
    if (!has_volume) {
        return {};
    }

    std::vector<double> vwap(candles.size(), std::numeric_limits<double>::quiet_NaN());
    long long current_day = 0;
    double price_volume = 0.0;
    double volume = 0.0;
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        const long long day = c.timestamp / MS_PER_DAY;
        if (i == 0 || day != current_day) {
            current_day = day;
            price_volume = 0.0;
            volume = 0.0;
        }
        const double typical = (c.high + c.low + c.close) / 3.0;
        price_volume += typical * c.volume;
        volume += c.volume;
        if (volume > 0.0) {
            vwap[i] = price_volume / volume;
        }
    }
    return vwap;
}

std::vector<size_t> TechnicalIndicators::findSwingHighs(const std::vector<Candle>& candles, int order, size_t end_index) {
    std::vector<size_t> swings;
    end_index = std::min(end_index, candles.size());
    if (order <= 0) return swings;
    const size_t span = static_cast<size_t>(order);

    for (size_t i = span; i + span < end_index; ++i) {
        bool is_swing = true;
        for (size_t j = i - span; j <= i + span && is_swing; ++j) {
            if (candles[j].high > candles[i].high) is_swing = false;
        }
        if (is_swing) swings.push_back(i);
    }
    return swings;
}

std::vector<size_t> TechnicalIndicators::findSwingLows(const std::vector<Candle>& candles, int order, size_t end_index) {
    std::vector<size_t> swings;
    end_index = std::min(end_index, candles.size());
    if (order <= 0) return swings;
    const size_t span = static_cast<size_t>(order);

    for (size_t i = span; i + span < end_index; ++i) {
        bool is_swing = true;
        for (size_t j = i - span; j <= i + span && is_swing; ++j) {
            if (candles[j].low < candles[i].low) is_swing = false;
        }
        if (is_swing) swings.push_back(i);
    }
    return swings;
}

} // namespace analytics
} // namespace stratbench
