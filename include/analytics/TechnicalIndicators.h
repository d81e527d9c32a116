#pragma once

#include <vector>
#include "common/Types.h"

namespace stratbench {
namespace analytics {

class TechnicalIndicators {
public:
    // ATR (Wilder smoothing). Latest value, 0 when history is too short.
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // ATR series aligned to candles: entry i is the ATR as of candle i.
    // The first `period` entries have no value and are omitted, so
    // result.size() == candles.size() - period (or 0 when too short).
    static std::vector<double> calculateATRSeries(const std::vector<Candle>& candles, int period = 14);

    // EMA seeded with the SMA of the first `period` prices.
    static double calculateEMA(const std::vector<double>& prices, int period);

    // EMA values from index period-1 onward (size = prices.size() - period + 1).
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

    // Lowest low / highest high of the `lookback` candles ending before `end_index` (exclusive).
    static double lowestLow(const std::vector<Candle>& candles, size_t end_index, int lookback);
    static double highestHigh(const std::vector<Candle>& candles, size_t end_index, int lookback);

    // Front-pads a trailing indicator series with NaN so entry i belongs to candle i.
    static std::vector<double> alignSeries(const std::vector<double>& series, size_t candle_count);

    // Simple moving average over an aligned series; NaN until `period` valid values are in.
    static std::vector<double> rollingMean(const std::vector<double>& aligned, int period);

    // Session VWAP anchored at each UTC day, aligned to candles.
    // Empty when the series carries no volume.
    static std::vector<double> calculateVWAPSeries(const std::vector<Candle>& candles);

    // Swing points with `order` candles on each side that do not exceed them.
    // Only swings already confirmed at candle count `end_index` are returned.
    static std::vector<size_t> findSwingHighs(const std::vector<Candle>& candles, int order, size_t end_index);
    static std::vector<size_t> findSwingLows(const std::vector<Candle>& candles, int order, size_t end_index);
};

} // namespace analytics
} // namespace stratbench
