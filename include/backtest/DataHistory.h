#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace stratbench {
namespace backtest {

// Historical bar loading. Loaders never throw: an unreadable file yields an
// empty series (logged) and the caller decides whether that is fatal.
class DataHistory {
public:
    // timestamp,open,high,low,close[,volume]
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects keyed timestamp|t, open|o, high|h, low|l, close|c, volume|v
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Picks the loader from the file extension (.json, otherwise CSV).
    static std::vector<Candle> load(const std::string& file_path);

    // True when two consecutive bars are more than one interval apart.
    static bool hasGaps(const std::vector<Candle>& candles, long long interval_ms = MS_PER_HOUR);

    // Second-resolution epochs are scaled to milliseconds; output is sorted
    // ascending with duplicate timestamps dropped.
    static void normalize(std::vector<Candle>& candles);
};

} // namespace backtest
} // namespace stratbench
