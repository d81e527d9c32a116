#pragma once

#include <string>
#include <vector>
#include <optional>

namespace stratbench {

using Price = double;

// UTC epoch milliseconds
using TimestampMs = long long;

constexpr long long MS_PER_HOUR = 3600LL * 1000LL;
constexpr long long MS_PER_DAY = 24LL * MS_PER_HOUR;

enum class TradeDirection { BUY, SELL };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline std::string directionToString(TradeDirection direction) {
    return direction == TradeDirection::BUY ? "BUY" : "SELL";
}

inline std::optional<TradeDirection> directionFromString(const std::string& value) {
    if (value == "BUY" || value == "buy" || value == "LONG" || value == "long") {
        return TradeDirection::BUY;
    }
    if (value == "SELL" || value == "sell" || value == "SHORT" || value == "short") {
        return TradeDirection::SELL;
    }
    return std::nullopt;
}

// UTC hour of day (0-23) for an epoch-millisecond timestamp.
inline int utcHourOf(TimestampMs timestamp_ms) {
    long long ms_of_day = timestamp_ms % MS_PER_DAY;
    if (ms_of_day < 0) {
        ms_of_day += MS_PER_DAY;
    }
    return static_cast<int>(ms_of_day / MS_PER_HOUR);
}

} // namespace stratbench
