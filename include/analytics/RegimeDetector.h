#pragma once

#include "common/Types.h"
#include <vector>
#include <string>
#include <optional>

namespace stratbench {
namespace analytics {

enum class VolatilityRegime {
    LOW,
    MEDIUM,
    HIGH
};

std::string regimeToString(VolatilityRegime regime);
std::optional<VolatilityRegime> regimeFromString(const std::string& value);

struct RegimeConfig {
    int lookback_bars = 720;        // ~30 days of H1
    int atr_period = 14;
    double low_percentile = 25.0;
    double high_percentile = 75.0;
    int min_bars = 30;
};

struct RegimeAnalysis {
    VolatilityRegime regime = VolatilityRegime::MEDIUM;
    double current_atr = 0.0;
    double percentile = 50.0;       // share of trailing ATR values strictly below current
    int sample_size = 0;
    std::string description;
};

class RegimeDetector {
public:
    RegimeDetector() = default;
    explicit RegimeDetector(RegimeConfig config) : config_(config) {}

    // Rank current ATR against its own trailing series. Uses only the most
    // recent lookback_bars candles; too little history yields MEDIUM.
    RegimeAnalysis detectVolatilityRegime(const std::vector<Candle>& candles) const;

    const RegimeConfig& config() const { return config_; }

private:
    RegimeConfig config_;
};

} // namespace analytics
} // namespace stratbench
