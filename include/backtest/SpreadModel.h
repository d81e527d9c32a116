#pragma once

#include "backtest/BacktestConfig.h"
#include "common/Types.h"

namespace stratbench {
namespace backtest {

// Session-aware spread estimate. When sessions overlap the tightest spread
// wins; outside every known session the conservative default applies.
class SpreadModel {
public:
    SpreadModel() = default;
    explicit SpreadModel(SpreadConfig config) : config_(std::move(config)) {}

    double getSpread(TimestampMs timestamp_ms) const;

    const SpreadConfig& config() const { return config_; }

private:
    SpreadConfig config_;
};

} // namespace backtest
} // namespace stratbench
