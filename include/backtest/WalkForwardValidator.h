#pragma once

#include "backtest/BacktestRunner.h"
#include <optional>

namespace stratbench {
namespace backtest {

struct WalkForwardResult {
    WindowResult in_sample;
    WindowResult out_of_sample;
    bool is_overfitted = false;
    bool insufficient_oos_trades = false;
    std::optional<double> wfe_win_rate;         // OOS / IS
    std::optional<double> wfe_profit_factor;    // OOS / IS

    // Mean of the ratios that could be computed.
    std::optional<double> averageEfficiency() const;
};

// In-sample / out-of-sample split check for overfitting. Both halves are
// backtested independently; the out-of-sample half never informs the other.
class WalkForwardValidator {
public:
    WalkForwardValidator() = default;
    explicit WalkForwardValidator(const BacktestConfig& config)
        : config_(config.walk_forward), runner_(config) {}
    WalkForwardValidator(WalkForwardConfig config, BacktestRunner runner)
        : config_(config), runner_(std::move(runner)) {}

    WalkForwardResult validate(const strategy::IStrategy& strategy,
                               const std::vector<Candle>& bars) const;

private:
    WalkForwardConfig config_;
    BacktestRunner runner_;
};

} // namespace backtest
} // namespace stratbench
