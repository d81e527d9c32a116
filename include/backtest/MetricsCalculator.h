#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/TradeSimulator.h"
#include <vector>

namespace stratbench {
namespace backtest {

struct BacktestMetrics {
    double win_rate = 0.0;              // 0 ~ 1
    double profit_factor = 0.0;         // capped
    double sharpe_ratio = 0.0;          // annualized
    double max_drawdown = 0.0;          // price distance, >= 0
    double max_drawdown_pct = 0.0;      // fraction of the peak equity
    double expectancy = 0.0;            // mean pnl per trade
    int total_trades = 0;
};

class MetricsCalculator {
public:
    MetricsCalculator() = default;
    explicit MetricsCalculator(MetricsConfig config) : config_(config) {}

    BacktestMetrics compute(const std::vector<SimulatedTrade>& trades) const;

private:
    MetricsConfig config_;
};

} // namespace backtest
} // namespace stratbench
