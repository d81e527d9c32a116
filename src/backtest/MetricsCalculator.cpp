#include "backtest/MetricsCalculator.h"

#include <algorithm>
#include <cmath>

namespace stratbench {
namespace backtest {

namespace {

struct DrawdownResult {
    double absolute = 0.0;
    double fraction = 0.0;
};

// Cumulative pnl curve starting from zero equity.
DrawdownResult computeMaxDrawdown(const std::vector<double>& pnl_values) {
    DrawdownResult result;
    double cumulative = 0.0;
    double peak = 0.0;
    double peak_at_max = 0.0;

    for (double pnl : pnl_values) {
        cumulative += pnl;
        peak = std::max(peak, cumulative);
        const double drawdown = peak - cumulative;
        if (drawdown > result.absolute) {
            result.absolute = drawdown;
            peak_at_max = peak;
        }
    }

    if (peak_at_max > 0.0) {
        result.fraction = result.absolute / peak_at_max;
    }
    return result;
}

} // namespace

BacktestMetrics MetricsCalculator::compute(const std::vector<SimulatedTrade>& trades) const {
    BacktestMetrics metrics;
    if (trades.empty()) {
        return metrics;
    }

    const int total = static_cast<int>(trades.size());
    std::vector<double> pnl_values;
    pnl_values.reserve(trades.size());

    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double net = 0.0;
    for (const auto& trade : trades) {
        const double pnl = trade.pnl();
        pnl_values.push_back(pnl);
        net += pnl;
        if (trade.isWin()) {
            wins++;
        }
        if (pnl > 0.0) {
            gross_profit += pnl;
        } else if (pnl < 0.0) {
            gross_loss += -pnl;
        }
    }

    metrics.total_trades = total;
    metrics.win_rate = static_cast<double>(wins) / total;

    if (gross_loss == 0.0) {
        metrics.profit_factor = gross_profit > 0.0 ? config_.profit_factor_cap : 0.0;
    } else {
        metrics.profit_factor = std::min(gross_profit / gross_loss, config_.profit_factor_cap);
    }

    const double mean = net / total;
    metrics.expectancy = mean;

    if (total >= 2) {
        double sum_sq = 0.0;
        for (double pnl : pnl_values) {
            sum_sq += (pnl - mean) * (pnl - mean);
        }
        const double std_dev = std::sqrt(sum_sq / (total - 1));
        if (std_dev > 0.0) {
            metrics.sharpe_ratio = (mean / std_dev) *
                std::sqrt(static_cast<double>(config_.annualization_periods));
        }
    }

    const auto drawdown = computeMaxDrawdown(pnl_values);
    metrics.max_drawdown = drawdown.absolute;
    metrics.max_drawdown_pct = drawdown.fraction;
    return metrics;
}

} // namespace backtest
} // namespace stratbench
