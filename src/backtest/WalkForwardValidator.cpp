#include "backtest/WalkForwardValidator.h"
#include "common/Logger.h"

#include <algorithm>

namespace stratbench {
namespace backtest {

std::optional<double> WalkForwardResult::averageEfficiency() const {
    double sum = 0.0;
    int count = 0;
    if (wfe_win_rate) {
        sum += *wfe_win_rate;
        count++;
    }
    if (wfe_profit_factor) {
        sum += *wfe_profit_factor;
        count++;
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / count;
}

WalkForwardResult WalkForwardValidator::validate(const strategy::IStrategy& strategy,
                                                 const std::vector<Candle>& bars) const {
    const std::string name = strategy.name();
    const double ratio = std::clamp(config_.split_ratio, 0.0, 1.0);
    const size_t split = static_cast<size_t>(static_cast<double>(bars.size()) * ratio);

    const std::vector<Candle> in_sample(bars.begin(), bars.begin() + split);
    const std::vector<Candle> out_of_sample(bars.begin() + split, bars.end());

    LOG_INFO("Walk-forward split: IS={} bars, OOS={} bars, strategy={}, window={}d",
             in_sample.size(), out_of_sample.size(), name, config_.window_days);

    WalkForwardResult result;
    result.in_sample = runner_.runWindow(strategy, in_sample, config_.window_days);
    result.out_of_sample = runner_.runWindow(strategy, out_of_sample, config_.window_days);

    const auto& is_metrics = result.in_sample.metrics;
    const auto& oos_metrics = result.out_of_sample.metrics;

    if (oos_metrics.total_trades < config_.min_oos_trades) {
        LOG_WARN("Insufficient OOS trades ({} < {}) for strategy '{}' -- skipping overfitting check",
                 oos_metrics.total_trades, config_.min_oos_trades, name);
        result.insufficient_oos_trades = true;
        return result;
    }

    if (is_metrics.win_rate > 0.0) {
        result.wfe_win_rate = oos_metrics.win_rate / is_metrics.win_rate;
    }
    if (is_metrics.profit_factor > 0.0) {
        result.wfe_profit_factor = oos_metrics.profit_factor / is_metrics.profit_factor;
    }

    if (result.wfe_win_rate && *result.wfe_win_rate < config_.degradation_threshold) {
        result.is_overfitted = true;
        LOG_WARN("Strategy '{}' shows overfitting: WFE win_rate={:.3f} < {}",
                 name, *result.wfe_win_rate, config_.degradation_threshold);
    }
    if (result.wfe_profit_factor && *result.wfe_profit_factor < config_.degradation_threshold) {
        result.is_overfitted = true;
        LOG_WARN("Strategy '{}' shows overfitting: WFE profit_factor={:.3f} < {}",
                 name, *result.wfe_profit_factor, config_.degradation_threshold);
    }

    if (!result.is_overfitted) {
        LOG_INFO("Strategy '{}' passed walk-forward validation (avg WFE {:.3f})",
                 name, result.averageEfficiency().value_or(0.0));
    }
    return result;
}

} // namespace backtest
} // namespace stratbench
