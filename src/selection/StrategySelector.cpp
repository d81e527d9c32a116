#include "selection/StrategySelector.h"
#include "analytics/TechnicalIndicators.h"
#include "storage/StoredResults.h"
#include "common/Logger.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <iomanip>

namespace stratbench {
namespace selection {

namespace {

// Min-max to [0, 1]; a single value or a flat series maps to 0.5.
std::vector<double> normalize(const std::vector<double>& values) {
    std::vector<double> out(values.size(), 0.5);
    if (values.size() < 2) {
        return out;
    }
    const auto [mn_it, mx_it] = std::minmax_element(values.begin(), values.end());
    const double range = *mx_it - *mn_it;
    if (range == 0.0) {
        return out;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = (values[i] - *mn_it) / range;
    }
    return out;
}

std::string formatFixed(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

} // namespace

std::optional<StrategyScore> StrategySelector::selectBest(const SelectionInput& input) const {
    auto ranked = selectAllRanked(input);
    if (ranked.empty()) {
        return std::nullopt;
    }
    return ranked.front();
}

std::vector<StrategyScore> StrategySelector::selectAllRanked(const SelectionInput& input) const {
    const storage::StoredResults stored(input.records);
    const std::set<std::string> names(input.strategies.begin(), input.strategies.end());

    std::vector<storage::BacktestRecord> qualified;
    std::map<std::string, storage::BacktestRecord> current_by_name;
    for (const auto& name : names) {
        auto latest = stored.latestFor(name, config_.preferred_windows);
        if (!latest) {
            LOG_WARN("No backtest results for strategy '{}'", name);
            continue;
        }
        if (latest->total_trades < config_.min_trades) {
            LOG_WARN("Strategy '{}' excluded: only {} trades (min {})",
                     name, latest->total_trades, config_.min_trades);
            continue;
        }
        current_by_name[name] = *latest;
        qualified.push_back(*latest);
    }

    if (qualified.empty()) {
        LOG_WARN("No strategy qualifies for selection");
        return {};
    }

    auto scores = computeScores(qualified);

    const analytics::RegimeDetector detector(config_.regime);
    const auto regime = detector.detectVolatilityRegime(input.recent_bars).regime;
    LOG_INFO("Current volatility regime: {}", analytics::regimeToString(regime));
    for (auto& score : scores) {
        score.regime = regime;
    }

    applyRegimeModifier(scores, regime);
    applyLiveBlend(scores, input.live);

    for (auto& score : scores) {
        checkDegradation(score, current_by_name.at(score.strategy_name),
                         stored.baselineFor(score.strategy_name));
    }

    std::sort(scores.begin(), scores.end(), [](const StrategyScore& a, const StrategyScore& b) {
        if (a.is_degraded != b.is_degraded) {
            return !a.is_degraded;
        }
        if (a.composite_score != b.composite_score) {
            return a.composite_score > b.composite_score;
        }
        return a.strategy_name < b.strategy_name;
    });

    auto& top = scores.front();
    if (!input.higher_timeframe_bars.empty()) {
        const auto direction = directionFromString(top.last_direction);
        if (direction && checkHigherTimeframeConfluence(input.higher_timeframe_bars, *direction)) {
            top.has_confluence = true;
            top.composite_score += config_.confluence_bonus;
            LOG_INFO("Higher-timeframe confluence for '{}' ({}): +{:.2f}",
                     top.strategy_name, top.last_direction, config_.confluence_bonus);
        }
    }

    for (const auto& score : scores) {
        LOG_INFO("Ranked: {} score={:.4f} degraded={}", score.strategy_name,
                 score.composite_score, score.is_degraded);
    }
    return scores;
}

std::vector<StrategyScore> StrategySelector::computeScores(
    const std::vector<storage::BacktestRecord>& qualified
) const {
    std::vector<double> win_rate, profit_factor, sharpe, expectancy, drawdown;
    for (const auto& record : qualified) {
        win_rate.push_back(record.win_rate);
        profit_factor.push_back(record.profit_factor);
        sharpe.push_back(record.sharpe_ratio);
        expectancy.push_back(record.expectancy);
        drawdown.push_back(record.max_drawdown);
    }

    const auto wr_n = normalize(win_rate);
    const auto pf_n = normalize(profit_factor);
    const auto sr_n = normalize(sharpe);
    const auto ex_n = normalize(expectancy);
    const auto dd_n = normalize(drawdown);
    const auto& w = config_.weights;

    std::vector<StrategyScore> scores;
    scores.reserve(qualified.size());
    for (size_t i = 0; i < qualified.size(); ++i) {
        const auto& record = qualified[i];
        StrategyScore score;
        score.strategy_name = record.strategy_name;
        score.composite_score = w.win_rate * wr_n[i]
                              + w.profit_factor * pf_n[i]
                              + w.sharpe_ratio * sr_n[i]
                              + w.expectancy * ex_n[i]
                              + w.max_drawdown * (1.0 - dd_n[i]);
        score.win_rate = record.win_rate;
        score.profit_factor = record.profit_factor;
        score.sharpe_ratio = record.sharpe_ratio;
        score.expectancy = record.expectancy;
        score.max_drawdown = record.max_drawdown;
        score.total_trades = record.total_trades;
        score.window_days = record.window_days;
        score.record_id = record.record_id;
        score.last_direction = record.last_direction;
        scores.push_back(std::move(score));
    }
    return scores;
}

void StrategySelector::applyRegimeModifier(std::vector<StrategyScore>& scores,
                                           analytics::VolatilityRegime regime) const {
    auto table = config_.regime_modifiers.find(regime);
    if (table == config_.regime_modifiers.end()) {
        return;
    }
    for (auto& score : scores) {
        auto it = table->second.find(score.strategy_name);
        if (it == table->second.end()) {
            continue;
        }
        const double original = score.composite_score;
        score.composite_score *= it->second;
        LOG_INFO("Regime modifier: '{}' score {:.4f} -> {:.4f} ({} vol x{:.2f})",
                 score.strategy_name, original, score.composite_score,
                 analytics::regimeToString(regime), it->second);
    }
}

double StrategySelector::scoreLivePerformance(const LivePerformance& live) const {
    const double pf = std::min(std::max(live.profit_factor, 0.0), config_.live_profit_factor_cap)
                    / config_.live_profit_factor_cap;
    const double rr = std::min(std::max(live.avg_rr, 0.0), config_.live_rr_cap) / config_.live_rr_cap;
    return config_.live_weight_win_rate * live.win_rate
         + config_.live_weight_profit_factor * pf
         + config_.live_weight_rr * rr;
}

void StrategySelector::applyLiveBlend(std::vector<StrategyScore>& scores,
                                      const std::map<std::string, LivePerformance>& live) const {
    for (auto& score : scores) {
        auto it = live.find(score.strategy_name);
        if (it == live.end() || it->second.total_signals < config_.min_live_signals) {
            continue;
        }
        const double live_score = scoreLivePerformance(it->second);
        const double original = score.composite_score;
        score.composite_score = (1.0 - config_.live_blend_weight) * original
                              + config_.live_blend_weight * live_score;
        score.live_blended = true;
        LOG_INFO("Live blend: '{}' score {:.4f} -> {:.4f} (live_score={:.4f}, n={})",
                 score.strategy_name, original, score.composite_score,
                 live_score, it->second.total_signals);
    }
}

void StrategySelector::checkDegradation(StrategyScore& score,
                                        const storage::BacktestRecord& current,
                                        const std::optional<storage::BacktestRecord>& baseline) const {
    std::vector<std::string> reasons;

    if (current.profit_factor < config_.degradation_min_profit_factor) {
        reasons.push_back("Profit factor " + formatFixed(current.profit_factor) +
                          " below " + formatFixed(config_.degradation_min_profit_factor));
    }

    if (baseline && baseline->record_id != current.record_id) {
        const double drop = baseline->win_rate - current.win_rate;
        if (drop > config_.degradation_win_rate_drop) {
            reasons.push_back("Win rate dropped " + formatFixed(drop) + " (from " +
                              formatFixed(baseline->win_rate) + " to " +
                              formatFixed(current.win_rate) + ")");
        }
    }

    if (reasons.empty()) {
        return;
    }

    score.is_degraded = true;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) score.degradation_reason += "; ";
        score.degradation_reason += reasons[i];
    }
    LOG_WARN("Strategy '{}' is degraded: {}", score.strategy_name, score.degradation_reason);
}

bool StrategySelector::checkHigherTimeframeConfluence(const std::vector<Candle>& bars,
                                                      TradeDirection direction) const {
    if (bars.size() < static_cast<size_t>(config_.confluence_min_bars)) {
        LOG_WARN("Higher-timeframe confluence: insufficient bars ({}/{})",
                 bars.size(), config_.confluence_min_bars);
        return false;
    }

    // Only the most recent bars seed the averages.
    const size_t keep = std::min(bars.size(), static_cast<size_t>(
        std::max({config_.confluence_min_bars, config_.confluence_slow_ema, 1})));
    const std::vector<Candle> recent(bars.end() - static_cast<std::ptrdiff_t>(keep), bars.end());
    const auto closes = analytics::TechnicalIndicators::extractClosePrices(recent);
    const double fast = analytics::TechnicalIndicators::calculateEMA(closes, config_.confluence_fast_ema);
    const double slow = analytics::TechnicalIndicators::calculateEMA(closes, config_.confluence_slow_ema);

    const bool agrees = (direction == TradeDirection::BUY) ? fast > slow : fast < slow;
    LOG_INFO("Higher-timeframe confluence for {}: EMA{}={:.2f}, EMA{}={:.2f} -> {}",
             directionToString(direction), config_.confluence_fast_ema, fast,
             config_.confluence_slow_ema, slow, agrees);
    return agrees;
}

} // namespace selection
} // namespace stratbench
