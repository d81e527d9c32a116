#include "storage/BacktestRecord.h"

namespace stratbench {
namespace storage {

namespace {

template <typename T>
void putOptional(nlohmann::json& out, const char* key, const std::optional<T>& value) {
    if (value) {
        out[key] = *value;
    } else {
        out[key] = nullptr;
    }
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& line, const char* key) {
    if (!line.contains(key) || line.at(key).is_null()) {
        return std::nullopt;
    }
    return line.at(key).get<T>();
}

} // namespace

nlohmann::json toJson(const BacktestRecord& record) {
    nlohmann::json out;
    out["record_id"] = record.record_id;
    out["cycle_id"] = record.cycle_id;
    out["strategy"] = record.strategy_name;
    out["timeframe"] = record.timeframe;
    out["window_days"] = record.window_days;
    out["start_ts_ms"] = record.start_timestamp;
    out["end_ts_ms"] = record.end_timestamp;
    out["win_rate"] = record.win_rate;
    out["profit_factor"] = record.profit_factor;
    out["sharpe_ratio"] = record.sharpe_ratio;
    out["max_drawdown"] = record.max_drawdown;
    out["max_drawdown_pct"] = record.max_drawdown_pct;
    out["expectancy"] = record.expectancy;
    out["total_trades"] = record.total_trades;
    out["is_walk_forward"] = record.is_walk_forward;
    putOptional(out, "is_overfitted", record.is_overfitted);
    out["insufficient_oos_trades"] = record.insufficient_oos_trades;
    putOptional(out, "wfe_win_rate", record.wfe_win_rate);
    putOptional(out, "wfe_profit_factor", record.wfe_profit_factor);
    putOptional(out, "walk_forward_efficiency", record.walk_forward_efficiency);
    out["spread_model"] = record.spread_model;
    out["last_direction"] = record.last_direction;
    out["evaluated_at_ms"] = record.evaluated_at_ms;
    return out;
}

BacktestRecord recordFromJson(const nlohmann::json& line) {
    BacktestRecord record;
    record.record_id = line.value("record_id", static_cast<std::uint64_t>(0));
    record.cycle_id = line.value("cycle_id", std::string());
    record.strategy_name = line.value("strategy", std::string());
    record.timeframe = line.value("timeframe", std::string("H1"));
    record.window_days = line.value("window_days", 0);
    record.start_timestamp = line.value("start_ts_ms", 0LL);
    record.end_timestamp = line.value("end_ts_ms", 0LL);
    record.win_rate = line.value("win_rate", 0.0);
    record.profit_factor = line.value("profit_factor", 0.0);
    record.sharpe_ratio = line.value("sharpe_ratio", 0.0);
    record.max_drawdown = line.value("max_drawdown", 0.0);
    record.max_drawdown_pct = line.value("max_drawdown_pct", 0.0);
    record.expectancy = line.value("expectancy", 0.0);
    record.total_trades = line.value("total_trades", 0);
    record.is_walk_forward = line.value("is_walk_forward", false);
    record.is_overfitted = getOptional<bool>(line, "is_overfitted");
    record.insufficient_oos_trades = line.value("insufficient_oos_trades", false);
    record.wfe_win_rate = getOptional<double>(line, "wfe_win_rate");
    record.wfe_profit_factor = getOptional<double>(line, "wfe_profit_factor");
    record.walk_forward_efficiency = getOptional<double>(line, "walk_forward_efficiency");
    record.spread_model = line.value("spread_model", std::string("session_aware"));
    record.last_direction = line.value("last_direction", std::string());
    record.evaluated_at_ms = line.value("evaluated_at_ms", 0LL);
    return record;
}

} // namespace storage
} // namespace stratbench
