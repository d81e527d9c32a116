#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace stratbench {
namespace storage {

// One persisted evaluation: a (strategy, horizon) backtest or a walk-forward check.
struct BacktestRecord {
    std::uint64_t record_id = 0;        // assigned by the store on commit
    std::string cycle_id;
    std::string strategy_name;
    std::string timeframe = "H1";
    int window_days = 0;
    TimestampMs start_timestamp = 0;
    TimestampMs end_timestamp = 0;

    double win_rate = 0.0;
    double profit_factor = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
    double max_drawdown_pct = 0.0;
    double expectancy = 0.0;
    int total_trades = 0;

    bool is_walk_forward = false;
    std::optional<bool> is_overfitted;  // walk-forward records only
    bool insufficient_oos_trades = false;
    std::optional<double> wfe_win_rate;
    std::optional<double> wfe_profit_factor;
    std::optional<double> walk_forward_efficiency;

    std::string spread_model = "session_aware";
    std::string last_direction;         // "BUY" / "SELL" / empty
    long long evaluated_at_ms = 0;
};

nlohmann::json toJson(const BacktestRecord& record);

// Throws nlohmann::json::exception when a field has the wrong type.
BacktestRecord recordFromJson(const nlohmann::json& line);

} // namespace storage
} // namespace stratbench
