#include "backtest/SpreadModel.h"
#include "analytics/TradingSessions.h"

#include <algorithm>

namespace stratbench {
namespace backtest {

double SpreadModel::getSpread(TimestampMs timestamp_ms) const {
    const auto active = analytics::TradingSessions::getActiveSessions(timestamp_ms);

    bool found = false;
    double tightest = config_.default_spread;
    for (const auto& session : active) {
        auto it = config_.session_spreads.find(session);
        if (it == config_.session_spreads.end()) {
            continue;
        }
        tightest = found ? std::min(tightest, it->second) : it->second;
        found = true;
    }

    return found ? tightest : config_.default_spread;
}

} // namespace backtest
} // namespace stratbench
