#include "analytics/TradingSessions.h"

#include <stdexcept>

namespace stratbench {
namespace analytics {

const std::vector<SessionWindow>& TradingSessions::sessions() {
    static const std::vector<SessionWindow> table{
        {"asian", 23, 8},       // wraps midnight
        {"london", 7, 16},
        {"new_york", 12, 21},
        {"overlap", 12, 16}     // London/NY overlap
    };
    return table;
}

bool TradingSessions::isHourInRange(int hour, int start_hour, int end_hour) {
    if (start_hour <= end_hour) {
        return start_hour <= hour && hour < end_hour;
    }
    return hour >= start_hour || hour < end_hour;
}

std::vector<std::string> TradingSessions::getActiveSessions(TimestampMs timestamp_ms) {
    const int hour = utcHourOf(timestamp_ms);
    std::vector<std::string> active;
    for (const auto& session : sessions()) {
        if (isHourInRange(hour, session.start_hour, session.end_hour)) {
            active.push_back(session.name);
        }
    }
    return active;
}

bool TradingSessions::isInSession(TimestampMs timestamp_ms, const std::string& session) {
    for (const auto& window : sessions()) {
        if (window.name == session) {
            return isHourInRange(utcHourOf(timestamp_ms), window.start_hour, window.end_hour);
        }
    }
    throw std::invalid_argument("Unknown session '" + session + "'");
}

} // namespace analytics
} // namespace stratbench
