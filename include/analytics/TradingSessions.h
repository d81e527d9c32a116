#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace stratbench {
namespace analytics {

// Fixed UTC session windows, half-open [start_hour, end_hour).
// start_hour > end_hour means the session wraps past midnight.
struct SessionWindow {
    std::string name;
    int start_hour;
    int end_hour;
};

class TradingSessions {
public:
    static const std::vector<SessionWindow>& sessions();

    static bool isHourInRange(int hour, int start_hour, int end_hour);

    static std::vector<std::string> getActiveSessions(TimestampMs timestamp_ms);

    // Throws std::invalid_argument for an unknown session name.
    static bool isInSession(TimestampMs timestamp_ms, const std::string& session);
};

} // namespace analytics
} // namespace stratbench
