#include "storage/StoredResults.h"

namespace stratbench {
namespace storage {

namespace {
// Evaluation time first; record id breaks ties within a cycle.
bool isNewer(const BacktestRecord& a, const BacktestRecord& b) {
    if (a.evaluated_at_ms != b.evaluated_at_ms) {
        return a.evaluated_at_ms > b.evaluated_at_ms;
    }
    return a.record_id > b.record_id;
}
}

std::optional<BacktestRecord> StoredResults::latestMatching(const std::string& strategy,
                                                            std::optional<int> window_days) const {
    const BacktestRecord* best = nullptr;
    for (const auto& record : records_) {
        if (record.is_walk_forward || record.strategy_name != strategy) {
            continue;
        }
        if (window_days && record.window_days != *window_days) {
            continue;
        }
        if (!best || isNewer(record, *best)) {
            best = &record;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

std::optional<BacktestRecord> StoredResults::latestFor(const std::string& strategy,
                                                       const std::vector<int>& preferred_windows) const {
    for (int window : preferred_windows) {
        if (auto record = latestMatching(strategy, window)) {
            return record;
        }
    }
    return latestMatching(strategy, std::nullopt);
}

std::optional<BacktestRecord> StoredResults::baselineFor(const std::string& strategy) const {
    const BacktestRecord* oldest = nullptr;
    for (const auto& record : records_) {
        if (record.is_walk_forward || record.strategy_name != strategy) {
            continue;
        }
        if (!oldest || isNewer(*oldest, record)) {
            oldest = &record;
        }
    }
    if (!oldest) {
        return std::nullopt;
    }
    return *oldest;
}

} // namespace storage
} // namespace stratbench
