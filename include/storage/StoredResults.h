#pragma once

#include <optional>
#include <string>
#include <vector>

#include "storage/BacktestRecord.h"

namespace stratbench {
namespace storage {

// Read-side queries over a snapshot of stored records. Walk-forward records
// are never returned.
class StoredResults {
public:
    explicit StoredResults(std::vector<BacktestRecord> records) : records_(std::move(records)) {}

    // Most recent record for the strategy, trying each preferred horizon in
    // turn and falling back to any horizon.
    std::optional<BacktestRecord> latestFor(const std::string& strategy,
                                            const std::vector<int>& preferred_windows) const;

    // Oldest record for the strategy (degradation baseline).
    std::optional<BacktestRecord> baselineFor(const std::string& strategy) const;

    const std::vector<BacktestRecord>& records() const { return records_; }

private:
    std::optional<BacktestRecord> latestMatching(const std::string& strategy,
                                                 std::optional<int> window_days) const;

    std::vector<BacktestRecord> records_;
};

} // namespace storage
} // namespace stratbench
