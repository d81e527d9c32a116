#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "storage/IResultStore.h"

namespace stratbench {
namespace storage {

// Append-only JSON-lines result history. A commit writes the previous
// contents plus the new lines to a temp file and renames it over the store.
class ResultStoreJsonl : public IResultStore {
public:
    explicit ResultStoreJsonl(std::filesystem::path file_path);

    bool commitCycle(const std::vector<BacktestRecord>& records) override;
    std::vector<BacktestRecord> loadAll() const override;
    std::uint64_t lastRecordId() const override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_record_id_ = 0;
};

} // namespace storage
} // namespace stratbench
