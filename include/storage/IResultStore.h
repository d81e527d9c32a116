#pragma once

#include <cstdint>
#include <vector>

#include "storage/BacktestRecord.h"

namespace stratbench {
namespace storage {

class IResultStore {
public:
    virtual ~IResultStore() = default;

    // All records of one evaluation cycle become visible together or not at all.
    virtual bool commitCycle(const std::vector<BacktestRecord>& records) = 0;
    virtual std::vector<BacktestRecord> loadAll() const = 0;
    virtual std::uint64_t lastRecordId() const = 0;
};

} // namespace storage
} // namespace stratbench
