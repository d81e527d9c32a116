#include "storage/ResultStoreJsonl.h"
#include "storage/StoredResults.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace stratbench;
using storage::BacktestRecord;

namespace {

std::filesystem::path makeTempDir() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("stratbench_store_test_" + std::to_string(stamp));
    std::filesystem::create_directories(dir);
    return dir;
}

BacktestRecord record(const std::string& name, int window_days, long long evaluated_at) {
    BacktestRecord r;
    r.cycle_id = "cycle-" + std::to_string(evaluated_at);
    r.strategy_name = name;
    r.window_days = window_days;
    r.start_timestamp = 1704067200000LL;
    r.end_timestamp = 1706745600000LL;
    r.win_rate = 0.55;
    r.profit_factor = 1.7;
    r.sharpe_ratio = 1.1;
    r.max_drawdown = 12.5;
    r.max_drawdown_pct = 0.25;
    r.expectancy = 0.8;
    r.total_trades = 64;
    r.last_direction = "SELL";
    r.evaluated_at_ms = evaluated_at;
    return r;
}

}

void testCommitAndReload(const std::filesystem::path& dir) {
    const auto path = dir / "nested" / "results.jsonl";

    storage::ResultStoreJsonl store(path);
    assert(store.lastRecordId() == 0);
    assert(store.loadAll().empty());
    assert(store.commitCycle({}));
    assert(!std::filesystem::exists(path));

    auto wf = record("ema_momentum", 30, 1000);
    wf.is_walk_forward = true;
    wf.is_overfitted = false;
    wf.wfe_win_rate = 0.9;
    wf.walk_forward_efficiency = 0.9;

    assert(store.commitCycle({record("ema_momentum", 30, 1000), record("ema_momentum", 60, 1000), wf}));
    assert(store.lastRecordId() == 3);

    auto loaded = store.loadAll();
    assert(loaded.size() == 3);
    assert(loaded[0].record_id == 1);
    assert(loaded[2].record_id == 3);
    assert(loaded[0].strategy_name == "ema_momentum");
    assert(loaded[0].window_days == 30);
    assert(loaded[0].profit_factor == 1.7);
    assert(loaded[0].total_trades == 64);
    assert(loaded[0].last_direction == "SELL");
    assert(!loaded[0].is_overfitted);
    assert(!loaded[0].wfe_profit_factor);

    assert(loaded[2].is_walk_forward);
    assert(loaded[2].is_overfitted && !*loaded[2].is_overfitted);
    assert(loaded[2].wfe_win_rate && *loaded[2].wfe_win_rate == 0.9);
    assert(!loaded[2].wfe_profit_factor);

    // A new handle continues the id sequence.
    storage::ResultStoreJsonl reopened(path);
    assert(reopened.lastRecordId() == 3);
    assert(reopened.commitCycle({record("ema_momentum", 30, 2000)}));
    assert(reopened.lastRecordId() == 4);
    assert(reopened.loadAll().size() == 4);
    assert(!std::filesystem::exists(path.string() + ".tmp"));
    std::cout << "  commit / reload OK" << std::endl;
}

void testMalformedLineSkipped(const std::filesystem::path& dir) {
    const auto path = dir / "damaged.jsonl";
    {
        storage::ResultStoreJsonl store(path);
        assert(store.commitCycle({record("a", 30, 1000)}));
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"record_id\": 2, \"strategy\": \"b\", \"win_rate\": \n";
        out << "\n";
    }

    storage::ResultStoreJsonl store(path);
    assert(store.lastRecordId() == 1);
    auto loaded = store.loadAll();
    assert(loaded.size() == 1);
    assert(loaded[0].strategy_name == "a");

    assert(store.commitCycle({record("c", 30, 2000)}));
    loaded = store.loadAll();
    assert(loaded.size() == 2);
    assert(loaded[1].record_id == 2);
    std::cout << "  malformed line OK" << std::endl;
}

void testCommitFailure(const std::filesystem::path& dir) {
    // Parent "directory" is a regular file.
    const auto blocker = dir / "blocker";
    { std::ofstream(blocker) << "x"; }

    storage::ResultStoreJsonl store(blocker / "results.jsonl");
    assert(!store.commitCycle({record("a", 30, 1000)}));
    assert(store.lastRecordId() == 0);
    std::cout << "  commit failure OK" << std::endl;
}

void testStoredResultsQueries() {
    auto r30_old = record("s", 30, 1000);
    r30_old.record_id = 1;
    r30_old.win_rate = 0.7;
    auto r60_new = record("s", 60, 3000);
    r60_new.record_id = 2;
    auto r30_new = record("s", 30, 2000);
    r30_new.record_id = 3;
    auto wf = record("s", 30, 4000);
    wf.record_id = 4;
    wf.is_walk_forward = true;
    auto other = record("t", 7, 5000);
    other.record_id = 5;

    const storage::StoredResults stored({r30_old, r60_new, r30_new, wf, other});

    // 14 absent, 30 present: newest 30-day record, not the newer 60-day one
    auto latest = stored.latestFor("s", {14, 30, 60, 7});
    assert(latest && latest->record_id == 3);

    // Only 7 present for "t": falls through the preferred list
    latest = stored.latestFor("t", {14, 30, 60, 7});
    assert(latest && latest->record_id == 5);
    latest = stored.latestFor("t", {14});
    assert(latest && latest->record_id == 5);

    // No preference: newest of any horizon, walk-forward excluded
    latest = stored.latestFor("s", {});
    assert(latest && latest->record_id == 2);

    const auto baseline = stored.baselineFor("s");
    assert(baseline && baseline->record_id == 1 && baseline->win_rate == 0.7);

    assert(!stored.latestFor("missing", {30}));
    assert(!stored.baselineFor("missing"));
    std::cout << "  stored results queries OK" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting ResultStore Test..." << std::endl;

    const auto dir = makeTempDir();

    testCommitAndReload(dir);
    testMalformedLineSkipped(dir);
    testCommitFailure(dir);
    testStoredResultsQueries();

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    std::cout << "[TEST] ResultStore Test PASSED!" << std::endl;
    return 0;
}
