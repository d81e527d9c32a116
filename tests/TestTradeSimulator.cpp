#include "backtest/TradeSimulator.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace stratbench;
using backtest::TradeOutcome;
using backtest::TradeSimulator;

namespace {
// 2024-01-01 00:00:00 UTC
constexpr long long DAY_START_MS = 1704067200000LL;

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

Candle bar(int index, double open, double high, double low, double close) {
    return Candle(open, high, low, close, 0.0, DAY_START_MS + index * MS_PER_HOUR);
}

// Bars that never touch 99..102 after the signal bar.
std::vector<Candle> quietBars(int count) {
    std::vector<Candle> bars;
    for (int i = 0; i < count; ++i) {
        bars.push_back(bar(i, 100.0, 100.4, 99.6, 100.0 + (i % 3) * 0.1));
    }
    return bars;
}

strategy::TradeCandidate longCandidate() {
    strategy::TradeCandidate c;
    c.strategy_name = "test";
    c.direction = TradeDirection::BUY;
    c.entry_price = 100.0;
    c.stop_loss = 99.0;
    c.take_profit_1 = 101.0;
    c.take_profit_2 = 102.0;
    c.timestamp = DAY_START_MS;
    return c;
}

strategy::TradeCandidate shortCandidate() {
    strategy::TradeCandidate c;
    c.strategy_name = "test";
    c.direction = TradeDirection::SELL;
    c.entry_price = 100.0;
    c.stop_loss = 101.0;
    c.take_profit_1 = 99.0;
    c.take_profit_2 = 98.0;
    c.timestamp = DAY_START_MS;
    return c;
}
}

void testStopPriorityOnSameBar() {
    // One bar reaches below the stop and above both targets: the intra-bar
    // path is unknown, so the stop is assumed first.
    std::vector<Candle> bars{
        bar(0, 100.0, 100.2, 99.8, 100.0),
        bar(1, 100.0, 102.5, 98.5, 101.0)
    };
    TradeSimulator sim;
    auto trade = sim.simulate(longCandidate(), bars, 0, 0.2);
    assert(trade);
    assert(trade->outcome() == TradeOutcome::SL_HIT);
    assert(!trade->isWin());
    assert(near(trade->exitPrice(), 99.0));
    assert(near(trade->pnl(), 99.0 - 100.2));
    assert(trade->barsHeld() == 1);
    assert(near(trade->spreadCost(), 0.2));
    std::cout << "  stop priority OK" << std::endl;
}

void testTargetsOrder() {
    TradeSimulator sim;
    std::vector<Candle> tp2_bars{bar(0, 100, 100.2, 99.8, 100), bar(1, 100, 102.1, 99.5, 102)};
    auto tp2 = sim.simulate(longCandidate(), tp2_bars, 0, 0.2);
    assert(tp2 && tp2->outcome() == TradeOutcome::TP2_HIT);
    assert(near(tp2->pnl(), 102.0 - 100.2));
    assert(tp2->isWin());

    std::vector<Candle> tp1_bars{bar(0, 100, 100.2, 99.8, 100), bar(1, 100, 101.5, 99.5, 101.2)};
    auto tp1 = sim.simulate(longCandidate(), tp1_bars, 0, 0.2);
    assert(tp1 && tp1->outcome() == TradeOutcome::TP1_HIT);
    assert(near(tp1->exitPrice(), 101.0));
    assert(tp1->isWin());
    std::cout << "  target order OK" << std::endl;
}

void testSellSpreadOnStop() {
    TradeSimulator sim;
    // High 100.6 alone stays under the stop, but the ask (high + spread) reaches it.
    std::vector<Candle> bars{bar(0, 100, 100.2, 99.8, 100), bar(1, 100, 100.6, 99.5, 100.1)};
    auto trade = sim.simulate(shortCandidate(), bars, 0, 0.5);
    assert(trade && trade->outcome() == TradeOutcome::SL_HIT);
    assert(near(trade->pnl(), 100.0 - 101.0));

    // Ask stays under the stop, bid low reaches TP1.
    std::vector<Candle> win_bars{bar(0, 100, 100.2, 99.8, 100), bar(1, 100, 100.2, 98.9, 99.0)};
    auto win = sim.simulate(shortCandidate(), win_bars, 0, 0.5);
    assert(win && win->outcome() == TradeOutcome::TP1_HIT);
    assert(near(win->pnl(), 1.0));
    std::cout << "  sell spread OK" << std::endl;
}

void testExpiry() {
    backtest::SimulatorConfig cfg;
    cfg.max_bars_forward = 3;
    TradeSimulator sim(cfg);

    const auto bars = quietBars(10);
    auto trade = sim.simulate(longCandidate(), bars, 2, 0.2);
    assert(trade && trade->outcome() == TradeOutcome::EXPIRED);
    assert(trade->barsHeld() == 3);
    assert(near(trade->exitPrice(), bars[5].close));
    assert(near(trade->pnl(), bars[5].close - 100.2));
    assert(!trade->isWin());

    // Signal on the last bar: nothing to walk, exit at the adjusted entry.
    auto last = sim.simulate(longCandidate(), bars, bars.size() - 1, 0.2);
    assert(last && last->outcome() == TradeOutcome::EXPIRED);
    assert(last->barsHeld() == 0);
    assert(near(last->exitPrice(), 100.2));
    assert(near(last->pnl(), 0.0));
    std::cout << "  expiry OK" << std::endl;
}

void testNoLookAhead() {
    // Bars past signal + max_bars_forward must not change the result.
    TradeSimulator sim;
    auto full = quietBars(300);
    // A stop-out far in the future, beyond the horizon.
    full[200] = bar(200, 100, 100.2, 90.0, 95.0);

    const size_t signal = 10;
    std::vector<Candle> truncated(full.begin(), full.begin() + signal + 1 + sim.maxBarsForward());

    auto a = sim.simulate(longCandidate(), full, signal, 0.2);
    auto b = sim.simulate(longCandidate(), truncated, signal, 0.2);
    assert(a && b);
    assert(a->outcome() == TradeOutcome::EXPIRED);
    assert(a->outcome() == b->outcome());
    assert(a->barsHeld() == b->barsHeld());
    assert(a->exitPrice() == b->exitPrice());
    assert(a->pnl() == b->pnl());
    std::cout << "  no look-ahead OK" << std::endl;
}

void testRejectedCandidates() {
    TradeSimulator sim;
    const auto bars = quietBars(5);

    auto bad = longCandidate();
    bad.stop_loss = 100.5;      // stop above entry on a long
    assert(TradeSimulator::validateCandidate(bad).has_value());
    assert(!sim.simulate(bad, bars, 0, 0.2));

    auto swapped = shortCandidate();
    swapped.take_profit_2 = 99.5;   // tp2 closer than tp1
    assert(TradeSimulator::validateCandidate(swapped).has_value());
    assert(!sim.simulate(swapped, bars, 0, 0.2));

    auto nan_price = longCandidate();
    nan_price.take_profit_1 = std::numeric_limits<double>::quiet_NaN();
    assert(TradeSimulator::validateCandidate(nan_price).has_value());

    auto zero = longCandidate();
    zero.stop_loss = 0.0;
    assert(TradeSimulator::validateCandidate(zero).has_value());

    assert(!TradeSimulator::validateCandidate(longCandidate()).has_value());
    assert(!TradeSimulator::validateCandidate(shortCandidate()).has_value());
    std::cout << "  rejected candidates OK" << std::endl;
}

void testSimulateMany() {
    TradeSimulator sim;
    backtest::SpreadModel spreads;
    const auto bars = quietBars(40);

    auto at_overlap = longCandidate();
    at_overlap.timestamp = bars[13].timestamp;          // 13:00 UTC

    auto mid_bar = longCandidate();
    mid_bar.timestamp = bars[2].timestamp + 30 * 60 * 1000;   // inside bar 2

    auto too_early = longCandidate();
    too_early.timestamp = bars.front().timestamp - MS_PER_HOUR;

    auto malformed = longCandidate();
    malformed.take_profit_1 = 99.5;
    malformed.timestamp = bars[5].timestamp;

    const auto trades = sim.simulateMany({at_overlap, mid_bar, too_early, malformed}, bars, spreads);
    assert(trades.size() == 2);
    assert(trades[0].signalBarIndex() == 13);
    assert(near(trades[0].spreadCost(), 0.20));
    assert(trades[1].signalBarIndex() == 2);
    assert(near(trades[1].spreadCost(), 0.50));      // 02:30 UTC, asian

    assert(!TradeSimulator::findSignalBarIndex(bars, too_early.timestamp));
    assert(*TradeSimulator::findSignalBarIndex(bars, bars.back().timestamp + MS_PER_DAY) == bars.size() - 1);
    std::cout << "  simulateMany OK" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting TradeSimulator Test..." << std::endl;

    testStopPriorityOnSameBar();
    testTargetsOrder();
    testSellSpreadOnStop();
    testExpiry();
    testNoLookAhead();
    testRejectedCandidates();
    testSimulateMany();

    assert(backtest::outcomeToString(TradeOutcome::TP2_HIT) == "TP2_HIT");

    std::cout << "[TEST] TradeSimulator Test PASSED!" << std::endl;
    return 0;
}
