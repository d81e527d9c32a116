#include "backtest/MetricsCalculator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace stratbench;
using backtest::SimulatedTrade;
using backtest::TradeOutcome;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

SimulatedTrade trade(TradeOutcome outcome, double pnl) {
    strategy::TradeCandidate c;
    c.strategy_name = "test";
    c.entry_price = 100.0;
    c.stop_loss = 99.0;
    c.take_profit_1 = 101.0;
    c.take_profit_2 = 102.0;
    return SimulatedTrade(c, outcome, 100.0 + pnl, pnl, 1, 0.0, 0);
}

}

int main() {
    std::cout << "[TEST] Starting MetricsCalculator Test..." << std::endl;

    backtest::MetricsCalculator calc;

    // 1. No trades: everything zero
    {
        const auto m = calc.compute({});
        assert(m.total_trades == 0);
        assert(m.win_rate == 0.0);
        assert(m.profit_factor == 0.0);
        assert(m.sharpe_ratio == 0.0);
        assert(m.max_drawdown == 0.0);
        assert(m.max_drawdown_pct == 0.0);
        assert(m.expectancy == 0.0);
    }

    // 2. Mixed sequence
    {
        const std::vector<SimulatedTrade> trades{
            trade(TradeOutcome::TP1_HIT, 2.0),
            trade(TradeOutcome::SL_HIT, -1.0),
            trade(TradeOutcome::TP2_HIT, 3.0),
            trade(TradeOutcome::SL_HIT, -1.0)
        };
        const auto m = calc.compute(trades);
        assert(m.total_trades == 4);
        assert(near(m.win_rate, 0.5));
        assert(near(m.profit_factor, 2.5));
        assert(near(m.expectancy, 0.75));
        // equity 2, 1, 4, 3: worst drop 1 from a peak of 2
        assert(near(m.max_drawdown, 1.0));
        assert(near(m.max_drawdown_pct, 0.5));

        const double std_dev = std::sqrt(12.75 / 3.0);
        assert(near(m.sharpe_ratio, 0.75 / std_dev * std::sqrt(252.0)));
        std::cout << "  mixed sequence OK (sharpe=" << m.sharpe_ratio << ")" << std::endl;
    }

    // 3. All winners: capped profit factor, no drawdown
    {
        const auto m = calc.compute({trade(TradeOutcome::TP1_HIT, 1.0), trade(TradeOutcome::TP1_HIT, 2.0)});
        assert(near(m.win_rate, 1.0));
        assert(near(m.profit_factor, 9999.9999));
        assert(m.max_drawdown == 0.0);
    }

    // 4. Only flat trades: no profit, no loss
    {
        const auto m = calc.compute({trade(TradeOutcome::EXPIRED, 0.0), trade(TradeOutcome::EXPIRED, 0.0)});
        assert(m.profit_factor == 0.0);
        assert(m.win_rate == 0.0);
        assert(m.sharpe_ratio == 0.0);
    }

    // 5. Single trade and constant pnl have no dispersion
    {
        assert(calc.compute({trade(TradeOutcome::TP1_HIT, 1.5)}).sharpe_ratio == 0.0);
        const auto m = calc.compute({trade(TradeOutcome::TP1_HIT, 1.0), trade(TradeOutcome::TP1_HIT, 1.0),
                                     trade(TradeOutcome::TP1_HIT, 1.0)});
        assert(m.sharpe_ratio == 0.0);
    }

    // 6. Expiry in profit counts towards gross profit, not wins
    {
        const auto m = calc.compute({trade(TradeOutcome::EXPIRED, 0.8), trade(TradeOutcome::SL_HIT, -0.4)});
        assert(m.win_rate == 0.0);
        assert(near(m.profit_factor, 2.0));
        assert(near(m.expectancy, 0.2));
    }

    // 7. Losses from zero equity: absolute drawdown only
    {
        const auto m = calc.compute({trade(TradeOutcome::SL_HIT, -1.0), trade(TradeOutcome::SL_HIT, -2.0)});
        assert(near(m.max_drawdown, 3.0));
        assert(m.max_drawdown_pct == 0.0);
        assert(m.profit_factor == 0.0);
    }

    // 8. Configured cap and annualization
    {
        backtest::MetricsConfig cfg;
        cfg.profit_factor_cap = 10.0;
        cfg.annualization_periods = 1;
        backtest::MetricsCalculator custom(cfg);
        const auto m = custom.compute({trade(TradeOutcome::TP2_HIT, 50.0), trade(TradeOutcome::SL_HIT, -1.0)});
        assert(near(m.profit_factor, 10.0));
        const double mean = 24.5;
        const double std_dev = std::sqrt((25.5 * 25.5 * 2.0) / 1.0);
        assert(near(m.sharpe_ratio, mean / std_dev));
    }

    std::cout << "[TEST] MetricsCalculator Test PASSED!" << std::endl;
    return 0;
}
