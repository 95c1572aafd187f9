#include "ledger/PerformanceReport.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace semilev;
using semilev::ledger::DailyEquity;
using semilev::ledger::FillReason;
using semilev::ledger::PerformanceReport;
using semilev::ledger::TradeRecord;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

TradeRecord trade(double pnl, FillReason reason) {
    TradeRecord t;
    t.symbol = "SMH";
    t.mode = Mode::LONG;
    t.profit_loss = pnl;
    t.exit_reason = reason;
    return t;
}
}

int main() {
    {
        const std::vector<DailyEquity> daily{
            {20240102, 101000.0},
            {20240103, 99990.0},
            {20240104, 102000.0}
        };
        const std::vector<TradeRecord> history{
            trade(500.0, FillReason::RESIZE),
            trade(300.0, FillReason::FRACTION_ZERO),
            trade(-1800.0, FillReason::EQUITY_STOP),
            trade(-200.0, FillReason::KILL_SWITCH)
        };

        PerformanceReport report;
        report.rebuild(100000.0, daily, history);
        const auto& s = report.summary();

        assert(s.trading_days == 3);
        assert(near(s.final_equity, 102000.0));
        assert(near(s.total_return, 0.02));
        assert(near(s.cagr, std::pow(1.02, 252.0 / 3.0) - 1.0, 1e-6));

        assert(report.dailyReturns().size() == 3);
        assert(near(report.dailyReturns()[0], 0.01));
        assert(near(report.dailyReturns()[1], -0.01));
        assert(near(s.best_day, 102000.0 / 99990.0 - 1.0));
        assert(near(s.worst_day, -0.01));

        assert(near(s.max_drawdown, 1010.0));
        assert(near(s.max_drawdown_pct, 0.01));
        assert(near(s.mar, s.cagr / 0.01, 1e-6));
        assert(s.sharpe > 0.0);

        assert(s.entries == 3);
        assert(s.resizes == 1);
        assert(s.stops == 1);
        assert(s.kill_exits == 1);

        assert(s.round_trips.trades == 3);
        assert(s.round_trips.wins == 1);
        assert(near(s.round_trips.net_profit, -1200.0));
        assert(near(s.round_trips.profitFactor(), 0.4));
        assert(near(s.round_trips.averageWin(), 800.0));
        assert(near(s.round_trips.averageLoss(), -1000.0));

        assert(s.by_exit_reason.count("FRACTION_ZERO") == 1);
        assert(near(s.by_exit_reason.at("FRACTION_ZERO").net_profit, 800.0));
        assert(s.by_exit_reason.count("RESIZE") == 0);

        const auto j = report.toJson();
        assert(j["trading_days"].get<int>() == 3);
        assert(j["by_exit_reason"].contains("EQUITY_STOP"));
        assert(report.format().find("Backtest Summary") != std::string::npos);
    }

    // Empty run
    {
        PerformanceReport report;
        report.rebuild(100000.0, {}, {});
        const auto& s = report.summary();
        assert(s.trading_days == 0);
        assert(s.total_return == 0.0);
        assert(s.cagr == 0.0);
        assert(s.sharpe == 0.0);
        assert(s.round_trips.trades == 0);
    }

    // Flat curve has no volatility
    {
        PerformanceReport report;
        report.rebuild(100000.0, {{20240102, 100000.0}, {20240103, 100000.0}}, {});
        assert(report.summary().sharpe == 0.0);
        assert(report.summary().max_drawdown_pct == 0.0);
        assert(report.summary().mar == 0.0);
    }

    std::cout << "[TEST] PerformanceReport PASSED\n";
    return 0;
}
