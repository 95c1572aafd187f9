#pragma once

#include "common/Types.h"
#include "ledger/EquityLedger.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace semilev {
namespace ledger {

struct TradeStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double expectancy() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
    double averageWin() const {
        return (wins > 0) ? gross_profit / wins : 0.0;
    }
    double averageLoss() const {
        const int losses = trades - wins;
        return (losses > 0) ? -gross_loss_abs / losses : 0.0;
    }
};

// Marked equity at the last bar of a trading day
struct DailyEquity {
    TradingDay day = 0;
    double equity = 0.0;
};

struct PerformanceSummary {
    double initial_capital = 0.0;
    double final_equity = 0.0;
    double total_return = 0.0;
    double cagr = 0.0;              // 252 trading days per year
    double max_drawdown = 0.0;      // dollars
    double max_drawdown_pct = 0.0;
    double mar = 0.0;               // cagr / max_drawdown_pct
    double sharpe = 0.0;            // annualized, daily returns
    double best_day = 0.0;
    double worst_day = 0.0;
    int trading_days = 0;

    TradeStats round_trips;         // resize segments folded into their round trip
    std::map<std::string, TradeStats> by_exit_reason;

    int entries = 0;
    int resizes = 0;
    int stops = 0;
    int kill_exits = 0;
};

// Aggregates a run's daily equity and trade history into summary statistics.
class PerformanceReport {
public:
    static constexpr int kTradingDaysPerYear = 252;

    void rebuild(double initial_capital,
                 const std::vector<DailyEquity>& daily_equity,
                 const std::vector<TradeRecord>& history);

    const PerformanceSummary& summary() const { return summary_; }
    const std::vector<double>& dailyReturns() const { return daily_returns_; }

    nlohmann::json toJson() const;
    std::string format() const;

private:
    PerformanceSummary summary_;
    std::vector<double> daily_returns_;
};

} // namespace ledger
} // namespace semilev
