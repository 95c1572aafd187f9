#include "ledger/PerformanceReport.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace semilev {
namespace ledger {
namespace {
void accumulateStats(TradeStats& s, double profit_loss) {
    s.trades++;
    s.net_profit += profit_loss;
    if (profit_loss > 0.0) {
        s.wins++;
        s.gross_profit += profit_loss;
    } else if (profit_loss < 0.0) {
        s.gross_loss_abs += std::abs(profit_loss);
    }
}

nlohmann::json statsToJson(const TradeStats& s) {
    return {
        {"trades", s.trades},
        {"wins", s.wins},
        {"win_rate", s.winRate()},
        {"net_profit", s.net_profit},
        {"expectancy", s.expectancy()},
        {"profit_factor", s.profitFactor()},
        {"avg_win", s.averageWin()},
        {"avg_loss", s.averageLoss()}
    };
}
}

void PerformanceReport::rebuild(double initial_capital,
                                const std::vector<DailyEquity>& daily_equity,
                                const std::vector<TradeRecord>& history) {
    summary_ = PerformanceSummary();
    daily_returns_.clear();

    PerformanceSummary& s = summary_;
    s.initial_capital = initial_capital;
    s.final_equity = daily_equity.empty() ? initial_capital : daily_equity.back().equity;
    s.trading_days = static_cast<int>(daily_equity.size());

    // Equity curve
    double prev = initial_capital;
    double peak = initial_capital;
    for (const auto& point : daily_equity) {
        if (prev > 0.0) {
            daily_returns_.push_back(point.equity / prev - 1.0);
        }
        prev = point.equity;

        peak = std::max(peak, point.equity);
        const double drawdown = peak - point.equity;
        if (drawdown > s.max_drawdown) {
            s.max_drawdown = drawdown;
        }
        if (peak > 0.0) {
            s.max_drawdown_pct = std::max(s.max_drawdown_pct, drawdown / peak);
        }
    }

    if (initial_capital > 0.0) {
        s.total_return = s.final_equity / initial_capital - 1.0;
        if (s.trading_days > 0 && s.final_equity > 0.0) {
            const double years = static_cast<double>(s.trading_days) / kTradingDaysPerYear;
            s.cagr = std::pow(s.final_equity / initial_capital, 1.0 / years) - 1.0;
        }
    }
    if (s.max_drawdown_pct > 0.0) {
        s.mar = s.cagr / s.max_drawdown_pct;
    }

    if (!daily_returns_.empty()) {
        s.best_day = *std::max_element(daily_returns_.begin(), daily_returns_.end());
        s.worst_day = *std::min_element(daily_returns_.begin(), daily_returns_.end());
        const double stdev = analytics::TechnicalIndicators::calculateSampleStdDev(daily_returns_);
        if (stdev > 1e-12) {
            const double mean = analytics::TechnicalIndicators::calculateMean(daily_returns_);
            s.sharpe = mean / stdev * std::sqrt(static_cast<double>(kTradingDaysPerYear));
        }
    }

    // Trades: resize segments roll into the round trip they belong to
    double round_trip_pnl = 0.0;
    for (const auto& trade : history) {
        round_trip_pnl += trade.profit_loss;
        if (trade.exit_reason == FillReason::RESIZE) {
            s.resizes++;
            continue;
        }
        s.entries++;
        if (trade.exit_reason == FillReason::EQUITY_STOP) {
            s.stops++;
        } else if (trade.exit_reason == FillReason::KILL_SWITCH) {
            s.kill_exits++;
        }
        accumulateStats(s.round_trips, round_trip_pnl);
        accumulateStats(s.by_exit_reason[toString(trade.exit_reason)], round_trip_pnl);
        round_trip_pnl = 0.0;
    }
}

nlohmann::json PerformanceReport::toJson() const {
    const PerformanceSummary& s = summary_;
    nlohmann::json by_reason = nlohmann::json::object();
    for (const auto& kv : s.by_exit_reason) {
        by_reason[kv.first] = statsToJson(kv.second);
    }

    return {
        {"initial_capital", s.initial_capital},
        {"final_equity", s.final_equity},
        {"total_return", s.total_return},
        {"cagr", s.cagr},
        {"max_drawdown", s.max_drawdown},
        {"max_drawdown_pct", s.max_drawdown_pct},
        {"mar", s.mar},
        {"sharpe", s.sharpe},
        {"best_day", s.best_day},
        {"worst_day", s.worst_day},
        {"trading_days", s.trading_days},
        {"entries", s.entries},
        {"resizes", s.resizes},
        {"stops", s.stops},
        {"kill_exits", s.kill_exits},
        {"trades", statsToJson(s.round_trips)},
        {"by_exit_reason", by_reason}
    };
}

std::string PerformanceReport::format() const {
    const PerformanceSummary& s = summary_;
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "==================== Backtest Summary ====================\n";
    out << "Initial capital : $" << s.initial_capital << "\n";
    out << "Final equity    : $" << s.final_equity << "\n";
    out << "Total return    : " << s.total_return * 100.0 << "%\n";
    out << "CAGR            : " << s.cagr * 100.0 << "%\n";
    out << "Max drawdown    : $" << s.max_drawdown << " (" << s.max_drawdown_pct * 100.0 << "%)\n";
    out << "MAR             : " << s.mar << "\n";
    out << "Sharpe          : " << s.sharpe << "\n";
    out << "Best / worst day: " << s.best_day * 100.0 << "% / " << s.worst_day * 100.0 << "%\n";
    out << "Trading days    : " << s.trading_days << "\n";
    out << "----------------------------------------------------------\n";
    out << "Round trips     : " << s.round_trips.trades
        << " (win rate " << s.round_trips.winRate() * 100.0 << "%)\n";
    out << "Profit factor   : " << s.round_trips.profitFactor() << "\n";
    out << "Avg win / loss  : $" << s.round_trips.averageWin()
        << " / $" << s.round_trips.averageLoss() << "\n";
    out << "Entries " << s.entries << ", resizes " << s.resizes
        << ", stops " << s.stops << ", kill exits " << s.kill_exits << "\n";
    for (const auto& kv : s.by_exit_reason) {
        out << "  " << std::left << std::setw(14) << kv.first << std::right
            << kv.second.trades << " trades, net $" << kv.second.net_profit << "\n";
    }
    out << "==========================================================\n";
    return out.str();
}

} // namespace ledger
} // namespace semilev
