#pragma once

#include "common/Types.h"
#include "ledger/LedgerConfig.h"
#include "strategy/IStrategy.h"
#include <optional>
#include <string>
#include <vector>

namespace semilev {
namespace ledger {

// Open position (at most one)
struct Position {
    std::string symbol;
    Mode mode = Mode::NEUTRAL;
    double entry_price = 0.0;
    double shares = 0.0;
    double notional = 0.0;          // dollars at entry
    double leverage = 0.0;          // leverage at entry
    Timestamp entry_time = 0;
    double entry_equity = 0.0;      // cash equity when opened
    double last_price = 0.0;        // last valid close seen while open

    double unrealizedPnl(double price) const {
        return (mode == Mode::SHORT) ? shares * (entry_price - price)
                                     : shares * (price - entry_price);
    }
};

enum class FillType { OPEN, CLOSE, RESIZE };

enum class FillReason {
    ENTRY,
    RE_ENTRY,       // entry after an equity stop on the same day
    MODE_FLIP,
    ASSET_SWITCH,
    FRACTION_ZERO,
    KILL_SWITCH,
    EQUITY_STOP,
    RESIZE,
    END_OF_DAY,
    END_OF_RUN
};

const char* toString(FillType type);
const char* toString(FillReason reason);

struct Fill {
    Timestamp timestamp = 0;
    FillType type = FillType::OPEN;
    FillReason reason = FillReason::ENTRY;
    std::string symbol;
    Mode mode = Mode::NEUTRAL;
    double price = 0.0;
    double shares = 0.0;            // shares after the fill (OPEN/RESIZE) or closed (CLOSE)
    double notional = 0.0;
    double leverage = 0.0;
    double realized_pnl = 0.0;      // CLOSE/RESIZE only
    double cash_after = 0.0;
};

// One realized position segment (entry to exit or to resize)
struct TradeRecord {
    std::string symbol;
    Mode mode = Mode::NEUTRAL;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double shares = 0.0;
    double leverage = 0.0;
    double profit_loss = 0.0;
    double profit_loss_pct = 0.0;   // vs entry equity
    Timestamp entry_time = 0;
    Timestamp exit_time = 0;
    FillReason exit_reason = FillReason::END_OF_RUN;
};

enum class ApplyStatus { APPLIED, SKIPPED_INVALID_PRICE };

struct ApplyResult {
    ApplyStatus status = ApplyStatus::APPLIED;
    std::vector<Fill> fills;
    double cash_equity = 0.0;
    double marked_equity = 0.0;
    double unrealized_pnl = 0.0;
    bool stop_triggered = false;
    bool day_reset = false;
    std::string warning;
};

// Cash / position / equity bookkeeping driven by exposure targets.
//
// cash_equity changes only at realization events (exit, resize, stop, kill,
// forced close). Unrealized P&L is added transiently for marked equity, drawdown
// and the stop check.
class EquityLedger {
public:
    explicit EquityLedger(LedgerConfig config);

    // Per bar, in order: ordering check, price validation, day roll
    // (day_start_equity snapshot), mark + equity stop, exits, resize, entry.
    // Timestamps must be strictly increasing (OutOfOrderBarError).
    ApplyResult apply(const strategy::ExposureTarget& target, const MarketBar& bar);

    // Forced close at the bar's close (end of day / end of run). Accepts the
    // timestamp of the last applied bar. Falls back to the last valid close.
    ApplyResult closePosition(const MarketBar& bar, FillReason reason);

    // ===== Equity =====
    double getCashEquity() const { return cash_equity_; }
    double getMarkedEquity() const { return marked_equity_; }
    double getDayStartEquity() const { return day_start_equity_; }
    double getPeakEquity() const { return peak_equity_; }
    double getMaxDrawdown() const { return max_drawdown_; }         // dollars, >= 0
    double getMaxDrawdownPct() const { return max_drawdown_pct_; }  // fraction of peak, >= 0

    // (cash - day_start) / day_start, realized only
    double dailyRealizedReturn() const;
    // (marked - day_start) / day_start
    double dailyMarkedReturn() const;

    // ===== Position =====
    bool hasPosition() const { return position_.has_value(); }
    const std::optional<Position>& getPosition() const { return position_; }
    const std::vector<TradeRecord>& getTradeHistory() const { return trade_history_; }

    // ===== Counters =====
    TradingDay currentDay() const { return current_day_; }
    int stopsToday() const { return stops_today_; }
    int totalEntries() const { return total_entries_; }
    int totalResizes() const { return total_resizes_; }
    int totalStops() const { return total_stops_; }
    int totalKillExits() const { return total_kill_exits_; }

    const LedgerConfig& getConfig() const { return config_; }

private:
    void checkOrder(Timestamp ts, bool allow_equal) const;
    std::string validateBar(const strategy::ExposureTarget& target, const MarketBar& bar,
                            double day_start) const;
    void rollDay(TradingDay day);

    double executionPrice(const Quote& quote) const;
    double stopMarkPrice(const Quote& quote, Mode mode) const;

    bool checkEquityStop(const MarketBar& bar, ApplyResult& result);
    bool needsResize(const strategy::ExposureTarget& target, double price) const;

    void openPosition(const strategy::ExposureTarget& target, double price, Timestamp ts,
                      FillReason reason, ApplyResult& result);
    void closeAt(double exit_price, double pnl, Timestamp ts, FillReason reason, ApplyResult& result);
    void resize(const strategy::ExposureTarget& target, double price, Timestamp ts,
                ApplyResult& result);
    void recordTrade(double exit_price, double pnl, Timestamp ts, FillReason reason);

    void finalize(const MarketBar& bar, ApplyResult& result);

    LedgerConfig config_;

    double cash_equity_;
    double marked_equity_;
    double day_start_equity_;
    double peak_equity_;
    double max_drawdown_;
    double max_drawdown_pct_;

    std::optional<Position> position_;
    std::vector<TradeRecord> trade_history_;

    TradingDay current_day_;
    Timestamp last_timestamp_;
    bool has_bar_;
    bool stopped_today_;
    int stops_today_;

    int total_entries_;
    int total_resizes_;
    int total_stops_;
    int total_kill_exits_;
};

} // namespace ledger
} // namespace semilev
