#pragma once

#include "common/Types.h"

namespace semilev {
namespace strategy {

// Decision state threaded through successive step() calls by the caller.
// Invariants (enforced by every mutator):
//   position_fraction in [0, 1]
//   position_fraction == 0 while mode == NEUTRAL or trading is disabled
class StrategyState {
public:
    StrategyState() = default;

    Mode mode() const { return mode_; }
    double positionFraction() const { return position_fraction_; }
    bool tradingEnabled() const { return trading_enabled_; }
    double dailyPnl() const { return daily_pnl_; }
    TradingDay currentDay() const { return current_day_; }
    Timestamp lastTimestamp() const { return last_timestamp_; }
    bool hasProcessedBar() const { return has_processed_bar_; }

    // NEUTRAL forces the fraction to zero.
    void setMode(Mode mode);

    // Throws std::out_of_range outside [0, 1] (or NaN), std::logic_error when a
    // non-zero fraction is requested while NEUTRAL or disabled.
    void setPositionFraction(double fraction);

    // Kill switch; stays off until the next beginDay().
    void disableTrading();

    // Return fraction accumulated since day start, fed from the ledger.
    void setDailyPnl(double daily_pnl);

    // New calendar day: daily_pnl = 0, trading on, NEUTRAL, fraction 0.
    void beginDay(TradingDay day);

    void markProcessed(Timestamp ts);

    bool operator==(const StrategyState& other) const;
    bool operator!=(const StrategyState& other) const { return !(*this == other); }

private:
    Mode mode_ = Mode::NEUTRAL;
    double position_fraction_ = 0.0;
    bool trading_enabled_ = true;
    double daily_pnl_ = 0.0;
    TradingDay current_day_ = 0;
    Timestamp last_timestamp_ = 0;
    bool has_processed_bar_ = false;
};

} // namespace strategy
} // namespace semilev
