#include "strategy/StrategyState.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace semilev {
namespace strategy {

void StrategyState::setMode(Mode mode) {
    mode_ = mode;
    if (mode_ == Mode::NEUTRAL) {
        position_fraction_ = 0.0;
    }
}

void StrategyState::setPositionFraction(double fraction) {
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        throw std::out_of_range("position_fraction out of [0, 1]: " + std::to_string(fraction));
    }
    if (fraction > 0.0 && (mode_ == Mode::NEUTRAL || !trading_enabled_)) {
        throw std::logic_error("position_fraction must be 0 while NEUTRAL or trading disabled");
    }
    position_fraction_ = fraction;
}

void StrategyState::disableTrading() {
    trading_enabled_ = false;
    position_fraction_ = 0.0;
}

void StrategyState::setDailyPnl(double daily_pnl) {
    if (std::isfinite(daily_pnl)) {
        daily_pnl_ = daily_pnl;
    }
}

void StrategyState::beginDay(TradingDay day) {
    daily_pnl_ = 0.0;
    trading_enabled_ = true;
    position_fraction_ = 0.0;
    mode_ = Mode::NEUTRAL;
    current_day_ = day;
}

void StrategyState::markProcessed(Timestamp ts) {
    last_timestamp_ = ts;
    has_processed_bar_ = true;
}

bool StrategyState::operator==(const StrategyState& other) const {
    return mode_ == other.mode_
        && position_fraction_ == other.position_fraction_
        && trading_enabled_ == other.trading_enabled_
        && daily_pnl_ == other.daily_pnl_
        && current_day_ == other.current_day_
        && last_timestamp_ == other.last_timestamp_
        && has_processed_bar_ == other.has_processed_bar_;
}

} // namespace strategy
} // namespace semilev
