#include "strategy/IStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace semilev {
namespace strategy {

void applySessionRules(const StrategyState& previous, const MarketBar& bar,
                       double daily_kill, StepResult& result) {
    if (previous.hasProcessedBar() && bar.timestamp <= previous.lastTimestamp()) {
        throw OutOfOrderBarError(
            "bar " + utils::TimeUtils::formatTimestamp(bar.timestamp) +
            " is not after " + utils::TimeUtils::formatTimestamp(previous.lastTimestamp()));
    }

    result.state = previous;
    StrategyState& state = result.state;

    // 1. Day boundary, before any other rule for this day
    if (!previous.hasProcessedBar() || bar.day != previous.currentDay()) {
        state.beginDay(bar.day);
        result.day_reset = true;
    }

    // 2. Kill switch, no re-arm within the day
    if (state.tradingEnabled() && state.dailyPnl() <= daily_kill) {
        state.disableTrading();
        result.kill_switch_tripped = true;
        LOG_WARN("Kill switch tripped on {}: daily pnl {:.4f} <= {:.4f}",
                 bar.day, state.dailyPnl(), daily_kill);
    } else if (!state.tradingEnabled()) {
        state.disableTrading();
    }
}

ExposureTarget holdTarget(const StrategyState& state) {
    ExposureTarget target;
    target.mode = state.mode();
    target.position_fraction = state.positionFraction();
    target.trading_enabled = state.tradingEnabled();
    // A disabled day is not a hold: the ledger must flatten.
    target.hold = state.tradingEnabled();
    return target;
}

} // namespace strategy
} // namespace semilev
