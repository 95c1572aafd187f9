#include "strategy/EmaCrossoverStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <cmath>
#include <utility>

namespace semilev {
namespace strategy {

EmaCrossoverStrategy::EmaCrossoverStrategy(EmaCrossoverConfig config)
    : config_(std::move(config))
    , fast_ema_(kNaN)
    , slow_ema_(kNaN)
    , bars_seen_(0)
{
    config_.validate();
}

void EmaCrossoverStrategy::reset() {
    fast_ema_ = kNaN;
    slow_ema_ = kNaN;
    bars_seen_ = 0;
}

void EmaCrossoverStrategy::updateEmas(double close) {
    if (bars_seen_ == 0) {
        fast_ema_ = close;
        slow_ema_ = close;
    } else {
        fast_ema_ = analytics::TechnicalIndicators::nextEMA(fast_ema_, close, config_.fast_span);
        slow_ema_ = analytics::TechnicalIndicators::nextEMA(slow_ema_, close, config_.slow_span);
    }
    ++bars_seen_;
}

StepResult EmaCrossoverStrategy::step(const StrategyState& previous, const MarketBar& bar) {
    StepResult result;
    applySessionRules(previous, bar, config_.daily_kill, result);
    StrategyState& state = result.state;

    const double close = bar.getClose(config_.trend_symbol);
    if (!isValidPrice(close) || std::isnan(bar.vix)) {
        result.skipped = true;
        result.skip_reason = "invalid close or NaN VIX";
        result.target = holdTarget(state);
        state.markProcessed(bar.timestamp);
        LOG_WARN("[{}] bar {} skipped: {}", getName(),
                 utils::TimeUtils::formatTimestamp(bar.timestamp), result.skip_reason);
        return result;
    }

    updateEmas(close);
    result.asset_return = bar.getReturn(config_.trend_symbol);

    ExposureTarget& target = result.target;
    target.trading_enabled = state.tradingEnabled();
    if (!state.tradingEnabled()) {
        state.markProcessed(bar.timestamp);
        return result;
    }

    const bool bull = isWarmedUp() && fast_ema_ > slow_ema_;
    if (bull) {
        state.setMode(Mode::LONG);
        state.setPositionFraction(1.0);
        target.mode = Mode::LONG;
        target.asset_symbol = config_.trend_symbol;
        target.position_fraction = 1.0;
        target.leverage = config_.leverage.lookup(bar.vix);
    } else {
        state.setMode(Mode::NEUTRAL);
    }

    state.markProcessed(bar.timestamp);
    return result;
}

} // namespace strategy
} // namespace semilev
