#include "strategy/ProgressiveEntryStrategy.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace semilev {
namespace strategy {

ProgressiveEntryStrategy::ProgressiveEntryStrategy(StrategyConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

Mode ProgressiveEntryStrategy::detectMode(double first_return, double second_return) {
    if (first_return > 0.0 && second_return > 0.0) {
        return Mode::LONG;
    }
    if (first_return < 0.0 && second_return < 0.0) {
        return Mode::SHORT;
    }
    return Mode::NEUTRAL;
}

ProgressiveEntryStrategy::AssetSelection ProgressiveEntryStrategy::selectAsset(
    Mode mode,
    const std::string& first_symbol, double first_return,
    const std::string& second_symbol, double second_return
) {
    AssetSelection selection;
    if (mode == Mode::LONG) {
        const bool first_wins = first_return >= second_return;
        selection.symbol = first_wins ? first_symbol : second_symbol;
        selection.asset_return = first_wins ? first_return : second_return;
    } else if (mode == Mode::SHORT) {
        const bool first_wins = first_return <= second_return;
        selection.symbol = first_wins ? first_symbol : second_symbol;
        selection.asset_return = first_wins ? first_return : second_return;
    }
    return selection;
}

double ProgressiveEntryStrategy::applyProgressiveEntry(Mode mode, double asset_return, double fraction,
                                                       const StrategyConfig& config) {
    for (size_t i = 0; i < config.entry_thresholds.size(); ++i) {
        const double threshold = config.entry_thresholds[i];
        const bool crossed = (mode == Mode::LONG && asset_return >= threshold) ||
                             (mode == Mode::SHORT && asset_return <= -threshold);
        if (crossed) {
            fraction = std::max(fraction, config.entry_fractions[i]);
        }
    }
    return fraction;
}

const AntiChurnBand* ProgressiveEntryStrategy::activeAntiChurnBand(Mode mode, const StrategyConfig& config) {
    const AntiChurnBand* band = nullptr;
    if (mode == Mode::LONG) {
        band = &config.long_anti_churn;
    } else if (mode == Mode::SHORT) {
        band = &config.short_anti_churn;
    }
    return band != nullptr && band->enabled ? band : nullptr;
}

double ProgressiveEntryStrategy::applyAntiChurn(Mode mode, double index_return, const Persistence& persistence,
                                                double fraction, const StrategyConfig& config) {
    const AntiChurnBand* band = activeAntiChurnBand(mode, config);
    if (band == nullptr) {
        return fraction;
    }
    const int persisted = mode == Mode::LONG ? persistence.long_bars : persistence.short_bars;

    if (index_return >= band->lower && index_return <= band->upper &&
        persisted >= band->min_persistence) {
        fraction = std::max(fraction, band->floor_fraction);
    }
    return fraction;
}

double ProgressiveEntryStrategy::applyInvalidation(Mode mode, double asset_return, double fraction,
                                                   const StrategyConfig& config) {
    if ((mode == Mode::LONG && asset_return <= config.invalid_zero) ||
        (mode == Mode::SHORT && asset_return >= config.invalid_zero)) {
        fraction *= config.invalidation_factor;
    }
    return fraction;
}

double ProgressiveEntryStrategy::applyHardExit(Mode mode, double asset_return, double fraction,
                                               const StrategyConfig& config) {
    if ((mode == Mode::LONG && asset_return <= -config.hard_exit) ||
        (mode == Mode::SHORT && asset_return >= config.hard_exit)) {
        return 0.0;
    }
    return fraction;
}

double ProgressiveEntryStrategy::baseLeverage(Mode mode, double vix, const StrategyConfig& config) {
    switch (mode) {
        case Mode::LONG: return config.long_leverage.lookup(vix);
        case Mode::SHORT: return config.short_leverage.lookup(vix);
        case Mode::NEUTRAL: return 0.0;
    }
    return 0.0;
}

StepResult ProgressiveEntryStrategy::step(const StrategyState& previous, const MarketBar& bar) {
    StepResult result;
    applySessionRules(previous, bar, config_.daily_kill, result);
    StrategyState& state = result.state;

    const double first_return = bar.getReturn(config_.pair_first);
    const double second_return = bar.getReturn(config_.pair_second);
    const double index_return = bar.getReturn(config_.index_symbol);

    // The index return only feeds the anti-churn band, so it is required only when that band is on
    const bool pair_ok = !std::isnan(first_return) && !std::isnan(second_return) && !std::isnan(bar.vix);
    const bool index_needed = pair_ok &&
        activeAntiChurnBand(detectMode(first_return, second_return), config_) != nullptr;
    if (!pair_ok || (index_needed && std::isnan(index_return))) {
        result.skipped = true;
        result.skip_reason = pair_ok ? "NaN index return" : "NaN return or VIX";
        result.target = holdTarget(state);
        state.markProcessed(bar.timestamp);
        LOG_WARN("[{}] bar {} skipped: {}", getName(),
                 utils::TimeUtils::formatTimestamp(bar.timestamp), result.skip_reason);
        return result;
    }

    ExposureTarget& target = result.target;
    target.trading_enabled = state.tradingEnabled();

    if (!state.tradingEnabled()) {
        target.mode = state.mode();
        state.markProcessed(bar.timestamp);
        return result;
    }

    // 3. Mode
    const Mode mode = detectMode(first_return, second_return);
    state.setMode(mode);

    // 4. Reference return and traded leg
    const AssetSelection selection = selectAsset(mode, config_.pair_first, first_return,
                                                 config_.pair_second, second_return);
    result.asset_return = selection.asset_return;

    double fraction = state.positionFraction();
    if (mode != Mode::NEUTRAL) {
        // 5-8
        fraction = applyProgressiveEntry(mode, selection.asset_return, fraction, config_);
        fraction = applyAntiChurn(mode, index_return, bar.persistence, fraction, config_);
        fraction = applyInvalidation(mode, selection.asset_return, fraction, config_);
        fraction = applyHardExit(mode, selection.asset_return, fraction, config_);
        state.setPositionFraction(std::clamp(fraction, 0.0, 1.0));
    }

    // 9. Leverage is derived, not persisted
    target.mode = mode;
    target.asset_symbol = selection.symbol;
    target.position_fraction = state.positionFraction();
    target.leverage = baseLeverage(mode, bar.vix, config_) * state.positionFraction();

    state.markProcessed(bar.timestamp);
    return result;
}

} // namespace strategy
} // namespace semilev
