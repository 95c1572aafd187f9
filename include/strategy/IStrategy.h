#pragma once

#include "common/Types.h"
#include "strategy/StrategyState.h"
#include <string>

namespace semilev {
namespace strategy {

// What the engine asks the ledger to hold after a bar.
struct ExposureTarget {
    Mode mode = Mode::NEUTRAL;
    std::string asset_symbol;       // empty while NEUTRAL
    double position_fraction = 0.0;
    double leverage = 0.0;
    bool trading_enabled = true;
    bool hold = false;              // no-op bar: keep whatever is open

    bool isActive() const {
        return !hold && trading_enabled && mode != Mode::NEUTRAL
            && position_fraction > 0.0 && leverage > 0.0 && !asset_symbol.empty();
    }
};

struct StepResult {
    StrategyState state;
    ExposureTarget target;
    double asset_return = 0.0;       // reference return of the selected leg
    bool day_reset = false;
    bool kill_switch_tripped = false; // tripped on this bar
    bool skipped = false;            // data-quality no-op
    std::string skip_reason;
};

// Bar-sequential decision engine. step() does not mutate the previous state; it
// returns the next one. Out-of-order bars throw OutOfOrderBarError.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual std::string getName() const = 0;

    virtual StepResult step(const StrategyState& previous, const MarketBar& bar) = 0;

    // Clears internal indicator state, if any, before replaying a new sequence.
    virtual void reset() {}
};

// Shared head of every step(): ordering check, day-boundary reset, kill switch.
// Fills result.state / day_reset / kill_switch_tripped.
void applySessionRules(const StrategyState& previous, const MarketBar& bar,
                       double daily_kill, StepResult& result);

// Exposure target for a bar that could not be evaluated.
ExposureTarget holdTarget(const StrategyState& state);

} // namespace strategy
} // namespace semilev
