#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <string>

namespace semilev {
namespace strategy {

// Long-only trend engine: fast/slow EMA of the trend symbol's close.
// Bull (fast > slow) after warm-up -> LONG at full fraction, otherwise NEUTRAL.
//
// The EMAs are engine-owned and advance once per evaluated bar; call reset()
// before replaying another sequence.
class EmaCrossoverStrategy : public IStrategy {
public:
    explicit EmaCrossoverStrategy(EmaCrossoverConfig config);

    std::string getName() const override { return "ema_crossover"; }
    StepResult step(const StrategyState& previous, const MarketBar& bar) override;
    void reset() override;

    const EmaCrossoverConfig& getConfig() const { return config_; }

    double fastEma() const { return fast_ema_; }
    double slowEma() const { return slow_ema_; }
    int barsSeen() const { return bars_seen_; }
    bool isWarmedUp() const { return bars_seen_ >= config_.warmup_bars; }

private:
    void updateEmas(double close);

    EmaCrossoverConfig config_;
    double fast_ema_;
    double slow_ema_;
    int bars_seen_;
};

} // namespace strategy
} // namespace semilev
