#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <string>

namespace semilev {
namespace strategy {

// Intraday progressive-entry engine on a correlated pair (SMH / SOXX by default).
//
// Per bar, in order: day boundary, kill switch, mode detection, reference return,
// progressive entry floors, anti-churn floor, soft invalidation, hard exit,
// leverage = base(VIX, mode) * fraction. A NaN in any consumed return or in VIX
// makes the bar a no-op after the kill switch.
class ProgressiveEntryStrategy : public IStrategy {
public:
    explicit ProgressiveEntryStrategy(StrategyConfig config);

    std::string getName() const override { return "progressive_entry"; }
    StepResult step(const StrategyState& previous, const MarketBar& bar) override;

    const StrategyConfig& getConfig() const { return config_; }

    // ===== Rule stages =====

    struct AssetSelection {
        std::string symbol;
        double asset_return = 0.0;
    };

    // Both > 0 -> LONG, both < 0 -> SHORT, anything else NEUTRAL.
    static Mode detectMode(double first_return, double second_return);

    // LONG: larger return, SHORT: smaller return, ties go to the first leg.
    static AssetSelection selectAsset(Mode mode,
                                      const std::string& first_symbol, double first_return,
                                      const std::string& second_symbol, double second_return);

    // Ratchet: each crossed threshold raises the fraction to at least its floor.
    static double applyProgressiveEntry(Mode mode, double asset_return, double fraction,
                                        const StrategyConfig& config);

    // Enabled band for the mode, nullptr for NEUTRAL or a disabled band
    static const AntiChurnBand* activeAntiChurnBand(Mode mode, const StrategyConfig& config);

    static double applyAntiChurn(Mode mode, double index_return, const Persistence& persistence,
                                 double fraction, const StrategyConfig& config);

    static double applyInvalidation(Mode mode, double asset_return, double fraction,
                                    const StrategyConfig& config);

    static double applyHardExit(Mode mode, double asset_return, double fraction,
                                const StrategyConfig& config);

    static double baseLeverage(Mode mode, double vix, const StrategyConfig& config);

private:
    StrategyConfig config_;
};

} // namespace strategy
} // namespace semilev
