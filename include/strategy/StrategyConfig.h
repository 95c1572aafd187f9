#pragma once

#include <array>
#include <string>

#include "strategy/LeverageTable.h"

namespace semilev {
namespace strategy {

// Hysteresis band on the secondary index return. Long side uses a positive band,
// short side its mirror.
struct AntiChurnBand {
    bool enabled = true;
    double lower = 0.0;
    double upper = 0.0;
    int min_persistence = 30;
    double floor_fraction = 0.5;
};

struct StrategyConfig {
    // Correlated pair driving mode detection; on equal returns the first one is traded.
    std::string pair_first = "SMH";
    std::string pair_second = "SOXX";
    // Broad index used by the anti-churn rule
    std::string index_symbol = "QQQ";

    std::array<double, 3> entry_thresholds{{0.0012, 0.0020, 0.0030}};
    std::array<double, 3> entry_fractions{{0.5, 0.7, 1.0}};

    double invalid_zero = 0.0;
    double invalidation_factor = 0.5;
    double hard_exit = 0.002;
    double daily_kill = -0.025;

    LeverageTable long_leverage = LeverageTable::canonicalLong();
    LeverageTable short_leverage = LeverageTable::canonicalShort();

    AntiChurnBand long_anti_churn{true, 0.003, 0.007, 30, 0.5};
    AntiChurnBand short_anti_churn{true, -0.007, -0.003, 30, 0.5};

    // Throws ConfigError on malformed thresholds or tables.
    void validate() const;
};

struct EmaCrossoverConfig {
    std::string trend_symbol = "SMH";
    int fast_span = 25;
    int slow_span = 125;
    int warmup_bars = 125;
    LeverageTable leverage = LeverageTable::productionLong();
    double daily_kill = -0.025;

    void validate() const;
};

} // namespace strategy
} // namespace semilev
