#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <cmath>

namespace semilev {
namespace strategy {

namespace {
void requireFinite(double value, const std::string& name) {
    if (!std::isfinite(value)) {
        throw ConfigError(name + " must be finite");
    }
}

void validateBand(const AntiChurnBand& band, const std::string& name) {
    requireFinite(band.lower, name + ".lower");
    requireFinite(band.upper, name + ".upper");
    if (band.lower > band.upper) {
        throw ConfigError(name + ": lower bound exceeds upper bound");
    }
    if (band.min_persistence < 0) {
        throw ConfigError(name + ": min_persistence must be >= 0");
    }
    if (!(band.floor_fraction > 0.0 && band.floor_fraction <= 1.0)) {
        throw ConfigError(name + ": floor_fraction must be in (0, 1]");
    }
}
}

void StrategyConfig::validate() const {
    if (pair_first.empty() || pair_second.empty()) {
        throw ConfigError("pair symbols must not be empty");
    }
    if (pair_first == pair_second) {
        throw ConfigError("pair symbols must differ");
    }
    if (index_symbol.empty()) {
        throw ConfigError("index symbol must not be empty");
    }

    for (size_t i = 0; i < entry_thresholds.size(); ++i) {
        requireFinite(entry_thresholds[i], "entry threshold");
        requireFinite(entry_fractions[i], "entry fraction");
        if (entry_thresholds[i] <= 0.0) {
            throw ConfigError("entry thresholds must be positive");
        }
        if (!(entry_fractions[i] > 0.0 && entry_fractions[i] <= 1.0)) {
            throw ConfigError("entry fractions must be in (0, 1]");
        }
        if (i > 0 && entry_thresholds[i - 1] >= entry_thresholds[i]) {
            throw ConfigError("entry thresholds must be strictly ascending (ENTRY_1 < ENTRY_2 < ENTRY_3)");
        }
        if (i > 0 && entry_fractions[i - 1] > entry_fractions[i]) {
            throw ConfigError("entry fractions must be non-decreasing");
        }
    }

    requireFinite(invalid_zero, "invalid_zero");
    requireFinite(hard_exit, "hard_exit");
    requireFinite(daily_kill, "daily_kill");
    if (!(invalidation_factor >= 0.0 && invalidation_factor < 1.0)) {
        throw ConfigError("invalidation_factor must be in [0, 1)");
    }
    if (hard_exit < 0.0) {
        throw ConfigError("hard_exit must be >= 0");
    }
    if (invalid_zero < -hard_exit) {
        throw ConfigError("invalid_zero must not lie beyond the hard exit threshold");
    }
    if (daily_kill >= 0.0) {
        throw ConfigError("daily_kill must be negative");
    }

    long_leverage.validate("long_leverage");
    short_leverage.validate("short_leverage");
    validateBand(long_anti_churn, "long_anti_churn");
    validateBand(short_anti_churn, "short_anti_churn");
}

void EmaCrossoverConfig::validate() const {
    if (trend_symbol.empty()) {
        throw ConfigError("trend_symbol must not be empty");
    }
    if (fast_span < 1 || slow_span < 1) {
        throw ConfigError("EMA spans must be >= 1");
    }
    if (fast_span >= slow_span) {
        throw ConfigError("fast EMA span must be shorter than slow span");
    }
    if (warmup_bars < 0) {
        throw ConfigError("warmup_bars must be >= 0");
    }
    requireFinite(daily_kill, "daily_kill");
    if (daily_kill >= 0.0) {
        throw ConfigError("daily_kill must be negative");
    }
    leverage.validate("ema_crossover.leverage");
}

} // namespace strategy
} // namespace semilev
