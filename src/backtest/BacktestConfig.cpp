#include "backtest/BacktestConfig.h"
#include "common/Errors.h"

namespace semilev {
namespace backtest {

const char* toString(StrategyFamily family) {
    return family == StrategyFamily::EMA_CROSSOVER ? "ema_crossover" : "progressive_entry";
}

StrategyFamily parseStrategyFamily(const std::string& name) {
    if (name == "progressive_entry") return StrategyFamily::PROGRESSIVE_ENTRY;
    if (name == "ema_crossover") return StrategyFamily::EMA_CROSSOVER;
    throw ConfigError("unknown strategy family: " + name);
}

BacktestConfig BacktestConfig::forFamily(StrategyFamily family) {
    BacktestConfig config;
    config.family = family;
    if (family == StrategyFamily::EMA_CROSSOVER) {
        config.ledger.flatten_at_day_end = false;
    }
    return config;
}

void BacktestConfig::validate() const {
    strategy.validate();
    ema_crossover.validate();
    ledger.validate();
    if (data.bar_minutes <= 0) {
        throw ConfigError("bar_minutes must be positive");
    }
}

} // namespace backtest
} // namespace semilev
