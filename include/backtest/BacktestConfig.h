#pragma once

#include <string>

#include "backtest/DataHistory.h"
#include "ledger/LedgerConfig.h"
#include "strategy/StrategyConfig.h"

namespace semilev {
namespace backtest {

enum class StrategyFamily {
    PROGRESSIVE_ENTRY,  // intraday pair engine, flat at day end
    EMA_CROSSOVER       // daily trend engine, holds overnight
};

const char* toString(StrategyFamily family);
// "progressive_entry" / "ema_crossover"; throws ConfigError otherwise
StrategyFamily parseStrategyFamily(const std::string& name);

struct BacktestConfig {
    StrategyFamily family = StrategyFamily::PROGRESSIVE_ENTRY;
    strategy::StrategyConfig strategy;
    strategy::EmaCrossoverConfig ema_crossover;
    ledger::LedgerConfig ledger;
    DataOptions data;

    std::string journal_path;       // empty: no journal
    std::string run_id = "backtest";

    // Family defaults: the EMA family keeps positions overnight.
    static BacktestConfig forFamily(StrategyFamily family);

    void validate() const;
};

} // namespace backtest
} // namespace semilev
