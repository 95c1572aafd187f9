#pragma once

#include <string>
#include <vector>

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestEngine.h"

namespace semilev {
namespace backtest {

struct SweepCase {
    std::string label;
    BacktestConfig config;
};

struct SweepOutcome {
    std::string label;
    bool ok = false;
    std::string error;
    BacktestEngine::Result result;
};

// Runs independent configurations over the same bars, one run per thread.
// Every run stays bar-sequential and owns its engine, ledger and state; runs
// do not journal. Fill log rows carry the case label as their run id.
class ParameterSweep {
public:
    explicit ParameterSweep(unsigned max_threads = 0);

    // Outcomes come back in the order of `cases`.
    std::vector<SweepOutcome> run(const std::vector<MarketBar>& bars,
                                  const std::vector<SweepCase>& cases) const;

    unsigned maxThreads() const { return max_threads_; }

    // The case's config with run_id replaced by its label, if it has one
    static BacktestConfig caseConfig(const SweepCase& sweep_case);

private:
    static SweepOutcome runCase(const std::vector<MarketBar>& bars, const SweepCase& sweep_case);

    unsigned max_threads_;
};

} // namespace backtest
} // namespace semilev
