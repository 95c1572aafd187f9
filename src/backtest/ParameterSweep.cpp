#include "backtest/ParameterSweep.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace semilev {
namespace backtest {

ParameterSweep::ParameterSweep(unsigned max_threads)
    : max_threads_(max_threads) {
    if (max_threads_ == 0) {
        max_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

BacktestConfig ParameterSweep::caseConfig(const SweepCase& sweep_case) {
    BacktestConfig config = sweep_case.config;
    if (!sweep_case.label.empty()) {
        config.run_id = sweep_case.label;
    }
    return config;
}

SweepOutcome ParameterSweep::runCase(const std::vector<MarketBar>& bars, const SweepCase& sweep_case) {
    SweepOutcome outcome;
    outcome.label = sweep_case.label;
    try {
        BacktestEngine engine;
        engine.init(caseConfig(sweep_case));
        engine.setBars(bars);
        engine.run();
        outcome.result = engine.getResult();
        outcome.ok = true;
    } catch (const std::exception& e) {
        outcome.error = e.what();
        LOG_ERROR("Sweep case '{}' failed: {}", sweep_case.label, e.what());
    }
    return outcome;
}

std::vector<SweepOutcome> ParameterSweep::run(const std::vector<MarketBar>& bars,
                                              const std::vector<SweepCase>& cases) const {
    std::vector<SweepOutcome> outcomes(cases.size());

    for (size_t batch_start = 0; batch_start < cases.size(); batch_start += max_threads_) {
        const size_t batch_end = std::min(cases.size(), batch_start + max_threads_);

        std::vector<std::thread> workers;
        workers.reserve(batch_end - batch_start);
        for (size_t i = batch_start; i < batch_end; ++i) {
            workers.emplace_back([&bars, &cases, &outcomes, i]() {
                outcomes[i] = runCase(bars, cases[i]);
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    LOG_INFO("Parameter sweep finished: {} cases on up to {} threads", cases.size(), max_threads_);
    return outcomes;
}

} // namespace backtest
} // namespace semilev
