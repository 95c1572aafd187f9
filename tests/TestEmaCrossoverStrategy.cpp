#include "strategy/EmaCrossoverStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace semilev;
using semilev::analytics::TechnicalIndicators;
using semilev::strategy::EmaCrossoverConfig;
using semilev::strategy::EmaCrossoverStrategy;
using semilev::strategy::StepResult;
using semilev::strategy::StrategyState;
using semilev::utils::TimeUtils;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

MarketBar dailyBar(int day, double close, double vix = 11.0) {
    MarketBar bar;
    bar.timestamp = TimeUtils::fromCivil(2024, 5, day, 16, 0);
    bar.day = TimeUtils::tradingDayOf(bar.timestamp);
    bar.quotes["SMH"] = Quote(close, close, close, close);
    bar.returns["SMH"] = 0.0;
    bar.vix = vix;
    return bar;
}

EmaCrossoverConfig shortSpans() {
    EmaCrossoverConfig config;
    config.fast_span = 2;
    config.slow_span = 4;
    config.warmup_bars = 4;
    return config;
}
}

int main() {
    // ===== Indicators =====
    {
        assert(near(TechnicalIndicators::emaAlpha(2), 2.0 / 3.0));
        assert(std::isnan(TechnicalIndicators::calculateEMA({}, 5)));

        const std::vector<double> prices{100.0, 101.0, 102.0, 103.0};
        const auto series = TechnicalIndicators::calculateEMAVector(prices, 2);
        assert(series.size() == prices.size());
        assert(series.front() == 100.0);
        assert(near(series.back(), TechnicalIndicators::calculateEMA(prices, 2)));
        assert(near(series[1], TechnicalIndicators::nextEMA(100.0, 101.0, 2)));

        assert(near(TechnicalIndicators::calculateMean(prices), 101.5));
        assert(near(TechnicalIndicators::calculateSampleStdDev({1.0, 2.0, 3.0, 4.0}), std::sqrt(5.0 / 3.0)));
        assert(TechnicalIndicators::calculateSampleStdDev({1.0}) == 0.0);
    }

    // ===== Warm-up then crossover =====
    {
        EmaCrossoverStrategy engine(shortSpans());
        StrategyState state;
        const double closes[] = {100.0, 101.0, 102.0};
        int day = 1;
        for (double close : closes) {
            const StepResult r = engine.step(state, dailyBar(day++, close));
            assert(r.state.mode() == Mode::NEUTRAL);
            assert(!r.target.isActive());
            state = r.state;
        }
        assert(!engine.isWarmedUp());

        StepResult r = engine.step(state, dailyBar(day++, 103.0));
        assert(engine.isWarmedUp());
        assert(engine.fastEma() > engine.slowEma());
        assert(r.state.mode() == Mode::LONG);
        assert(r.state.positionFraction() == 1.0);
        assert(r.target.asset_symbol == "SMH");
        assert(r.target.leverage == 3.75);
        assert(r.target.isActive());
        state = r.state;

        r = engine.step(state, dailyBar(day++, 103.5, 13.5));
        assert(r.target.leverage == 3.25);
        state = r.state;

        r = engine.step(state, dailyBar(day++, 95.0));
        assert(engine.fastEma() < engine.slowEma());
        assert(r.state.mode() == Mode::NEUTRAL);
        assert(r.state.positionFraction() == 0.0);
        assert(!r.target.isActive());
        assert(engine.barsSeen() == 6);
    }

    // ===== Bad data and reset =====
    {
        EmaCrossoverStrategy engine(shortSpans());
        StepResult r = engine.step(StrategyState(), dailyBar(1, 100.0));
        assert(engine.barsSeen() == 1);

        r = engine.step(r.state, dailyBar(2, 0.0));
        assert(r.skipped);
        assert(r.target.hold);
        assert(engine.barsSeen() == 1);

        r = engine.step(r.state, dailyBar(3, 101.0, kNaN));
        assert(r.skipped);
        assert(engine.barsSeen() == 1);

        engine.reset();
        assert(engine.barsSeen() == 0);
        assert(std::isnan(engine.fastEma()));
    }

    // ===== Kill switch keeps the averages moving =====
    {
        EmaCrossoverStrategy engine(shortSpans());
        StrategyState state;
        StepResult r = engine.step(state, dailyBar(1, 100.0));

        // Two bars on the same day so the kill switch can act
        MarketBar late = dailyBar(1, 101.0);
        late.timestamp += 60;
        state = r.state;
        state.setDailyPnl(-0.03);
        r = engine.step(state, late);
        assert(r.kill_switch_tripped);
        assert(!r.target.trading_enabled);
        assert(!r.target.isActive());
        assert(engine.barsSeen() == 2);
    }

    // ===== Config validation =====
    {
        bool threw = false;
        EmaCrossoverConfig bad = shortSpans();
        bad.fast_span = 4;
        try {
            EmaCrossoverStrategy engine(bad);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] EmaCrossoverStrategy PASSED\n";
    return 0;
}
