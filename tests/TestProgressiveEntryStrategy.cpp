#include "strategy/ProgressiveEntryStrategy.h"
#include "common/Errors.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace semilev;
using semilev::strategy::ProgressiveEntryStrategy;
using semilev::strategy::StepResult;
using semilev::strategy::StrategyConfig;
using semilev::strategy::StrategyState;
using semilev::utils::TimeUtils;

namespace {
bool near(double a, double b, double eps = 1e-12) {
    return std::fabs(a - b) < eps;
}

MarketBar makeBar(int day, int minute, double smh, double soxx, double qqq, double vix,
                  int long_persist = 0, int short_persist = 0) {
    MarketBar bar;
    bar.timestamp = TimeUtils::fromCivil(2024, 3, day, 9, 30) + minute * 60;
    bar.day = TimeUtils::tradingDayOf(bar.timestamp);
    bar.returns["SMH"] = smh;
    bar.returns["SOXX"] = soxx;
    bar.returns["QQQ"] = qqq;
    bar.vix = vix;
    bar.persistence.long_bars = long_persist;
    bar.persistence.short_bars = short_persist;
    return bar;
}
}

int main() {
    const StrategyConfig config;

    // ===== Entry floor and leverage =====
    {
        ProgressiveEntryStrategy engine(config);
        const StepResult r = engine.step(StrategyState(), makeBar(4, 5, 0.0015, 0.0010, 0.001, 11.0));
        assert(r.day_reset);
        assert(!r.skipped);
        assert(r.state.mode() == Mode::LONG);
        assert(near(r.state.positionFraction(), 0.5));
        assert(r.target.asset_symbol == "SMH");
        assert(near(r.asset_return, 0.0015));
        assert(near(r.target.leverage, 2.0));
        assert(r.target.isActive());
    }

    // ===== Soft invalidation and hard exit stages =====
    {
        double fraction = ProgressiveEntryStrategy::applyProgressiveEntry(Mode::LONG, -0.0001, 0.7, config);
        fraction = ProgressiveEntryStrategy::applyAntiChurn(Mode::LONG, 0.0, Persistence(), fraction, config);
        fraction = ProgressiveEntryStrategy::applyInvalidation(Mode::LONG, -0.0001, fraction, config);
        fraction = ProgressiveEntryStrategy::applyHardExit(Mode::LONG, -0.0001, fraction, config);
        assert(near(fraction, 0.35));

        assert(ProgressiveEntryStrategy::applyHardExit(Mode::LONG, -0.003, 1.0, config) == 0.0);
        assert(ProgressiveEntryStrategy::applyHardExit(Mode::LONG, -0.003, 0.35, config) == 0.0);
        assert(near(ProgressiveEntryStrategy::applyHardExit(Mode::LONG, -0.0019, 0.7, config), 0.7));

        // Mirror on the short side
        assert(near(ProgressiveEntryStrategy::applyInvalidation(Mode::SHORT, 0.0001, 0.7, config), 0.35));
        assert(ProgressiveEntryStrategy::applyHardExit(Mode::SHORT, 0.0025, 1.0, config) == 0.0);
    }

    // ===== Kill switch =====
    {
        ProgressiveEntryStrategy engine(config);
        StepResult r = engine.step(StrategyState(), makeBar(4, 5, 0.0025, 0.0021, 0.001, 11.0));
        assert(near(r.state.positionFraction(), 0.7));

        StrategyState state = r.state;
        state.setDailyPnl(-0.025);
        r = engine.step(state, makeBar(4, 10, 0.0015, 0.0010, 0.001, 11.0));
        assert(r.kill_switch_tripped);
        assert(!r.state.tradingEnabled());
        assert(r.state.positionFraction() == 0.0);
        assert(!r.target.trading_enabled);
        assert(!r.target.hold);
        assert(!r.target.isActive());

        // Strong signal later the same day stays flat
        r = engine.step(r.state, makeBar(4, 15, 0.0050, 0.0045, 0.005, 11.0, 60, 0));
        assert(!r.kill_switch_tripped);
        assert(!r.state.tradingEnabled());
        assert(r.state.positionFraction() == 0.0);
        assert(r.target.leverage == 0.0);

        // Next day re-arms
        r = engine.step(r.state, makeBar(5, 5, 0.0015, 0.0010, 0.001, 11.0));
        assert(r.day_reset);
        assert(r.state.tradingEnabled());
        assert(r.state.dailyPnl() == 0.0);
        assert(near(r.state.positionFraction(), 0.5));
    }

    // Just above the threshold does not trip
    {
        ProgressiveEntryStrategy engine(config);
        StepResult r = engine.step(StrategyState(), makeBar(4, 5, 0.0015, 0.0010, 0.001, 11.0));
        StrategyState state = r.state;
        state.setDailyPnl(-0.0249);
        r = engine.step(state, makeBar(4, 10, 0.0015, 0.0010, 0.001, 11.0));
        assert(!r.kill_switch_tripped);
        assert(r.state.tradingEnabled());
    }

    // ===== Ratchet within a day =====
    {
        ProgressiveEntryStrategy engine(config);
        StepResult r = engine.step(StrategyState(), makeBar(4, 5, 0.0025, 0.0021, 0.001, 13.0));
        assert(near(r.state.positionFraction(), 0.7));
        r = engine.step(r.state, makeBar(4, 10, 0.0013, 0.0011, 0.001, 13.0));
        assert(near(r.state.positionFraction(), 0.7));
        assert(near(r.target.leverage, 2.1));
        r = engine.step(r.state, makeBar(4, 15, 0.0031, 0.0020, 0.001, 13.0));
        assert(near(r.state.positionFraction(), 1.0));
        assert(near(r.target.leverage, 3.0));
    }

    // ===== Tie-break: first leg wins =====
    {
        const auto long_tie = ProgressiveEntryStrategy::selectAsset(Mode::LONG, "SMH", 0.0015, "SOXX", 0.0015);
        assert(long_tie.symbol == "SMH");
        const auto short_tie = ProgressiveEntryStrategy::selectAsset(Mode::SHORT, "SMH", -0.002, "SOXX", -0.002);
        assert(short_tie.symbol == "SMH");
        const auto long_pick = ProgressiveEntryStrategy::selectAsset(Mode::LONG, "SMH", 0.001, "SOXX", 0.002);
        assert(long_pick.symbol == "SOXX");
        const auto neutral = ProgressiveEntryStrategy::selectAsset(Mode::NEUTRAL, "SMH", 0.001, "SOXX", -0.002);
        assert(neutral.symbol.empty());
    }

    // ===== Mode detection =====
    {
        assert(ProgressiveEntryStrategy::detectMode(0.001, 0.002) == Mode::LONG);
        assert(ProgressiveEntryStrategy::detectMode(-0.001, -0.002) == Mode::SHORT);
        assert(ProgressiveEntryStrategy::detectMode(0.001, -0.002) == Mode::NEUTRAL);
        assert(ProgressiveEntryStrategy::detectMode(0.0, 0.002) == Mode::NEUTRAL);
    }

    // ===== Short side =====
    {
        ProgressiveEntryStrategy engine(config);
        const StepResult r = engine.step(StrategyState(), makeBar(4, 5, -0.0025, -0.0035, -0.001, 22.0));
        assert(r.state.mode() == Mode::SHORT);
        assert(r.target.asset_symbol == "SOXX");
        assert(near(r.state.positionFraction(), 1.0));
        assert(near(r.target.leverage, 4.0));
    }

    // ===== Anti-churn =====
    {
        ProgressiveEntryStrategy engine(config);
        StepResult r = engine.step(StrategyState(), makeBar(4, 5, 0.0005, 0.0004, 0.005, 11.0, 30, 0));
        assert(near(r.state.positionFraction(), 0.5));

        r = engine.step(StrategyState(), makeBar(4, 5, 0.0005, 0.0004, 0.005, 11.0, 29, 0));
        assert(r.state.positionFraction() == 0.0);

        r = engine.step(StrategyState(), makeBar(4, 5, 0.0005, 0.0004, 0.008, 11.0, 60, 0));
        assert(r.state.positionFraction() == 0.0);

        r = engine.step(StrategyState(), makeBar(4, 5, -0.0005, -0.0004, -0.005, 22.0, 0, 30));
        assert(r.state.mode() == Mode::SHORT);
        assert(near(r.state.positionFraction(), 0.5));
    }

    {
        StrategyConfig no_short = config;
        no_short.short_anti_churn.enabled = false;
        ProgressiveEntryStrategy engine(no_short);

        StepResult r = engine.step(StrategyState(), makeBar(4, 5, -0.0005, -0.0004, -0.005, 22.0, 0, 30));
        assert(r.state.mode() == Mode::SHORT);
        assert(r.state.positionFraction() == 0.0);
        assert(!r.target.isActive());

        r = engine.step(StrategyState(), makeBar(4, 5, 0.0005, 0.0004, 0.005, 11.0, 30, 0));
        assert(near(r.state.positionFraction(), 0.5));
    }

    // ===== Index return is optional while anti-churn is off =====
    {
        StrategyConfig no_bands = config;
        no_bands.long_anti_churn.enabled = false;
        no_bands.short_anti_churn.enabled = false;
        ProgressiveEntryStrategy engine(no_bands);

        MarketBar bar = makeBar(4, 5, 0.0015, 0.0010, 0.0, 11.0);
        bar.returns.erase("QQQ");
        const StepResult r = engine.step(StrategyState(), bar);
        assert(!r.skipped);
        assert(r.state.mode() == Mode::LONG);
        assert(near(r.target.position_fraction, 0.5));
        assert(near(r.target.leverage, 2.0));

        // With the long band on, the same bar cannot be evaluated
        ProgressiveEntryStrategy guarded(config);
        const StepResult held = guarded.step(StrategyState(), bar);
        assert(held.skipped);
        assert(held.state.positionFraction() == 0.0);
    }

    // ===== Mode flip keeps the fraction =====
    {
        ProgressiveEntryStrategy engine(config);
        StepResult r = engine.step(StrategyState(), makeBar(4, 5, 0.0025, 0.0021, 0.001, 11.0));
        assert(near(r.state.positionFraction(), 0.7));
        r = engine.step(r.state, makeBar(4, 10, -0.0005, -0.0001, -0.001, 11.0));
        assert(r.state.mode() == Mode::SHORT);
        assert(r.target.asset_symbol == "SMH");
        assert(near(r.state.positionFraction(), 0.7));
        assert(near(r.target.leverage, 1.4));

        // NEUTRAL drops it
        r = engine.step(r.state, makeBar(4, 15, 0.001, -0.001, 0.0, 11.0));
        assert(r.state.mode() == Mode::NEUTRAL);
        assert(r.state.positionFraction() == 0.0);
        assert(r.target.asset_symbol.empty());
        assert(!r.target.isActive());
    }

    // ===== NaN input holds =====
    {
        ProgressiveEntryStrategy engine(config);
        StepResult r = engine.step(StrategyState(), makeBar(4, 5, 0.0025, 0.0021, 0.001, 11.0));
        const StrategyState before = r.state;
        MarketBar bad = makeBar(4, 10, kNaN, 0.0021, 0.001, 11.0);
        r = engine.step(before, bad);
        assert(r.skipped);
        assert(r.target.hold);
        assert(!r.target.isActive());
        assert(r.state.positionFraction() == before.positionFraction());
        assert(r.state.mode() == before.mode());
        assert(r.state.lastTimestamp() == bad.timestamp);

        r = engine.step(r.state, makeBar(4, 15, 0.0025, 0.0021, 0.001, kNaN));
        assert(r.skipped);
    }

    // ===== Ordering and purity =====
    {
        ProgressiveEntryStrategy engine(config);
        const StepResult first = engine.step(StrategyState(), makeBar(4, 5, 0.0025, 0.0021, 0.001, 11.0));

        bool threw = false;
        try {
            engine.step(first.state, makeBar(4, 5, 0.0025, 0.0021, 0.001, 11.0));
        } catch (const OutOfOrderBarError&) {
            threw = true;
        }
        assert(threw);

        const MarketBar next = makeBar(4, 10, 0.0013, 0.0011, 0.004, 14.0, 40, 0);
        const StepResult a = engine.step(first.state, next);
        const StepResult b = engine.step(first.state, next);
        assert(a.state == b.state);
        assert(a.target.leverage == b.target.leverage);
        assert(a.target.asset_symbol == b.target.asset_symbol);
    }

    // ===== Leverage tables =====
    {
        const auto long_table = strategy::LeverageTable::canonicalLong();
        assert(long_table.lookup(11.99) == 4.0);
        assert(long_table.lookup(12.0) == 3.0);
        assert(long_table.lookup(14.99) == 3.0);
        assert(long_table.lookup(15.0) == 2.0);

        const auto short_table = strategy::LeverageTable::canonicalShort();
        assert(short_table.lookup(19.99) == 2.0);
        assert(short_table.lookup(20.0) == 4.0);
        assert(short_table.lookup(25.0) == 5.0);

        const auto production = strategy::LeverageTable::productionLong();
        assert(production.lookup(11.0) == 3.75);
        assert(production.lookup(12.0) == 3.5);
        assert(production.lookup(13.0) == 3.25);
        assert(production.lookup(14.0) == 3.0);
    }

    // ===== Config validation =====
    {
        bool threw = false;
        StrategyConfig bad = config;
        bad.entry_thresholds = {{0.002, 0.0012, 0.003}};
        try {
            ProgressiveEntryStrategy engine(bad);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        bad = config;
        bad.long_leverage = strategy::LeverageTable({{15.0, 3.0}, {12.0, 4.0}}, 2.0);
        try {
            bad.validate();
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        bad = config;
        bad.daily_kill = 0.01;
        try {
            bad.validate();
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    // ===== State invariants over random sequences =====
    {
        ProgressiveEntryStrategy engine(config);
        std::mt19937 rng(42);
        std::uniform_real_distribution<double> ret(-0.005, 0.005);
        std::uniform_real_distribution<double> vix(9.0, 30.0);
        std::uniform_real_distribution<double> pnl(-0.03, 0.01);
        std::uniform_int_distribution<int> persist(0, 90);
        std::uniform_int_distribution<int> coin(0, 49);

        StrategyState state;
        for (int day = 4; day <= 8; ++day) {
            for (int minute = 5; minute <= 390; minute += 5) {
                MarketBar bar = makeBar(day, minute, ret(rng), ret(rng), ret(rng), vix(rng),
                                        persist(rng), persist(rng));
                if (coin(rng) == 0) {
                    bar.returns["SOXX"] = kNaN;
                }
                const StepResult r = engine.step(state, bar);
                const double fraction = r.state.positionFraction();
                assert(fraction >= 0.0 && fraction <= 1.0);
                if (r.state.mode() == Mode::NEUTRAL || !r.state.tradingEnabled()) {
                    assert(fraction == 0.0);
                }
                if (!r.skipped && r.state.tradingEnabled()) {
                    const double base = ProgressiveEntryStrategy::baseLeverage(r.state.mode(), bar.vix, config);
                    assert(near(r.target.leverage, base * fraction));
                }
                assert(r.target.leverage <= 5.0);

                state = r.state;
                state.setDailyPnl(pnl(rng));
            }
        }
    }

    std::cout << "[TEST] ProgressiveEntryStrategy PASSED\n";
    return 0;
}
