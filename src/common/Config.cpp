#include "common/Config.h"
#include "common/Errors.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace semilev {

namespace {
strategy::LeverageTable readLeverageTable(const nlohmann::json& node, const std::string& name) {
    if (!node.is_object()) {
        throw ConfigError(name + " must be an object with 'bands' and 'otherwise'");
    }
    std::vector<strategy::LeverageBand> bands;
    if (node.contains("bands")) {
        for (const auto& entry : node.at("bands")) {
            strategy::LeverageBand band;
            if (entry.is_array() && entry.size() == 2) {
                band.vix_below = entry.at(0).get<double>();
                band.leverage = entry.at(1).get<double>();
            } else if (entry.is_object()) {
                band.vix_below = entry.at("vix_below").get<double>();
                band.leverage = entry.at("leverage").get<double>();
            } else {
                throw ConfigError(name + ": each band is [vix_below, leverage]");
            }
            bands.push_back(band);
        }
    }
    if (!node.contains("otherwise")) {
        throw ConfigError(name + ": missing 'otherwise'");
    }
    strategy::LeverageTable table(bands, node.at("otherwise").get<double>());
    table.validate(name);
    return table;
}

void readTriple(const nlohmann::json& node, std::array<double, 3>& out, const std::string& name) {
    if (!node.is_array() || node.size() != out.size()) {
        throw ConfigError(name + " must be an array of 3 numbers");
    }
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = node.at(i).get<double>();
    }
}

void readAntiChurn(const nlohmann::json& node, strategy::AntiChurnBand& band) {
    band.enabled = node.value("enabled", band.enabled);
    band.lower = node.value("lower", band.lower);
    band.upper = node.value("upper", band.upper);
    band.min_persistence = node.value("min_persistence", band.min_persistence);
    band.floor_fraction = node.value("floor_fraction", band.floor_fraction);
}

void readStrategy(const nlohmann::json& s, strategy::StrategyConfig& cfg) {
    if (s.contains("pair")) {
        const auto& pair = s.at("pair");
        if (!pair.is_array() || pair.size() != 2) {
            throw ConfigError("strategy.pair must list exactly two symbols");
        }
        cfg.pair_first = pair.at(0).get<std::string>();
        cfg.pair_second = pair.at(1).get<std::string>();
    }
    cfg.index_symbol = s.value("index_symbol", cfg.index_symbol);

    if (s.contains("entry_thresholds")) {
        readTriple(s.at("entry_thresholds"), cfg.entry_thresholds, "strategy.entry_thresholds");
    }
    if (s.contains("entry_fractions")) {
        readTriple(s.at("entry_fractions"), cfg.entry_fractions, "strategy.entry_fractions");
    }

    cfg.invalid_zero = s.value("invalid_zero", cfg.invalid_zero);
    cfg.invalidation_factor = s.value("invalidation_factor", cfg.invalidation_factor);
    cfg.hard_exit = s.value("hard_exit", cfg.hard_exit);
    cfg.daily_kill = s.value("daily_kill", cfg.daily_kill);

    if (s.contains("long_leverage")) {
        cfg.long_leverage = readLeverageTable(s.at("long_leverage"), "strategy.long_leverage");
    }
    if (s.contains("short_leverage")) {
        cfg.short_leverage = readLeverageTable(s.at("short_leverage"), "strategy.short_leverage");
    }
    if (s.contains("long_anti_churn")) {
        readAntiChurn(s.at("long_anti_churn"), cfg.long_anti_churn);
    }
    if (s.contains("short_anti_churn")) {
        readAntiChurn(s.at("short_anti_churn"), cfg.short_anti_churn);
    }
}

void readEmaCrossover(const nlohmann::json& s, strategy::EmaCrossoverConfig& cfg) {
    cfg.trend_symbol = s.value("trend_symbol", cfg.trend_symbol);
    cfg.fast_span = s.value("fast_span", cfg.fast_span);
    cfg.slow_span = s.value("slow_span", cfg.slow_span);
    cfg.warmup_bars = s.value("warmup_bars", cfg.slow_span);
    cfg.daily_kill = s.value("daily_kill", cfg.daily_kill);
    if (s.contains("leverage")) {
        cfg.leverage = readLeverageTable(s.at("leverage"), "ema_crossover.leverage");
    }
}

void readLedger(const nlohmann::json& l, ledger::LedgerConfig& cfg) {
    cfg.initial_capital = l.value("initial_capital", cfg.initial_capital);
    cfg.stop_pct = l.value("stop_pct", cfg.stop_pct);
    cfg.stop_buffer = l.value("stop_buffer", cfg.stop_buffer);
    if (l.contains("stop_price_source")) {
        cfg.stop_price_source = ledger::parseStopPriceSource(l.at("stop_price_source").get<std::string>());
    }
    if (l.contains("entry_price_source")) {
        cfg.entry_price_source = ledger::parsePriceSource(l.at("entry_price_source").get<std::string>());
    }
    if (l.contains("resize_policy")) {
        cfg.resize_policy = ledger::parseResizePolicy(l.at("resize_policy").get<std::string>());
    }
    cfg.resize_leverage_tolerance = l.value("resize_leverage_tolerance", cfg.resize_leverage_tolerance);
    cfg.resize_notional_threshold = l.value("resize_notional_threshold", cfg.resize_notional_threshold);
    cfg.flatten_at_day_end = l.value("flatten_at_day_end", cfg.flatten_at_day_end);
    cfg.allow_reentry_after_stop = l.value("allow_reentry_after_stop", cfg.allow_reentry_after_stop);
}

void readBacktest(const nlohmann::json& b, backtest::BacktestConfig& cfg) {
    cfg.data.persistence_symbol = b.value("persistence_symbol", cfg.data.persistence_symbol);
    cfg.data.bar_minutes = b.value("bar_minutes", cfg.data.bar_minutes);
    cfg.data.start_date = b.value("start_date", cfg.data.start_date);
    cfg.data.end_date = b.value("end_date", cfg.data.end_date);
    cfg.journal_path = b.value("journal_path", cfg.journal_path);
    cfg.run_id = b.value("run_id", cfg.run_id);
}
}

void Config::load(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Warning: config file not found: " << config_path
                  << ", using defaults" << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("malformed config file " + config_path + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "Config loaded: " << config_path
              << " (family=" << backtest::toString(backtest_config_.family) << ")" << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    try {
        backtest::StrategyFamily family = backtest::StrategyFamily::PROGRESSIVE_ENTRY;
        if (j.contains("backtest") && j["backtest"].contains("family")) {
            family = backtest::parseStrategyFamily(j["backtest"]["family"].get<std::string>());
        }

        backtest::BacktestConfig cfg = backtest::BacktestConfig::forFamily(family);

        if (j.contains("strategy")) {
            readStrategy(j["strategy"], cfg.strategy);
        }
        if (j.contains("ema_crossover")) {
            readEmaCrossover(j["ema_crossover"], cfg.ema_crossover);
        }
        if (j.contains("ledger")) {
            readLedger(j["ledger"], cfg.ledger);
        }
        if (j.contains("backtest")) {
            readBacktest(j["backtest"], cfg);
        }

        std::string log_level = log_level_;
        std::string log_dir = log_dir_;
        if (j.contains("logging")) {
            log_level = j["logging"].value("level", log_level);
            log_dir = j["logging"].value("dir", log_dir);
        }

        cfg.validate();

        backtest_config_ = cfg;
        log_level_ = log_level;
        log_dir_ = log_dir;
        loaded_ = true;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
}

} // namespace semilev
