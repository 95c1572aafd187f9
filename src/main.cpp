#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"
#include "backtest/ParameterSweep.h"
#include "core/state/EventJournalJsonl.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace semilev;

namespace {
void printUsage() {
    std::cout << "Usage: semilev_backtest --data <csv> [options]\n"
              << "  --config <json>          configuration file (default: config/config.json)\n"
              << "  --journal <jsonl>        append decisions and fills to an event journal\n"
              << "  --log-dir <dir>          log directory (overrides logging.dir)\n"
              << "  --family <name>          progressive_entry | ema_crossover\n"
              << "  --sweep-stop-pct <list>  comma-separated stop percentages to compare\n"
              << "  --json                   print the summary as JSON\n";
}

std::vector<double> parseList(const std::string& csv) {
    std::vector<double> values;
    std::stringstream ss(csv);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (!token.empty()) {
            values.push_back(std::stod(token));
        }
    }
    return values;
}

int runSweep(const backtest::BacktestConfig& base, const std::vector<MarketBar>& bars,
             const std::vector<double>& stops, bool json_mode) {
    std::vector<backtest::SweepCase> cases;
    for (double stop : stops) {
        backtest::SweepCase sweep_case;
        std::ostringstream label;
        label << "stop_pct=" << stop;
        sweep_case.label = label.str();
        sweep_case.config = base;
        sweep_case.config.ledger.stop_pct = stop;
        cases.push_back(sweep_case);
    }

    backtest::ParameterSweep sweep;
    const auto outcomes = sweep.run(bars, cases);

    if (json_mode) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& o : outcomes) {
            j.push_back({
                {"label", o.label},
                {"ok", o.ok},
                {"error", o.error},
                {"final_equity", o.result.final_equity},
                {"total_return", o.result.summary.total_return},
                {"max_drawdown_pct", o.result.summary.max_drawdown_pct},
                {"sharpe", o.result.summary.sharpe},
                {"stops", o.result.summary.stops}
            });
        }
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << "\nParameter sweep\n";
        std::cout << "----------------------------------------------------------\n";
        for (const auto& o : outcomes) {
            if (!o.ok) {
                std::cout << "  " << o.label << " | FAILED: " << o.error << "\n";
                continue;
            }
            std::cout << "  " << std::left << std::setw(16) << o.label << std::right
                      << std::fixed << std::setprecision(2)
                      << " | equity=" << o.result.final_equity
                      << " | return=" << o.result.summary.total_return * 100.0 << "%"
                      << " | mdd=" << o.result.summary.max_drawdown_pct * 100.0 << "%"
                      << " | sharpe=" << o.result.summary.sharpe
                      << " | stops=" << o.result.summary.stops << "\n";
        }
        std::cout << "----------------------------------------------------------\n";
    }

    for (const auto& o : outcomes) {
        if (!o.ok) return 1;
    }
    return 0;
}
}

int main(int argc, char* argv[]) {
    std::string data_path;
    std::string config_path = "config/config.json";
    std::string journal_path;
    std::string log_dir;
    std::string family;
    std::string sweep_stops;
    bool json_mode = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if (arg == "--json") {
            json_mode = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            printUsage();
            return 2;
        }
        if (arg == "--data") data_path = argv[++i];
        else if (arg == "--config") config_path = argv[++i];
        else if (arg == "--journal") journal_path = argv[++i];
        else if (arg == "--log-dir") log_dir = argv[++i];
        else if (arg == "--family") family = argv[++i];
        else if (arg == "--sweep-stop-pct") sweep_stops = argv[++i];
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage();
            return 2;
        }
    }

    if (data_path.empty()) {
        printUsage();
        return 2;
    }

    try {
        Config config;
        config.load(config_path);

        backtest::BacktestConfig bt_config = config.getBacktestConfig();
        if (!family.empty()) {
            const auto selected = backtest::parseStrategyFamily(family);
            if (selected != bt_config.family) {
                const auto defaults = backtest::BacktestConfig::forFamily(selected);
                bt_config.family = selected;
                bt_config.ledger.flatten_at_day_end = defaults.ledger.flatten_at_day_end;
            }
        }
        if (!journal_path.empty()) {
            bt_config.journal_path = journal_path;
        }

        Logger::getInstance().initialize(log_dir.empty() ? config.getLogDir() : log_dir,
                                         config.getLogLevel());
        LOG_INFO("Starting backtest with data file: {}", data_path);

        std::shared_ptr<core::IEventJournal> journal;
        if (!bt_config.journal_path.empty()) {
            journal = std::make_shared<core::EventJournalJsonl>(bt_config.journal_path);
            LOG_INFO("Event journal: {} (last seq {})", bt_config.journal_path, journal->lastSeq());
        }

        backtest::BacktestEngine bt_engine;
        bt_engine.init(bt_config, journal);
        bt_engine.loadData(data_path);

        if (!sweep_stops.empty()) {
            return runSweep(bt_config, bt_engine.getBars(), parseList(sweep_stops), json_mode);
        }

        bt_engine.run();
        const auto result = bt_engine.getResult();

        if (json_mode) {
            nlohmann::json j = bt_engine.getReport().toJson();
            j["strategy"] = result.strategy_name;
            j["bars_processed"] = result.bars_processed;
            j["bars_skipped"] = result.bars_skipped;
            j["bars_invalid_price"] = result.bars_invalid_price;
            j["kill_switch_days"] = result.kill_switch_days;
            j["max_drawdown_intraday_pct"] = result.max_drawdown_intraday_pct;
            std::cout << j.dump(2) << "\n";
            return 0;
        }

        std::cout << "\nStrategy: " << result.strategy_name
                  << " | bars=" << result.bars_processed
                  << " | skipped=" << result.bars_skipped
                  << " | invalid-price=" << result.bars_invalid_price
                  << " | kill-switch days=" << result.kill_switch_days << "\n";
        std::cout << bt_engine.getReport().format();
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Backtest failed: {}", e.what());
        std::cerr << "Backtest failed: " << e.what() << "\n";
        return 1;
    }
}
