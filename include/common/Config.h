#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace semilev {

// JSON configuration file with the sections strategy, ema_crossover, ledger,
// backtest and logging. Absent keys keep their defaults.
class Config {
public:
    Config() = default;

    // Missing file: warning on stderr, defaults kept.
    // Malformed JSON or invalid values: ConfigError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    const backtest::BacktestConfig& getBacktestConfig() const { return backtest_config_; }
    void setBacktestConfig(const backtest::BacktestConfig& config) { backtest_config_ = config; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    bool isLoaded() const { return loaded_; }

private:
    backtest::BacktestConfig backtest_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    bool loaded_ = false;
};

} // namespace semilev
