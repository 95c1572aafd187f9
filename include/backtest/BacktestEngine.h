#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "core/contracts/IEventJournal.h"
#include "ledger/EquityLedger.h"
#include "ledger/PerformanceReport.h"
#include "strategy/IStrategy.h"

namespace semilev {
namespace backtest {

// Single-threaded bar-sequential driver: engine.step -> ledger.apply -> daily pnl feedback.
class BacktestEngine {
public:
    BacktestEngine();

    // Builds the engine for config.family. Throws ConfigError.
    void init(const BacktestConfig& config, std::shared_ptr<core::IEventJournal> journal = nullptr);

    // Throws std::runtime_error when the file yields no bars.
    void loadData(const std::string& file_path);
    void setBars(std::vector<MarketBar> bars) { bars_ = std::move(bars); }
    const std::vector<MarketBar>& getBars() const { return bars_; }

    // Rerunnable: each call starts from fresh engine, ledger and state.
    void run();

    struct Result {
        std::string strategy_name;
        int bars_processed = 0;
        int bars_skipped = 0;           // engine no-op (NaN data)
        int bars_invalid_price = 0;     // ledger no-op
        int kill_switch_days = 0;
        int fills = 0;
        double final_equity = 0.0;
        double max_drawdown_intraday_pct = 0.0;
        std::vector<ledger::DailyEquity> daily_equity;
        std::vector<ledger::TradeRecord> trades;
        std::map<std::string, int> exit_reason_counts;
        ledger::PerformanceSummary summary;
    };
    Result getResult() const { return result_; }
    const ledger::PerformanceReport& getReport() const { return report_; }

    static std::unique_ptr<strategy::IStrategy> createStrategy(const BacktestConfig& config);

private:
    void handleFills(const std::vector<ledger::Fill>& fills, const ledger::EquityLedger& ledger);
    void journal(core::JournalEventType type, Timestamp ts, const std::string& symbol,
                 nlohmann::json payload);

    BacktestConfig config_;
    std::unique_ptr<strategy::IStrategy> strategy_;
    std::shared_ptr<core::IEventJournal> journal_;
    bool journal_failed_ = false;

    std::vector<MarketBar> bars_;
    Result result_;
    ledger::PerformanceReport report_;
};

} // namespace backtest
} // namespace semilev
