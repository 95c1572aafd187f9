#include "backtest/BacktestEngine.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "strategy/EmaCrossoverStrategy.h"
#include "strategy/ProgressiveEntryStrategy.h"

#include <stdexcept>

namespace semilev {
namespace backtest {

BacktestEngine::BacktestEngine() = default;

void BacktestEngine::init(const BacktestConfig& config, std::shared_ptr<core::IEventJournal> journal) {
    config.validate();
    config_ = config;
    strategy_ = createStrategy(config_);
    journal_ = std::move(journal);
    journal_failed_ = false;
    LOG_INFO("Backtest initialized: strategy={}, capital={:.2f}, stop={:.2f}%+{:.2f}%, resize={}",
             strategy_->getName(), config_.ledger.initial_capital,
             config_.ledger.stop_pct * 100.0, config_.ledger.stop_buffer * 100.0,
             ledger::toString(config_.ledger.resize_policy));
}

std::unique_ptr<strategy::IStrategy> BacktestEngine::createStrategy(const BacktestConfig& config) {
    switch (config.family) {
        case StrategyFamily::PROGRESSIVE_ENTRY:
            return std::make_unique<strategy::ProgressiveEntryStrategy>(config.strategy);
        case StrategyFamily::EMA_CROSSOVER:
            return std::make_unique<strategy::EmaCrossoverStrategy>(config.ema_crossover);
    }
    return std::make_unique<strategy::ProgressiveEntryStrategy>(config.strategy);
}

void BacktestEngine::loadData(const std::string& file_path) {
    bars_ = DataHistory::loadCSV(file_path, config_.data);
    if (bars_.empty()) {
        throw std::runtime_error("no bars loaded from " + file_path);
    }
}

void BacktestEngine::run() {
    if (!strategy_) {
        throw std::logic_error("BacktestEngine::run() called before init()");
    }

    result_ = Result();
    result_.strategy_name = strategy_->getName();
    strategy_->reset();

    ledger::EquityLedger ledger(config_.ledger);
    strategy::StrategyState state;

    if (bars_.empty()) {
        LOG_WARN("Backtest has no bars to process");
    }

    for (size_t i = 0; i < bars_.size(); ++i) {
        const MarketBar& bar = bars_[i];

        const strategy::StepResult step = strategy_->step(state, bar);
        if (step.skipped) {
            result_.bars_skipped++;
        }
        if (step.kill_switch_tripped) {
            result_.kill_switch_days++;
            journal(core::JournalEventType::KILL_SWITCH_TRIPPED, bar.timestamp, "",
                    {{"day", bar.day}, {"daily_pnl", step.state.dailyPnl()},
                     {"threshold", config_.family == StrategyFamily::EMA_CROSSOVER
                                       ? config_.ema_crossover.daily_kill
                                       : config_.strategy.daily_kill}});
        }

        const ledger::ApplyResult applied = ledger.apply(step.target, bar);
        if (applied.status == ledger::ApplyStatus::SKIPPED_INVALID_PRICE) {
            result_.bars_invalid_price++;
        }
        if (applied.stop_triggered) {
            journal(core::JournalEventType::STOP_TRIGGERED, bar.timestamp,
                    applied.fills.empty() ? "" : applied.fills.front().symbol,
                    {{"day_start_equity", ledger.getDayStartEquity()},
                     {"stop_pct", config_.ledger.stop_pct},
                     {"stop_buffer", config_.ledger.stop_buffer}});
        }
        handleFills(applied.fills, ledger);

        state = step.state;
        state.setDailyPnl(ledger.dailyRealizedReturn());
        result_.bars_processed++;

        const bool last_of_day = (i + 1 == bars_.size()) || (bars_[i + 1].day != bar.day);
        if (!last_of_day) {
            continue;
        }

        if (config_.ledger.flatten_at_day_end && ledger.hasPosition()) {
            handleFills(ledger.closePosition(bar, ledger::FillReason::END_OF_DAY).fills, ledger);
        }
        if (i + 1 == bars_.size() && ledger.hasPosition()) {
            handleFills(ledger.closePosition(bar, ledger::FillReason::END_OF_RUN).fills, ledger);
        }

        result_.daily_equity.push_back({bar.day, ledger.getMarkedEquity()});
        journal(core::JournalEventType::DAY_CLOSED, bar.timestamp, "",
                {{"day", bar.day},
                 {"equity", ledger.getMarkedEquity()},
                 {"cash", ledger.getCashEquity()},
                 {"day_start_equity", ledger.getDayStartEquity()},
                 {"realized_return", ledger.dailyRealizedReturn()},
                 {"stops", ledger.stopsToday()},
                 {"trading_enabled", state.tradingEnabled()}});
        LOG_DEBUG("Day {} closed: equity {:.2f} ({:+.2f}%)", bar.day, ledger.getMarkedEquity(),
                  ledger.dailyMarkedReturn() * 100.0);
    }

    result_.final_equity = ledger.getMarkedEquity();
    result_.max_drawdown_intraday_pct = ledger.getMaxDrawdownPct();
    result_.trades = ledger.getTradeHistory();
    for (const auto& trade : result_.trades) {
        result_.exit_reason_counts[ledger::toString(trade.exit_reason)]++;
    }

    report_.rebuild(config_.ledger.initial_capital, result_.daily_equity, result_.trades);
    result_.summary = report_.summary();

    LOG_INFO("Backtest finished: {} bars, {} skipped, final equity {:.2f} ({:+.2f}%)",
             result_.bars_processed, result_.bars_skipped, result_.final_equity,
             result_.summary.total_return * 100.0);
}

void BacktestEngine::handleFills(const std::vector<ledger::Fill>& fills, const ledger::EquityLedger& ledger) {
    for (const auto& fill : fills) {
        result_.fills++;

        core::JournalEventType type = core::JournalEventType::POSITION_OPENED;
        if (fill.type == ledger::FillType::CLOSE) {
            type = core::JournalEventType::POSITION_CLOSED;
        } else if (fill.type == ledger::FillType::RESIZE) {
            type = core::JournalEventType::POSITION_RESIZED;
        }

        journal(type, fill.timestamp, fill.symbol,
                {{"reason", ledger::toString(fill.reason)},
                 {"mode", toString(fill.mode)},
                 {"price", fill.price},
                 {"shares", fill.shares},
                 {"notional", fill.notional},
                 {"leverage", fill.leverage},
                 {"realized_pnl", fill.realized_pnl},
                 {"cash_after", fill.cash_after},
                 {"day", ledger.currentDay()}});

        Logger::FillRow row;
        row.run_id = config_.run_id;
        row.timestamp = utils::TimeUtils::formatTimestamp(fill.timestamp);
        row.symbol = fill.symbol;
        row.type = ledger::toString(fill.type);
        row.mode = toString(fill.mode);
        row.reason = ledger::toString(fill.reason);
        row.price = fill.price;
        row.shares = fill.shares;
        row.leverage = fill.leverage;
        row.realized_pnl = fill.realized_pnl;
        row.cash_after = fill.cash_after;
        Logger::getInstance().logFill(row);
    }
}

void BacktestEngine::journal(core::JournalEventType type, Timestamp ts, const std::string& symbol,
                             nlohmann::json payload) {
    if (!journal_) {
        return;
    }

    core::JournalEvent event;
    event.ts = ts;
    event.type = type;
    event.symbol = symbol;
    event.run_id = config_.run_id;
    event.payload = std::move(payload);
    if (!journal_->append(event) && !journal_failed_) {
        journal_failed_ = true;
        LOG_ERROR("Event journal append failed; further failures are not reported");
    }
}

} // namespace backtest
} // namespace semilev
