#include "ledger/EquityLedger.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace semilev {
namespace ledger {

const char* toString(FillType type) {
    switch (type) {
        case FillType::OPEN: return "OPEN";
        case FillType::CLOSE: return "CLOSE";
        case FillType::RESIZE: return "RESIZE";
    }
    return "OPEN";
}

const char* toString(FillReason reason) {
    switch (reason) {
        case FillReason::ENTRY: return "ENTRY";
        case FillReason::RE_ENTRY: return "RE_ENTRY";
        case FillReason::MODE_FLIP: return "MODE_FLIP";
        case FillReason::ASSET_SWITCH: return "ASSET_SWITCH";
        case FillReason::FRACTION_ZERO: return "FRACTION_ZERO";
        case FillReason::KILL_SWITCH: return "KILL_SWITCH";
        case FillReason::EQUITY_STOP: return "EQUITY_STOP";
        case FillReason::RESIZE: return "RESIZE";
        case FillReason::END_OF_DAY: return "END_OF_DAY";
        case FillReason::END_OF_RUN: return "END_OF_RUN";
    }
    return "ENTRY";
}

EquityLedger::EquityLedger(LedgerConfig config)
    : config_(std::move(config))
    , cash_equity_(0.0)
    , marked_equity_(0.0)
    , day_start_equity_(0.0)
    , peak_equity_(0.0)
    , max_drawdown_(0.0)
    , max_drawdown_pct_(0.0)
    , current_day_(0)
    , last_timestamp_(0)
    , has_bar_(false)
    , stopped_today_(false)
    , stops_today_(0)
    , total_entries_(0)
    , total_resizes_(0)
    , total_stops_(0)
    , total_kill_exits_(0)
{
    config_.validate();
    cash_equity_ = config_.initial_capital;
    marked_equity_ = cash_equity_;
    day_start_equity_ = cash_equity_;
    peak_equity_ = cash_equity_;
}

double EquityLedger::dailyRealizedReturn() const {
    if (day_start_equity_ <= 0.0) return 0.0;
    return (cash_equity_ - day_start_equity_) / day_start_equity_;
}

double EquityLedger::dailyMarkedReturn() const {
    if (day_start_equity_ <= 0.0) return 0.0;
    return (marked_equity_ - day_start_equity_) / day_start_equity_;
}

// ===== Bar processing =====

ApplyResult EquityLedger::apply(const strategy::ExposureTarget& target, const MarketBar& bar) {
    checkOrder(bar.timestamp, false);

    ApplyResult result;
    // The day-start snapshot does not depend on this bar's quotes
    if (!has_bar_ || bar.day != current_day_) {
        rollDay(bar.day);
        result.day_reset = true;
    }

    last_timestamp_ = bar.timestamp;
    has_bar_ = true;

    const std::string problem = validateBar(target, bar, day_start_equity_);
    if (!problem.empty()) {
        result.status = ApplyStatus::SKIPPED_INVALID_PRICE;
        result.warning = problem;
        result.cash_equity = cash_equity_;
        result.marked_equity = marked_equity_;
        result.unrealized_pnl = marked_equity_ - cash_equity_;
        LOG_WARN("Ledger skipped bar {}: {}", utils::TimeUtils::formatTimestamp(bar.timestamp), problem);
        return result;
    }

    bool stopped_this_bar = false;
    if (position_) {
        stopped_this_bar = checkEquityStop(bar, result);
    }

    if (target.hold) {
        finalize(bar, result);
        return result;
    }

    // Exits
    if (position_) {
        const Position& pos = *position_;
        std::optional<FillReason> exit_reason;
        if (!target.trading_enabled) {
            exit_reason = FillReason::KILL_SWITCH;
        } else if (target.mode != pos.mode) {
            exit_reason = FillReason::MODE_FLIP;
        } else if (!target.isActive()) {
            exit_reason = FillReason::FRACTION_ZERO;
        } else if (target.asset_symbol != pos.symbol) {
            exit_reason = FillReason::ASSET_SWITCH;
        }

        const double price = executionPrice(*bar.getQuote(pos.symbol));
        if (exit_reason) {
            closeAt(price, pos.unrealizedPnl(price), bar.timestamp, *exit_reason, result);
        } else if (needsResize(target, price)) {
            resize(target, price, bar.timestamp, result);
        }
    }

    // Entry
    if (!position_ && target.isActive() && !stopped_this_bar) {
        if (stopped_today_ && !config_.allow_reentry_after_stop) {
            LOG_DEBUG("Re-entry blocked after equity stop on {}", current_day_);
        } else {
            const double price = executionPrice(*bar.getQuote(target.asset_symbol));
            openPosition(target, price, bar.timestamp,
                         stopped_today_ ? FillReason::RE_ENTRY : FillReason::ENTRY, result);
        }
    }

    finalize(bar, result);
    return result;
}

ApplyResult EquityLedger::closePosition(const MarketBar& bar, FillReason reason) {
    checkOrder(bar.timestamp, true);

    ApplyResult result;
    if (has_bar_ && bar.day != current_day_) {
        rollDay(bar.day);
        result.day_reset = true;
    }
    last_timestamp_ = bar.timestamp;
    has_bar_ = true;

    if (!position_) {
        result.cash_equity = cash_equity_;
        result.marked_equity = marked_equity_;
        return result;
    }

    const Position& pos = *position_;
    double price = bar.getClose(pos.symbol);
    if (!isValidPrice(price)) {
        price = pos.last_price;
        result.warning = "invalid close for " + pos.symbol + ", closed at last valid price";
        LOG_WARN("Forced close of {} at last valid price {:.4f}", pos.symbol, price);
    }

    closeAt(price, pos.unrealizedPnl(price), bar.timestamp, reason, result);

    marked_equity_ = cash_equity_;
    peak_equity_ = std::max(peak_equity_, marked_equity_);
    result.cash_equity = cash_equity_;
    result.marked_equity = marked_equity_;
    return result;
}

// ===== Helpers =====

void EquityLedger::checkOrder(Timestamp ts, bool allow_equal) const {
    if (!has_bar_) return;
    if (ts < last_timestamp_ || (!allow_equal && ts == last_timestamp_)) {
        throw OutOfOrderBarError(
            "ledger bar " + utils::TimeUtils::formatTimestamp(ts) +
            " is not after " + utils::TimeUtils::formatTimestamp(last_timestamp_));
    }
}

std::string EquityLedger::validateBar(const strategy::ExposureTarget& target, const MarketBar& bar,
                                      double day_start) const {
    if (!std::isfinite(day_start) || day_start <= 0.0) {
        return "day start equity is not positive";
    }

    if (position_) {
        const Quote* quote = bar.getQuote(position_->symbol);
        if (quote == nullptr) {
            return "no quote for held " + position_->symbol;
        }
        if (!isValidPrice(quote->close) || !isValidPrice(executionPrice(*quote)) ||
            !isValidPrice(stopMarkPrice(*quote, position_->mode))) {
            return "invalid price for held " + position_->symbol;
        }
    }

    if (!target.hold && target.isActive()) {
        const Quote* quote = bar.getQuote(target.asset_symbol);
        if (quote == nullptr) {
            return "no quote for target " + target.asset_symbol;
        }
        if (!isValidPrice(quote->close) || !isValidPrice(executionPrice(*quote))) {
            return "invalid price for target " + target.asset_symbol;
        }
    }
    return "";
}

void EquityLedger::rollDay(TradingDay day) {
    current_day_ = day;
    day_start_equity_ = marked_equity_;
    stopped_today_ = false;
    stops_today_ = 0;
}

double EquityLedger::executionPrice(const Quote& quote) const {
    return config_.entry_price_source == PriceSource::OPEN ? quote.open : quote.close;
}

double EquityLedger::stopMarkPrice(const Quote& quote, Mode mode) const {
    if (config_.stop_price_source == StopPriceSource::CLOSE) {
        return quote.close;
    }
    return (mode == Mode::SHORT) ? quote.high : quote.low;
}

bool EquityLedger::checkEquityStop(const MarketBar& bar, ApplyResult& result) {
    const Position& pos = *position_;
    const double mark_price = stopMarkPrice(*bar.getQuote(pos.symbol), pos.mode);
    const double paper_pnl = pos.unrealizedPnl(mark_price);
    const double drawdown = (cash_equity_ + paper_pnl - day_start_equity_) / day_start_equity_;

    if (drawdown > -(config_.stop_pct + config_.stop_buffer)) {
        return false;
    }

    // Worst-case fill: a single stop never realizes more than stop_pct of day start
    const double pnl = std::max(paper_pnl, -config_.stop_pct * day_start_equity_);

    double exit_price = mark_price;
    if (pos.shares > 0.0) {
        exit_price = (pos.mode == Mode::SHORT) ? pos.entry_price - pnl / pos.shares
                                               : pos.entry_price + pnl / pos.shares;
    }

    LOG_WARN("Equity stop on {}: drawdown {:.2f}% at {:.4f}, realized {:.2f}",
             pos.symbol, drawdown * 100.0, mark_price, pnl);

    closeAt(exit_price, pnl, bar.timestamp, FillReason::EQUITY_STOP, result);
    stopped_today_ = true;
    ++stops_today_;
    ++total_stops_;
    result.stop_triggered = true;
    return true;
}

bool EquityLedger::needsResize(const strategy::ExposureTarget& target, double price) const {
    const Position& pos = *position_;
    switch (config_.resize_policy) {
        case ResizePolicy::CONTINUOUS:
            return true;
        case ResizePolicy::LEVERAGE_DELTA:
            return std::abs(target.leverage - pos.leverage) > config_.resize_leverage_tolerance;
        case ResizePolicy::NOTIONAL_DELTA: {
            const double equity = cash_equity_ + pos.unrealizedPnl(price);
            const double target_notional = equity * target.leverage;
            const double current_notional = pos.shares * price;
            return std::abs(target_notional - current_notional) > config_.resize_notional_threshold;
        }
    }
    return false;
}

void EquityLedger::openPosition(const strategy::ExposureTarget& target, double price, Timestamp ts,
                                FillReason reason, ApplyResult& result) {
    Position pos;
    pos.symbol = target.asset_symbol;
    pos.mode = target.mode;
    pos.entry_price = price;
    pos.leverage = target.leverage;
    pos.notional = cash_equity_ * target.leverage;
    pos.shares = pos.notional / price;
    pos.entry_time = ts;
    pos.entry_equity = cash_equity_;
    pos.last_price = price;
    position_ = pos;
    ++total_entries_;

    Fill fill;
    fill.timestamp = ts;
    fill.type = FillType::OPEN;
    fill.reason = reason;
    fill.symbol = pos.symbol;
    fill.mode = pos.mode;
    fill.price = price;
    fill.shares = pos.shares;
    fill.notional = pos.notional;
    fill.leverage = pos.leverage;
    fill.cash_after = cash_equity_;
    result.fills.push_back(fill);

    LOG_INFO("OPEN {} {} @ {:.4f} lev {:.2f} notional {:.2f}",
             toString(pos.mode), pos.symbol, price, pos.leverage, pos.notional);
}

void EquityLedger::recordTrade(double exit_price, double pnl, Timestamp ts, FillReason reason) {
    const Position& pos = *position_;
    TradeRecord trade;
    trade.symbol = pos.symbol;
    trade.mode = pos.mode;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.shares = pos.shares;
    trade.leverage = pos.leverage;
    trade.profit_loss = pnl;
    trade.profit_loss_pct = (pos.entry_equity > 0.0) ? pnl / pos.entry_equity : 0.0;
    trade.entry_time = pos.entry_time;
    trade.exit_time = ts;
    trade.exit_reason = reason;
    trade_history_.push_back(trade);
}

void EquityLedger::closeAt(double exit_price, double pnl, Timestamp ts, FillReason reason,
                           ApplyResult& result) {
    recordTrade(exit_price, pnl, ts, reason);
    cash_equity_ += pnl;

    const Position& pos = *position_;
    Fill fill;
    fill.timestamp = ts;
    fill.type = FillType::CLOSE;
    fill.reason = reason;
    fill.symbol = pos.symbol;
    fill.mode = pos.mode;
    fill.price = exit_price;
    fill.shares = pos.shares;
    fill.notional = pos.notional;
    fill.leverage = pos.leverage;
    fill.realized_pnl = pnl;
    fill.cash_after = cash_equity_;
    result.fills.push_back(fill);

    if (reason == FillReason::KILL_SWITCH) {
        ++total_kill_exits_;
    }

    LOG_INFO("CLOSE {} {} @ {:.4f} pnl {:.2f} ({})",
             toString(pos.mode), pos.symbol, exit_price, pnl, toString(reason));
    position_.reset();
}

void EquityLedger::resize(const strategy::ExposureTarget& target, double price, Timestamp ts,
                          ApplyResult& result) {
    const double pnl = position_->unrealizedPnl(price);
    recordTrade(price, pnl, ts, FillReason::RESIZE);
    cash_equity_ += pnl;

    Position& pos = *position_;
    pos.entry_price = price;
    pos.leverage = target.leverage;
    pos.notional = cash_equity_ * target.leverage;
    pos.shares = pos.notional / price;
    pos.entry_time = ts;
    pos.entry_equity = cash_equity_;
    pos.last_price = price;
    ++total_resizes_;

    Fill fill;
    fill.timestamp = ts;
    fill.type = FillType::RESIZE;
    fill.reason = FillReason::RESIZE;
    fill.symbol = pos.symbol;
    fill.mode = pos.mode;
    fill.price = price;
    fill.shares = pos.shares;
    fill.notional = pos.notional;
    fill.leverage = pos.leverage;
    fill.realized_pnl = pnl;
    fill.cash_after = cash_equity_;
    result.fills.push_back(fill);

    LOG_DEBUG("RESIZE {} @ {:.4f} lev {:.2f} notional {:.2f} pnl {:.2f}",
              pos.symbol, price, pos.leverage, pos.notional, pnl);
}

void EquityLedger::finalize(const MarketBar& bar, ApplyResult& result) {
    double unrealized = 0.0;
    if (position_) {
        const double close = bar.getClose(position_->symbol);
        position_->last_price = close;
        unrealized = position_->unrealizedPnl(close);
    }

    marked_equity_ = cash_equity_ + unrealized;
    peak_equity_ = std::max(peak_equity_, marked_equity_);
    const double drawdown = peak_equity_ - marked_equity_;
    max_drawdown_ = std::max(max_drawdown_, drawdown);
    if (peak_equity_ > 0.0) {
        max_drawdown_pct_ = std::max(max_drawdown_pct_, drawdown / peak_equity_);
    }

    result.cash_equity = cash_equity_;
    result.marked_equity = marked_equity_;
    result.unrealized_pnl = unrealized;
}

} // namespace ledger
} // namespace semilev
