#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace semilev {
namespace backtest {

namespace {
enum class Field { TIMESTAMP, VIX, LONG_PERSIST, SHORT_PERSIST, OPEN, HIGH, LOW, CLOSE, RET, IGNORED };

struct Column {
    Field field = Field::IGNORED;
    std::string symbol;
};

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> row;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    // Trailing empty cell ("a,b,")
    if (!line.empty() && line.back() == ',') {
        row.emplace_back();
    }
    return row;
}

Column classify(const std::string& header) {
    Column col;
    const std::string lower = toLower(header);
    if (lower == "timestamp" || lower == "date" || lower == "datetime" || lower == "time") {
        col.field = Field::TIMESTAMP;
        return col;
    }
    if (lower == "vix" || lower == "vix_close") {
        col.field = Field::VIX;
        return col;
    }
    if (lower == "long_persist" || lower == "long_persistence_min") {
        col.field = Field::LONG_PERSIST;
        return col;
    }
    if (lower == "short_persist" || lower == "short_persistence_min") {
        col.field = Field::SHORT_PERSIST;
        return col;
    }

    const auto pos = header.rfind('_');
    if (pos == std::string::npos || pos == 0) {
        return col;
    }
    const std::string suffix = toLower(header.substr(pos + 1));
    col.symbol = header.substr(0, pos);
    if (suffix == "open") col.field = Field::OPEN;
    else if (suffix == "high") col.field = Field::HIGH;
    else if (suffix == "low") col.field = Field::LOW;
    else if (suffix == "close") col.field = Field::CLOSE;
    else if (suffix == "ret") col.field = Field::RET;
    return col;
}

// Empty / "nan" -> NaN. Throws std::invalid_argument on garbage.
double parseNumber(const std::string& cell) {
    if (cell.empty()) return kNaN;
    const std::string lower = toLower(cell);
    if (lower == "nan" || lower == "na" || lower == "null") return kNaN;
    size_t used = 0;
    const double value = std::stod(cell, &used);
    if (used != cell.size()) {
        throw std::invalid_argument("trailing characters in '" + cell + "'");
    }
    return value;
}

// Persistence counts: NaN and negatives read as 0, huge values saturate
int parseBarCount(const std::string& cell) {
    const double v = parseNumber(cell);
    if (!std::isfinite(v) || v <= 0.0) return 0;
    const double cap = static_cast<double>(std::numeric_limits<int>::max());
    return v >= cap ? std::numeric_limits<int>::max() : static_cast<int>(v);
}
}

std::vector<MarketBar> DataHistory::loadCSV(const std::string& file_path, const DataOptions& options) {
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return {};
    }

    auto bars = parseCSV(file, options);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<MarketBar> DataHistory::parseCSV(std::istream& in, const DataOptions& options) {
    std::vector<MarketBar> bars;
    std::string line;

    // Header
    std::vector<Column> columns;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) break;
    }
    for (const auto& name : splitRow(line)) {
        columns.push_back(classify(name));
    }
    const bool has_timestamp = std::any_of(columns.begin(), columns.end(), [](const Column& c) {
        return c.field == Field::TIMESTAMP;
    });
    if (!has_timestamp) {
        LOG_ERROR("CSV header has no timestamp column");
        return bars;
    }

    std::set<std::string> symbols;
    std::set<std::string> symbols_with_returns;
    std::map<std::string, std::set<Field>> quote_fields;
    bool has_persistence = false;
    for (const auto& col : columns) {
        if (col.field == Field::RET) {
            symbols_with_returns.insert(col.symbol);
            symbols.insert(col.symbol);
        } else if (col.field == Field::OPEN || col.field == Field::HIGH ||
                   col.field == Field::LOW || col.field == Field::CLOSE) {
            quote_fields[col.symbol].insert(col.field);
            symbols.insert(col.symbol);
        } else if (col.field == Field::LONG_PERSIST || col.field == Field::SHORT_PERSIST) {
            has_persistence = true;
        }
    }

    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        const auto row = splitRow(line);
        try {
            MarketBar bar;
            bool ts_ok = false;
            for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
                const Column& col = columns[i];
                const std::string& cell = row[i];
                switch (col.field) {
                    case Field::TIMESTAMP: {
                        auto ts = utils::TimeUtils::parseTimestamp(cell);
                        if (ts) {
                            bar.timestamp = *ts;
                            ts_ok = true;
                        }
                        break;
                    }
                    case Field::VIX: bar.vix = parseNumber(cell); break;
                    case Field::LONG_PERSIST: {
                        bar.persistence.long_bars = parseBarCount(cell);
                        break;
                    }
                    case Field::SHORT_PERSIST: {
                        bar.persistence.short_bars = parseBarCount(cell);
                        break;
                    }
                    case Field::OPEN: bar.quotes[col.symbol].open = parseNumber(cell); break;
                    case Field::HIGH: bar.quotes[col.symbol].high = parseNumber(cell); break;
                    case Field::LOW: bar.quotes[col.symbol].low = parseNumber(cell); break;
                    case Field::CLOSE: bar.quotes[col.symbol].close = parseNumber(cell); break;
                    case Field::RET: bar.returns[col.symbol] = parseNumber(cell); break;
                    case Field::IGNORED: break;
                }
            }
            if (!ts_ok) {
                LOG_WARN("Skipping CSV line {}: bad timestamp", line_no);
                continue;
            }
            bar.day = utils::TimeUtils::tradingDayOf(bar.timestamp);

            // Close-only files: open/high/low default to the close
            for (auto& kv : bar.quotes) {
                const auto& fields = quote_fields[kv.first];
                Quote& q = kv.second;
                if (!fields.count(Field::OPEN)) q.open = q.close;
                if (!fields.count(Field::HIGH)) q.high = q.close;
                if (!fields.count(Field::LOW)) q.low = q.close;
            }
            bars.push_back(std::move(bar));
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing CSV line {}: {} - {}", line_no, line, e.what());
        }
    }

    std::stable_sort(bars.begin(), bars.end(), [](const MarketBar& a, const MarketBar& b) {
        return a.timestamp < b.timestamp;
    });
    auto last = std::unique(bars.begin(), bars.end(), [](const MarketBar& a, const MarketBar& b) {
        return a.timestamp == b.timestamp;
    });
    if (last != bars.end()) {
        LOG_WARN("Dropped {} bars with duplicate timestamps", std::distance(last, bars.end()));
        bars.erase(last, bars.end());
    }

    std::vector<std::string> missing_returns;
    for (const auto& sym : symbols) {
        if (!symbols_with_returns.count(sym) && quote_fields.count(sym)) {
            missing_returns.push_back(sym);
        }
    }
    deriveIntradayFeatures(bars, missing_returns, !has_persistence, options);

    if (!options.start_date.empty() || !options.end_date.empty()) {
        bars = filterByDate(bars, options.start_date, options.end_date);
    }
    return bars;
}

void DataHistory::deriveIntradayFeatures(std::vector<MarketBar>& bars,
                                         const std::vector<std::string>& symbols_missing_returns,
                                         bool derive_persistence,
                                         const DataOptions& options) {
    std::map<std::string, double> day_open;
    TradingDay day = 0;
    int long_streak = 0;
    int short_streak = 0;

    for (auto& bar : bars) {
        if (bar.day != day) {
            day = bar.day;
            day_open.clear();
            long_streak = 0;
            short_streak = 0;
        }

        for (const auto& sym : symbols_missing_returns) {
            const Quote* quote = bar.getQuote(sym);
            double ret = kNaN;
            if (quote != nullptr) {
                if (!day_open.count(sym)) {
                    const double base = isValidPrice(quote->open) ? quote->open : quote->close;
                    if (isValidPrice(base)) {
                        day_open[sym] = base;
                    }
                }
                auto it = day_open.find(sym);
                if (it != day_open.end() && std::isfinite(quote->close)) {
                    ret = quote->close / it->second - 1.0;
                }
            }
            bar.returns[sym] = ret;
        }

        if (derive_persistence) {
            const double ret = bar.getReturn(options.persistence_symbol);
            long_streak = (ret > 0.0) ? long_streak + 1 : 0;
            short_streak = (ret < 0.0) ? short_streak + 1 : 0;
            bar.persistence.long_bars = long_streak * options.bar_minutes;
            bar.persistence.short_bars = short_streak * options.bar_minutes;
        }
    }
}

std::vector<MarketBar> DataHistory::filterByDate(const std::vector<MarketBar>& bars,
                                                 const std::string& start_date,
                                                 const std::string& end_date) {
    TradingDay start = 0;
    TradingDay end = 99991231;
    if (!start_date.empty()) {
        auto parsed = utils::TimeUtils::parseTradingDay(start_date);
        if (!parsed) {
            LOG_WARN("Ignoring unparseable start date: {}", start_date);
        } else {
            start = *parsed;
        }
    }
    if (!end_date.empty()) {
        auto parsed = utils::TimeUtils::parseTradingDay(end_date);
        if (!parsed) {
            LOG_WARN("Ignoring unparseable end date: {}", end_date);
        } else {
            end = *parsed;
        }
    }

    std::vector<MarketBar> filtered;
    std::copy_if(bars.begin(), bars.end(), std::back_inserter(filtered), [&](const MarketBar& bar) {
        return bar.day >= start && bar.day <= end;
    });
    return filtered;
}

} // namespace backtest
} // namespace semilev
