#pragma once

#include <cmath>
#include <limits>
#include <map>
#include <string>

namespace semilev {

// Epoch seconds of the exchange-local wall clock (no timezone conversion).
using Timestamp = long long;
// Calendar date as yyyymmdd.
using TradingDay = int;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

enum class Mode { NEUTRAL, LONG, SHORT };

inline const char* toString(Mode mode) {
    switch (mode) {
        case Mode::NEUTRAL: return "NEUTRAL";
        case Mode::LONG: return "LONG";
        case Mode::SHORT: return "SHORT";
    }
    return "NEUTRAL";
}

inline bool isValidPrice(double price) {
    return std::isfinite(price) && price > 0.0;
}

struct Quote {
    double open = kNaN;
    double high = kNaN;
    double low = kNaN;
    double close = kNaN;

    Quote() = default;
    Quote(double o, double h, double l, double c)
        : open(o), high(h), low(l), close(c) {}
};

// Consecutive bars (or minutes) the market has held in each direction.
struct Persistence {
    int long_bars = 0;
    int short_bars = 0;
};

struct MarketBar {
    Timestamp timestamp = 0;
    TradingDay day = 0;
    std::map<std::string, double> returns;
    std::map<std::string, Quote> quotes;
    double vix = kNaN;
    Persistence persistence;

    double getReturn(const std::string& symbol) const {
        auto it = returns.find(symbol);
        return (it != returns.end()) ? it->second : kNaN;
    }

    const Quote* getQuote(const std::string& symbol) const {
        auto it = quotes.find(symbol);
        return (it != quotes.end()) ? &it->second : nullptr;
    }

    double getClose(const std::string& symbol) const {
        const Quote* quote = getQuote(symbol);
        return quote ? quote->close : kNaN;
    }
};

} // namespace semilev
