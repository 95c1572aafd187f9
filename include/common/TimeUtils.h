#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace semilev {
namespace utils {

class TimeUtils {
public:
    // "YYYY-MM-DD", "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH:MM:SS" (also 'T' separator),
    // or an integer epoch in seconds / milliseconds.
    static std::optional<Timestamp> parseTimestamp(const std::string& text);

    static Timestamp fromCivil(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
    static TradingDay tradingDayOf(Timestamp ts);
    static std::string formatTimestamp(Timestamp ts);

    // Accepts "YYYY-MM-DD" or "YYYYMMDD".
    static std::optional<TradingDay> parseTradingDay(const std::string& text);
};

} // namespace utils
} // namespace semilev
