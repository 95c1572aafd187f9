#include "common/TimeUtils.h"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace semilev {
namespace utils {

namespace {
constexpr long long SECONDS_PER_DAY = 86400;
constexpr long long EPOCH_MS_THRESHOLD = 100000000000LL; // ~ year 5138 in seconds

long long daysFromCivil(int y, int m, int d) {
    y -= (m <= 2) ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = static_cast<long long>(y) - era * 400;
    const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

std::string trimCopy(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool isInteger(const std::string& s) {
    if (s.empty()) return false;
    size_t i = (s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool validDate(int year, int month, int day) {
    return year > 0 && month >= 1 && month <= 12 && day >= 1 && day <= 31;
}
}

Timestamp TimeUtils::fromCivil(int year, int month, int day, int hour, int minute, int second) {
    return daysFromCivil(year, month, day) * SECONDS_PER_DAY
        + static_cast<long long>(hour) * 3600
        + static_cast<long long>(minute) * 60
        + second;
}

TradingDay TimeUtils::tradingDayOf(Timestamp ts) {
    int y = 0, m = 0, d = 0;
    civilFromDays(floorDiv(ts, SECONDS_PER_DAY), y, m, d);
    return y * 10000 + m * 100 + d;
}

std::string TimeUtils::formatTimestamp(Timestamp ts) {
    const long long days = floorDiv(ts, SECONDS_PER_DAY);
    const long long secs = ts - days * SECONDS_PER_DAY;
    int y = 0, m = 0, d = 0;
    civilFromDays(days, y, m, d);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02lld:%02lld:%02lld",
                  y, m, d, secs / 3600, (secs % 3600) / 60, secs % 60);
    return buffer;
}

std::optional<Timestamp> TimeUtils::parseTimestamp(const std::string& text) {
    const std::string s = trimCopy(text);
    if (s.empty()) {
        return std::nullopt;
    }

    try {
        if (isInteger(s)) {
            const long long value = std::stoll(s);
            return (value >= EPOCH_MS_THRESHOLD || value <= -EPOCH_MS_THRESHOLD) ? value / 1000 : value;
        }

        // YYYY-MM-DD[ HH:MM[:SS]] ; anything after the seconds (fraction, offset) is ignored
        if (s.size() < 10 || s[4] != '-' || s[7] != '-') {
            return std::nullopt;
        }
        const int year = std::stoi(s.substr(0, 4));
        const int month = std::stoi(s.substr(5, 2));
        const int day = std::stoi(s.substr(8, 2));
        if (!validDate(year, month, day)) {
            return std::nullopt;
        }

        int hour = 0, minute = 0, second = 0;
        if (s.size() >= 16 && (s[10] == ' ' || s[10] == 'T') && s[13] == ':') {
            hour = std::stoi(s.substr(11, 2));
            minute = std::stoi(s.substr(14, 2));
            if (s.size() >= 19 && s[16] == ':') {
                second = std::stoi(s.substr(17, 2));
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }
        return fromCivil(year, month, day, hour, minute, second);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<TradingDay> TimeUtils::parseTradingDay(const std::string& text) {
    const std::string s = trimCopy(text);
    if (s.size() == 8 && isInteger(s)) {
        const int value = std::stoi(s);
        if (!validDate(value / 10000, (value / 100) % 100, value % 100)) {
            return std::nullopt;
        }
        return value;
    }
    auto ts = parseTimestamp(s);
    if (!ts || isInteger(s)) {
        return std::nullopt;
    }
    return tradingDayOf(*ts);
}

} // namespace utils
} // namespace semilev
