#include "ledger/LedgerConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace semilev {
namespace ledger {

namespace {
std::string normalize(const std::string& name) {
    std::string out = name;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return out;
}
}

void LedgerConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw ConfigError("initial_capital must be positive");
    }
    if (!std::isfinite(stop_pct) || stop_pct <= 0.0 || stop_pct >= 1.0) {
        throw ConfigError("stop_pct must be in (0, 1)");
    }
    if (!std::isfinite(stop_buffer) || stop_buffer < 0.0 || stop_pct + stop_buffer >= 1.0) {
        throw ConfigError("stop_buffer must be >= 0 and stop_pct + stop_buffer < 1");
    }
    if (!std::isfinite(resize_leverage_tolerance) || resize_leverage_tolerance < 0.0) {
        throw ConfigError("resize_leverage_tolerance must be >= 0");
    }
    if (!std::isfinite(resize_notional_threshold) || resize_notional_threshold < 0.0) {
        throw ConfigError("resize_notional_threshold must be >= 0");
    }
}

const char* toString(PriceSource source) {
    return source == PriceSource::OPEN ? "open" : "close";
}

const char* toString(StopPriceSource source) {
    return source == StopPriceSource::CLOSE ? "close" : "intrabar_extreme";
}

const char* toString(ResizePolicy policy) {
    switch (policy) {
        case ResizePolicy::CONTINUOUS: return "continuous";
        case ResizePolicy::LEVERAGE_DELTA: return "leverage_delta";
        case ResizePolicy::NOTIONAL_DELTA: return "notional_delta";
    }
    return "notional_delta";
}

PriceSource parsePriceSource(const std::string& name) {
    const std::string key = normalize(name);
    if (key == "open") return PriceSource::OPEN;
    if (key == "close") return PriceSource::CLOSE;
    throw ConfigError("unknown price source: " + name);
}

StopPriceSource parseStopPriceSource(const std::string& name) {
    const std::string key = normalize(name);
    if (key == "intrabar_extreme" || key == "extreme") return StopPriceSource::INTRABAR_EXTREME;
    if (key == "close") return StopPriceSource::CLOSE;
    throw ConfigError("unknown stop price source: " + name);
}

ResizePolicy parseResizePolicy(const std::string& name) {
    const std::string key = normalize(name);
    if (key == "continuous") return ResizePolicy::CONTINUOUS;
    if (key == "leverage_delta") return ResizePolicy::LEVERAGE_DELTA;
    if (key == "notional_delta") return ResizePolicy::NOTIONAL_DELTA;
    throw ConfigError("unknown resize policy: " + name);
}

} // namespace ledger
} // namespace semilev
