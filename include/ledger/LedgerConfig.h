#pragma once

#include <string>

namespace semilev {
namespace ledger {

// Price used for target-driven fills (entry, resize, signal exits).
enum class PriceSource { OPEN, CLOSE };

// Price used to mark the position for the equity stop check.
enum class StopPriceSource {
    INTRABAR_EXTREME,   // low for LONG, high for SHORT
    CLOSE
};

enum class ResizePolicy {
    CONTINUOUS,         // rebase every bar
    LEVERAGE_DELTA,     // |target - current| leverage beyond tolerance
    NOTIONAL_DELTA      // |target - current| notional beyond a dollar threshold
};

struct LedgerConfig {
    double initial_capital = 100000.0;

    // Equity stop: trigger at -(stop_pct + stop_buffer) from day start, loss capped at stop_pct
    double stop_pct = 0.018;
    double stop_buffer = 0.001;
    StopPriceSource stop_price_source = StopPriceSource::INTRABAR_EXTREME;

    PriceSource entry_price_source = PriceSource::CLOSE;

    ResizePolicy resize_policy = ResizePolicy::NOTIONAL_DELTA;
    double resize_leverage_tolerance = 0.1;
    double resize_notional_threshold = 50.0;

    bool flatten_at_day_end = true;
    bool allow_reentry_after_stop = true;

    // Throws ConfigError
    void validate() const;
};

const char* toString(PriceSource source);
const char* toString(StopPriceSource source);
const char* toString(ResizePolicy policy);

// Case-insensitive ("open", "close", "intrabar_extreme", "notional_delta", ...).
// Throw ConfigError on unknown names.
PriceSource parsePriceSource(const std::string& name);
StopPriceSource parseStopPriceSource(const std::string& name);
ResizePolicy parseResizePolicy(const std::string& name);

} // namespace ledger
} // namespace semilev
