#include "strategy/LeverageTable.h"
#include "common/Errors.h"

#include <cmath>
#include <limits>
#include <utility>

namespace semilev {
namespace strategy {

LeverageTable::LeverageTable(std::vector<LeverageBand> bands, double otherwise)
    : bands_(std::move(bands))
    , otherwise_(otherwise)
{}

double LeverageTable::lookup(double vix) const {
    for (const auto& band : bands_) {
        if (vix < band.vix_below) {
            return band.leverage;
        }
    }
    return otherwise_;
}

void LeverageTable::validate(const std::string& name) const {
    double previous = -std::numeric_limits<double>::infinity();
    for (const auto& band : bands_) {
        if (!std::isfinite(band.vix_below) || band.vix_below <= previous) {
            throw ConfigError(name + ": VIX bands must be finite and strictly ascending");
        }
        if (!std::isfinite(band.leverage) || band.leverage <= 0.0) {
            throw ConfigError(name + ": band leverage must be positive");
        }
        previous = band.vix_below;
    }
    if (!std::isfinite(otherwise_) || otherwise_ <= 0.0) {
        throw ConfigError(name + ": fallback leverage must be positive");
    }
}

LeverageTable LeverageTable::canonicalLong() {
    return LeverageTable({{12.0, 4.0}, {15.0, 3.0}}, 2.0);
}

LeverageTable LeverageTable::canonicalShort() {
    return LeverageTable({{20.0, 2.0}, {25.0, 4.0}}, 5.0);
}

LeverageTable LeverageTable::productionLong() {
    return LeverageTable({{12.0, 3.75}, {13.0, 3.5}, {14.0, 3.25}}, 3.0);
}

} // namespace strategy
} // namespace semilev
