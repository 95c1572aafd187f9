#pragma once

#include <string>
#include <vector>

namespace semilev {
namespace strategy {

struct LeverageBand {
    double vix_below = 0.0;
    double leverage = 0.0;
};

// Step function of the VIX level: the first band with vix < vix_below wins,
// otherwise the fallback value. No interpolation between bands.
class LeverageTable {
public:
    LeverageTable() = default;
    LeverageTable(std::vector<LeverageBand> bands, double otherwise);

    double lookup(double vix) const;

    const std::vector<LeverageBand>& bands() const { return bands_; }
    double otherwise() const { return otherwise_; }

    // Throws ConfigError when bands are unsorted or any leverage is not positive.
    void validate(const std::string& name) const;

    // Intraday progressive-entry family
    static LeverageTable canonicalLong();    // <12: 4.0, <15: 3.0, else 2.0
    static LeverageTable canonicalShort();   // <20: 2.0, <25: 4.0, else 5.0

    // Daily EMA crossover production table: <12: 3.75, <13: 3.5, <14: 3.25, else 3.0
    static LeverageTable productionLong();

private:
    std::vector<LeverageBand> bands_;
    double otherwise_ = 0.0;
};

} // namespace strategy
} // namespace semilev
