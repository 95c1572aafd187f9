#pragma once

#include <vector>

namespace semilev {
namespace analytics {

// Series helpers shared by the trend engine and the performance report
class TechnicalIndicators {
public:
    // alpha = 2 / (span + 1)
    static double emaAlpha(int span);

    // Recursive EMA seeded with the first value (no SMA warmup). Returns NaN on empty input.
    static double calculateEMA(const std::vector<double>& prices, int span);
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int span);

    // One incremental update: prev + alpha * (price - prev)
    static double nextEMA(double prev_ema, double price, int span);

    static double calculateMean(const std::vector<double>& values);

    // Sample standard deviation (n - 1). 0 for fewer than two values.
    static double calculateSampleStdDev(const std::vector<double>& values);
};

} // namespace analytics
} // namespace semilev
