#include "analytics/TechnicalIndicators.h"
#include "common/Types.h"
#include <cmath>
#include <numeric>

namespace semilev {
namespace analytics {

double TechnicalIndicators::emaAlpha(int span) {
    return 2.0 / (span + 1.0);
}

std::vector<double> TechnicalIndicators::calculateEMAVector(const std::vector<double>& prices, int span) {
    std::vector<double> out;
    out.reserve(prices.size());
    for (double price : prices) {
        out.push_back(out.empty() ? price : nextEMA(out.back(), price, span));
    }
    return out;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int span) {
    const auto series = calculateEMAVector(prices, span);
    return series.empty() ? kNaN : series.back();
}

double TechnicalIndicators::nextEMA(double prev_ema, double price, int span) {
    return prev_ema + emaAlpha(span) * (price - prev_ema);
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateSampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;

    const double mean = calculateMean(values);
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / (values.size() - 1));
}

} // namespace analytics
} // namespace semilev
