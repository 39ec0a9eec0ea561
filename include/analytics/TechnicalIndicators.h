#pragma once

#include <cstddef>
#include <vector>

namespace stratlab {
namespace analytics {

// Series-in / series-out indicators. Output is aligned with the input and uses
// NaN where a value is undefined.
class TechnicalIndicators {
public:
    // Close-to-close percent change; the first element is 0
    static std::vector<double> calculatePctChange(const std::vector<double>& prices);

    // Trailing mean over up to `window` values, defined once `min_periods` values are seen
    static std::vector<double> rollingMean(const std::vector<double>& values, int window, int min_periods = 1);

    // Trailing sample standard deviation (ddof = 1); needs at least two observations
    static std::vector<double> rollingStdDev(const std::vector<double>& values, int window, int min_periods = 1);

    // Trailing median ignoring NaN inputs
    static std::vector<double> rollingMedian(const std::vector<double>& values, int window, int min_periods = 1);

    // Annualized realized volatility: rollingStdDev(returns) * sqrt(periods_per_year)
    static std::vector<double> realizedVolatility(const std::vector<double>& returns, int window,
                                                  int periods_per_year = 252);

private:
    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace stratlab
