#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace stratlab {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

size_t windowStart(size_t i, int window) {
    const size_t w = static_cast<size_t>(std::max(window, 1));
    return (i + 1 >= w) ? (i + 1 - w) : 0;
}
}

std::vector<double> TechnicalIndicators::calculatePctChange(const std::vector<double>& prices) {
    std::vector<double> out(prices.size(), 0.0);
    for (size_t i = 1; i < prices.size(); ++i) {
        const double prev = prices[i - 1];
        if (prev == 0.0 || std::isnan(prev) || std::isnan(prices[i])) {
            out[i] = 0.0;
        } else {
            out[i] = prices[i] / prev - 1.0;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMean(const std::vector<double>& values, int window, int min_periods) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) {
        return out;
    }

    // Running sum over the valid (non-NaN) values inside the window
    double sum = 0.0;
    int count = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isnan(values[i])) {
            sum += values[i];
            ++count;
        }
        if (i >= static_cast<size_t>(window)) {
            const double leaving = values[i - window];
            if (!std::isnan(leaving)) {
                sum -= leaving;
                --count;
            }
        }
        if (count >= std::max(min_periods, 1)) {
            out[i] = sum / count;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingStdDev(const std::vector<double>& values, int window, int min_periods) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) {
        return out;
    }

    std::vector<double> bucket;
    bucket.reserve(static_cast<size_t>(window));
    for (size_t i = 0; i < values.size(); ++i) {
        bucket.clear();
        for (size_t k = windowStart(i, window); k <= i; ++k) {
            if (!std::isnan(values[k])) {
                bucket.push_back(values[k]);
            }
        }
        if (bucket.size() < 2 || static_cast<int>(bucket.size()) < min_periods) {
            continue;
        }
        out[i] = calculateStandardDeviation(bucket, calculateMean(bucket));
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMedian(const std::vector<double>& values, int window, int min_periods) {
    std::vector<double> out(values.size(), kNaN);
    if (window <= 0) {
        return out;
    }

    std::vector<double> bucket;
    bucket.reserve(static_cast<size_t>(window));
    for (size_t i = 0; i < values.size(); ++i) {
        bucket.clear();
        for (size_t k = windowStart(i, window); k <= i; ++k) {
            if (!std::isnan(values[k])) {
                bucket.push_back(values[k]);
            }
        }
        if (bucket.empty() || static_cast<int>(bucket.size()) < min_periods) {
            continue;
        }
        const size_t mid = bucket.size() / 2;
        std::nth_element(bucket.begin(), bucket.begin() + mid, bucket.end());
        double median = bucket[mid];
        if (bucket.size() % 2 == 0) {
            const double lower = *std::max_element(bucket.begin(), bucket.begin() + mid);
            median = (median + lower) / 2.0;
        }
        out[i] = median;
    }
    return out;
}

std::vector<double> TechnicalIndicators::realizedVolatility(const std::vector<double>& returns, int window,
                                                            int periods_per_year) {
    auto out = rollingStdDev(returns, window, 1);
    const double scale = std::sqrt(static_cast<double>(periods_per_year));
    for (auto& v : out) {
        if (!std::isnan(v)) {
            v *= scale;
        }
    }
    return out;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

// Sample standard deviation (n - 1)
double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.size() < 2) return 0.0;

    double sum_sq = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / (values.size() - 1));
}

} // namespace analytics
} // namespace stratlab
