#ifndef MATH_UTILITIES_HH
#define MATH_UTILITIES_HH

/**
 * @file MathUtilities.hh
 * @brief Mathematical utility functions for tipping-point estimation
 *
 * Provides:
 * - Clamping utilities
 * - The finite-penalty policy shared by all likelihood objectives
 * - NaN-aware summary statistics (mean, median, lag-1 autocorrelation)
 */

#include <cmath>
#include <algorithm>
#include <limits>
#include <vector>

namespace TippingEstimation {

/**
 * @brief Value returned by objectives whose likelihood is undefined
 *
 * Objectives never hand a non-finite value to the optimizer; any NaN
 * or infinite evaluation is replaced by this constant.
 */
const double kObjectivePenalty = 1e30;

/**
 * @brief Clamp value to specified range
 * @param x Value to clamp
 * @param lo Lower bound
 * @param hi Upper bound
 * @return Clamped value in [lo, hi]
 */
inline double clamp(double x, double lo, double hi) {
    return std::max(lo, std::min(hi, x));
}

/**
 * @brief Replace a non-finite objective value by kObjectivePenalty
 */
inline double finiteOrPenalty(double value) {
    return std::isfinite(value) ? value : kObjectivePenalty;
}

/**
 * @brief Keep only the finite entries of a vector
 */
inline std::vector<double> finiteValues(const std::vector<double>& x) {
    std::vector<double> out;
    out.reserve(x.size());
    for (double v : x) {
        if (std::isfinite(v)) out.push_back(v);
    }
    return out;
}

/**
 * @brief Arithmetic mean of the finite entries (NaN if none)
 */
inline double mean(const std::vector<double>& x) {
    double s = 0.0;
    int n = 0;
    for (double v : x) {
        if (std::isfinite(v)) { s += v; ++n; }
    }
    return (n > 0) ? s / n : std::numeric_limits<double>::quiet_NaN();
}

/**
 * @brief Median of the finite entries (NaN if none)
 */
inline double median(const std::vector<double>& x) {
    std::vector<double> v = finiteValues(x);
    if (v.empty()) return std::numeric_limits<double>::quiet_NaN();
    const size_t n = v.size();
    std::nth_element(v.begin(), v.begin() + n / 2, v.end());
    double upper = v[n / 2];
    if (n % 2 == 1) return upper;
    double lower = *std::max_element(v.begin(), v.begin() + n / 2);
    return 0.5 * (lower + upper);
}

/**
 * @brief Lag-1 sample autocorrelation
 * @param x Series without missing values
 */
inline double lag1Autocorrelation(const std::vector<double>& x) {
    const size_t n = x.size();
    if (n < 3) return std::numeric_limits<double>::quiet_NaN();
    double mu = mean(x);
    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = x[i] - mu;
        den += d * d;
        if (i + 1 < n) num += d * (x[i + 1] - mu);
    }
    return (den > 0.0) ? num / den : std::numeric_limits<double>::quiet_NaN();
}

} // namespace TippingEstimation

#endif // MATH_UTILITIES_HH
