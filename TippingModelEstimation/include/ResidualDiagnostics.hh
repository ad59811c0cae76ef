#ifndef RESIDUAL_DIAGNOSTICS_HH
#define RESIDUAL_DIAGNOSTICS_HH

/**
 * @file ResidualDiagnostics.hh
 * @brief Goodness-of-fit diagnostics for a fitted replicate
 *
 * Under a well-specified fit the standardized Strang residuals are
 * approximately i.i.d. N(0,1). The report carries the residual column,
 * a QQ table against standard-normal plotting positions, and summary
 * statistics; plotting is left to external tools.
 */

#include "DataTypes.hh"
#include <vector>

namespace TippingEstimation {

/**
 * @brief One point of a normal QQ plot
 */
struct QQPoint {
    double theoretical;  ///< Standard-normal quantile at (i-0.5)/n
    double sample;       ///< i-th smallest residual
};

/**
 * @brief Residual diagnostics of one replicate
 */
struct ResidualReport {
    std::string replicate;
    std::vector<double> residuals;  ///< One per transition, NaN where undefined
    std::vector<QQPoint> qq;        ///< Built from the finite residuals
    double mean;
    double standardDeviation;
    double ksDistance;              ///< Kolmogorov-Smirnov distance to N(0,1)
    std::size_t undefined;          ///< Transitions with no defined residual

    ResidualReport()
        : mean(0.0), standardDeviation(0.0), ksDistance(0.0), undefined(0) {}

    /**
     * @brief Print summary
     */
    void print() const;
};

/**
 * @class ResidualDiagnostics
 * @brief Standardized one-step residuals under the fitted tipping model
 */
class ResidualDiagnostics {
public:
    /**
     * @brief Compute the diagnostics of one fitted replicate
     * @param row Fitted parameters of the replicate
     * @param postOnset Post-onset segment the tipping model was fitted to
     * @param t0 Onset time
     */
    static ResidualReport analyze(const EstimateRow& row, const Trace& postOnset, double t0);

    /**
     * @brief Summary statistics and QQ table of a residual vector
     */
    static ResidualReport summarize(const std::vector<double>& residuals);
};

} // namespace TippingEstimation

#endif // RESIDUAL_DIAGNOSTICS_HH
