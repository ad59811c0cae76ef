#ifndef OU_ESTIMATOR_HH
#define OU_ESTIMATOR_HH

/**
 * @file OUEstimator.hh
 * @brief Maximum-likelihood fit of a stationary Ornstein-Uhlenbeck process
 *
 * The exact OU transition over a step delta is Gaussian:
 *
 *   X_{k+1} | X_k ~ N( X_k rho + mu0 (1 - rho), gamma2 (1 - rho^2) )
 *
 * with rho = exp(-alpha0 delta) and gamma2 = sigma2 / (2 alpha0).
 * The objective is twice the negative log-likelihood up to an additive
 * constant, summed over consecutive pairs.
 */

#include "DataTypes.hh"
#include "NelderMeadOptimizer.hh"
#include <vector>

namespace TippingEstimation {

/**
 * @struct OUFitResult
 * @brief Results from the OU fit
 */
struct OUFitResult {
    OUParams params;          ///< Optimal parameters
    OUParams start;           ///< Moment-based starting values
    double objective;         ///< 2 * NLL (up to a constant) at the optimum
    int iterations;           ///< Number of optimizer iterations
    bool converged;           ///< Optimizer met its tolerances at a finite objective

    OUFitResult()
        : objective(std::numeric_limits<double>::infinity())
        , iterations(0)
        , converged(false)
    {}
};

/**
 * @class OUEstimator
 * @brief OU maximum-likelihood estimator for a baseline segment
 */
class OUEstimator {
public:
    /// alpha0 is floored at this value inside the objective
    static const double kAlphaFloor;

    /**
     * @brief Constructor
     * @param delta Observation time step
     * @param options Optimizer configuration
     */
    explicit OUEstimator(double delta, const NelderMeadOptions& options = NelderMeadOptions());

    /**
     * @brief Twice the negative log-likelihood of a segment
     *
     * alpha0 is floored at kAlphaFloor and sigma2 at 0 before evaluation;
     * returns kObjectivePenalty when the value is not finite.
     */
    double objective(const OUParams& params, const std::vector<double>& x) const;

    /**
     * @brief Moment-based starting values
     *
     * mu0 from the sample mean, alpha0 = -log(corr1)/delta from the
     * lag-1 autocorrelation, sigma2 from the mean squared increment
     * divided by delta.
     */
    OUParams startingValues(const std::vector<double>& x) const;

    /**
     * @brief Fit the OU parameters
     * @param x Baseline segment (finite values, at least 3)
     * @throws std::invalid_argument if the segment is too short
     */
    OUFitResult fit(const std::vector<double>& x) const;

    /**
     * @brief Conditional mean of X_{k+1} given X_k = xlow
     */
    double transitionMean(const OUParams& params, double xlow) const;

    /**
     * @brief Conditional variance of X_{k+1} given X_k
     */
    double transitionVariance(const OUParams& params) const;

    double getDelta() const { return m_delta; }

private:
    double m_delta;
    NelderMeadOptions m_options;
};

} // namespace TippingEstimation

#endif // OU_ESTIMATOR_HH
