#ifndef TIPPING_ESTIMATOR_HH
#define TIPPING_ESTIMATOR_HH

/**
 * @file TippingEstimator.hh
 * @brief Penalized Strang-splitting fit of the ramped tipping model
 *
 * Fits (tau, a) of
 *
 *   dX = -(a (X - m)^2 + lambda(t)) dt + sigma dW,
 *   lambda(t) = lambda0 (1 - t/tau),  t = time since onset t0,
 *
 * to the post-onset segment, with m = mu0 - alpha0/(2a),
 * lambda0 = -alpha0^2/(4a) and sigma^2 = sigma2 taken from the
 * baseline OU fit.
 *
 * Strang splitting (h = delta/2): around the stable fixed point
 * mu(t) = m + sqrt(-lambda/a) the drift splits into a linear OU part
 * with rate alpha(t) = 2 sqrt(-a lambda) and the nonlinear part
 * -a (x - mu)^2, whose flow is
 *
 *   f_h(x)      = mu + (x - mu) / (1 + a h (x - mu))
 *   f_h^{-1}(y) = mu + (y - mu) / (1 - a h (y - mu))
 *
 * Each transition is approximated by
 *
 *   f_h^{-1}(X_{k+1}) ~ N( f_h(X_k) rho + mu (1 - rho), gamma2 (1 - rho^2) )
 *
 * plus the Jacobian term log|d f_h^{-1}/dy| = -2 log|1 - a h (X_{k+1} - mu)|.
 */

#include "DataTypes.hh"
#include "NelderMeadOptimizer.hh"
#include <vector>

namespace TippingEstimation {

/**
 * @brief Model-implied quantities of one Strang transition k -> k+1
 */
struct StrangTransition {
    double lambda;       ///< Control level at the lower observation
    double mu;           ///< Stable fixed point
    double mean;         ///< Mean of f_h^{-1}(X_{k+1})
    double variance;     ///< Variance of f_h^{-1}(X_{k+1})
    double transformed;  ///< f_h^{-1}(X_{k+1})
    double logJacobian;  ///< log|d f_h^{-1}/dy| at X_{k+1}

    StrangTransition()
        : lambda(0.0), mu(0.0), mean(0.0), variance(0.0)
        , transformed(0.0), logJacobian(0.0) {}

    /// Standardized one-step residual
    double residual() const { return (transformed - mean) / std::sqrt(variance); }
};

/**
 * @struct TippingFitResult
 * @brief Results from the tipping fit
 */
struct TippingFitResult {
    TippingParams params;   ///< Optimal parameters (a already floored)
    double objective;       ///< Penalized objective at the optimum
    double pen;             ///< Penalization weight used
    Hessian2 hessian;       ///< Hessian of the objective at the optimum
    double seTau;           ///< Approximate standard error of tau (NaN if unavailable)
    double seA;             ///< Approximate standard error of a (NaN if unavailable)
    int iterations;
    bool converged;

    TippingFitResult()
        : objective(std::numeric_limits<double>::infinity())
        , pen(0.0)
        , seTau(std::numeric_limits<double>::quiet_NaN())
        , seA(std::numeric_limits<double>::quiet_NaN())
        , iterations(0)
        , converged(false)
    {}
};

/**
 * @class TippingEstimator
 * @brief Tipping-model estimator conditioned on a baseline OU fit
 *
 * The estimator keeps a copy of the post-onset segment and is immutable
 * after construction, so one instance can be shared by several threads.
 */
class TippingEstimator {
public:
    /// a is floored at this value inside the objective
    static const double kCurvatureFloor;

    /**
     * @brief Constructor
     * @param postOnset Post-onset segment (finite values, absolute time axis)
     * @param ou Baseline OU parameters (held fixed)
     * @param t0 Onset time
     * @param options Optimizer configuration
     * @throws std::invalid_argument if the segment has fewer than 3 points
     */
    TippingEstimator(const Trace& postOnset,
                     const OUParams& ou,
                     double t0,
                     const NelderMeadOptions& options = NelderMeadOptions());

    /**
     * @brief Strang quantities of transition k -> k+1
     * @return false if the transition is undefined (e.g. lambda >= 0)
     */
    bool transition(const TippingParams& params, std::size_t k, StrangTransition& out) const;

    /**
     * @brief Negative pseudo log-likelihood (no penalty)
     *
     * Omits the constant (n-1)/2 log(2 pi). Returns kObjectivePenalty for tau <= 0 or a non-finite value.
     */
    double negativeLogLikelihood(const TippingParams& params) const;

    /**
     * @brief Soft penalty pen * n * (1/a - 1) for a < 1, zero otherwise
     */
    double penalty(const TippingParams& params, double pen) const;

    /**
     * @brief Penalized objective minimized by fit()
     *
     * negativeLogLikelihood() + penalty(); both terms are on the NLL scale.
     */
    double objective(const TippingParams& params, double pen) const;

    /**
     * @brief Fit (tau, a)
     * @param pen Penalization weight
     * @param start Starting values (default tau = 100, a = 1)
     * @param step Initial simplex steps
     */
    TippingFitResult fit(double pen,
                         const TippingParams& start = TippingParams(100.0, 1.0),
                         const TippingParams& step = TippingParams(20.0, 0.25)) const;

    /**
     * @brief Central-difference Hessian of the penalized objective
     * @param h_tau Step for tau (-1 means auto)
     * @param h_a Step for a (-1 means auto)
     */
    Hessian2 computeHessian(const TippingParams& params, double pen,
                            double h_tau = -1.0, double h_a = -1.0) const;

    /**
     * @brief Standardized one-step residuals at the given parameters
     *
     * Transitions that are undefined at these parameters yield NaN.
     */
    std::vector<double> residuals(const TippingParams& params) const;

    const Trace& getSegment() const { return m_segment; }
    const OUParams& getOUParams() const { return m_ou; }
    double getOnsetTime() const { return m_t0; }
    std::size_t size() const { return m_segment.size(); }

private:
    Trace m_segment;
    OUParams m_ou;
    double m_t0;
    NelderMeadOptions m_options;
};

} // namespace TippingEstimation

#endif // TIPPING_ESTIMATOR_HH
