/**
 * @file OUEstimator.cc
 * @brief Implementation of the OU maximum-likelihood estimator
 */

#include "OUEstimator.hh"
#include "MathUtilities.hh"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace TippingEstimation {

const double OUEstimator::kAlphaFloor = 0.01;

OUEstimator::OUEstimator(double delta, const NelderMeadOptions& options)
    : m_delta(delta)
    , m_options(options)
{
    if (!(delta > 0.0)) {
        std::ostringstream os;
        os << "OUEstimator: time step must be positive (delta=" << delta << ")";
        throw std::invalid_argument(os.str());
    }
}

double OUEstimator::transitionMean(const OUParams& params, double xlow) const {
    double rho = std::exp(-params.alpha0 * m_delta);
    return xlow * rho + params.mu0 * (1.0 - rho);
}

double OUEstimator::transitionVariance(const OUParams& params) const {
    double rho = std::exp(-params.alpha0 * m_delta);
    double gamma2 = params.sigma2 / (2.0 * params.alpha0);
    return gamma2 * (1.0 - rho * rho);
}

double OUEstimator::objective(const OUParams& params, const std::vector<double>& x) const {
    OUParams p(std::max(params.alpha0, kAlphaFloor), params.mu0, std::max(0.0, params.sigma2));

    const double rho = std::exp(-p.alpha0 * m_delta);
    const double v = transitionVariance(p);
    const size_t n = x.size() - 1;

    double ss = 0.0;
    for (size_t k = 0; k < n; ++k) {
        double r = x[k + 1] - x[k] * rho - p.mu0 * (1.0 - rho);
        ss += r * r;
    }

    return finiteOrPenalty(static_cast<double>(n) * std::log(v) + ss / v);
}

OUParams OUEstimator::startingValues(const std::vector<double>& x) const {
    OUParams start;
    start.mu0 = mean(x);

    // Clamp the autocorrelation into (0,1) so the log stays defined
    double corr = lag1Autocorrelation(x);
    corr = std::isfinite(corr) ? clamp(corr, 1e-3, 1.0 - 1e-6) : 0.5;
    start.alpha0 = -std::log(corr) / m_delta;

    double qv = 0.0;
    for (size_t k = 0; k + 1 < x.size(); ++k) {
        double d = x[k + 1] - x[k];
        qv += d * d;
    }
    start.sigma2 = qv / static_cast<double>(x.size() - 1) / m_delta;
    return start;
}

OUFitResult OUEstimator::fit(const std::vector<double>& x) const {
    if (x.size() < 3) {
        std::ostringstream os;
        os << "OUEstimator: baseline segment needs at least 3 observations (got " << x.size() << ")";
        throw std::invalid_argument(os.str());
    }

    OUFitResult result;
    result.start = startingValues(x);

    auto f = [this, &x](const std::vector<double>& p) -> double {
        return objective(OUParams(p[0], p[1], p[2]), x);
    };

    std::vector<double> x0 = {result.start.alpha0, result.start.mu0, result.start.sigma2};
    double muStep = std::sqrt(std::max(result.start.stationaryVariance(), 1e-12));
    std::vector<double> step = {
        0.2 * std::max(result.start.alpha0, kAlphaFloor),
        std::max(0.2 * muStep, 1e-6),
        0.2 * std::max(result.start.sigma2, 1e-12)
    };

    NelderMeadOptimizer optimizer(m_options);
    std::vector<double> best = optimizer.optimize(f, x0, step, result.objective);

    // Report the parameters the objective actually evaluated
    result.params = OUParams(std::max(best[0], kAlphaFloor), best[1], std::max(0.0, best[2]));
    result.iterations = optimizer.getIterations();
    result.converged = optimizer.hasConverged() && result.objective < kObjectivePenalty;
    return result;
}

} // namespace TippingEstimation
