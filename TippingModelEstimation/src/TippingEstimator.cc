/**
 * @file TippingEstimator.cc
 * @brief Implementation of the Strang-splitting tipping estimator
 */

#include "TippingEstimator.hh"
#include "MathUtilities.hh"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace TippingEstimation {

const double TippingEstimator::kCurvatureFloor = 0.1;

TippingEstimator::TippingEstimator(const Trace& postOnset,
                                   const OUParams& ou,
                                   double t0,
                                   const NelderMeadOptions& options)
    : m_segment(postOnset)
    , m_ou(ou)
    , m_t0(t0)
    , m_options(options)
{
    if (m_segment.size() < 3) {
        std::ostringstream os;
        os << "TippingEstimator: post-onset segment of '" << m_segment.id
           << "' needs at least 3 observations (got " << m_segment.size() << ")";
        throw std::invalid_argument(os.str());
    }
    if (!(m_segment.delta > 0.0)) {
        std::ostringstream os;
        os << "TippingEstimator: time step must be positive (delta=" << m_segment.delta << ")";
        throw std::invalid_argument(os.str());
    }
}

bool TippingEstimator::transition(const TippingParams& params, std::size_t k,
                                  StrangTransition& out) const {
    const double a = std::max(params.a, kCurvatureFloor);
    const double delta = m_segment.delta;
    const double h = 0.5 * delta;

    const double m = m_ou.mu0 - m_ou.alpha0 / (2.0 * a);
    const double lambda0 = -m_ou.alpha0 * m_ou.alpha0 / (4.0 * a);

    const double t = m_segment.timeAt(k) - m_t0;
    out.lambda = lambda0 * (1.0 - t / params.tau);
    if (!(out.lambda < 0.0)) return false;

    const double alpha = 2.0 * std::sqrt(-a * out.lambda);
    const double gamma2 = m_ou.sigma2 / (2.0 * alpha);
    const double rho = std::exp(-alpha * delta);
    out.mu = m + std::sqrt(-out.lambda / a);

    const double xlow = m_segment.values[k];
    const double xupp = m_segment.values[k + 1];

    // Half step of the nonlinear flow applied to the lower point
    const double fh = out.mu + (xlow - out.mu) / (1.0 + a * h * (xlow - out.mu));

    // Inverse half step applied to the upper point
    const double inv = 1.0 - a * h * (xupp - out.mu);
    out.transformed = out.mu + (xupp - out.mu) / inv;
    out.logJacobian = -2.0 * std::log(std::abs(inv));

    out.mean = fh * rho + out.mu * (1.0 - rho);
    out.variance = gamma2 * (1.0 - rho * rho);
    return std::isfinite(out.mean) && std::isfinite(out.transformed)
        && std::isfinite(out.logJacobian) && out.variance > 0.0;
}

double TippingEstimator::negativeLogLikelihood(const TippingParams& params) const {
    if (!(params.tau > 0.0)) return kObjectivePenalty;

    double sum = 0.0;
    StrangTransition tr;
    for (std::size_t k = 0; k + 1 < m_segment.size(); ++k) {
        if (!transition(params, k, tr)) return kObjectivePenalty;
        double r = tr.transformed - tr.mean;
        sum += std::log(tr.variance) + r * r / tr.variance - 2.0 * tr.logJacobian;
    }
    return finiteOrPenalty(0.5 * sum);
}

double TippingEstimator::penalty(const TippingParams& params, double pen) const {
    const double a = std::max(params.a, kCurvatureFloor);
    if (a >= 1.0) return 0.0;
    return pen * static_cast<double>(m_segment.size()) * (1.0 / a - 1.0);
}

double TippingEstimator::objective(const TippingParams& params, double pen) const {
    double nll = negativeLogLikelihood(params);
    if (nll >= kObjectivePenalty) return kObjectivePenalty;
    return finiteOrPenalty(nll + penalty(params, pen));
}

TippingFitResult TippingEstimator::fit(double pen,
                                       const TippingParams& start,
                                       const TippingParams& step) const {
    TippingFitResult result;
    result.pen = pen;

    auto f = [this, pen](const std::vector<double>& p) -> double {
        return objective(TippingParams(p[0], p[1]), pen);
    };

    NelderMeadOptimizer optimizer(m_options);
    std::vector<double> best = optimizer.optimize(f,
                                                  {start.tau, start.a},
                                                  {step.tau, step.a},
                                                  result.objective);

    result.params = TippingParams(best[0], std::max(best[1], kCurvatureFloor));
    result.iterations = optimizer.getIterations();
    result.converged = optimizer.hasConverged() && result.objective < kObjectivePenalty;

    if (result.objective < kObjectivePenalty) {
        result.hessian = computeHessian(result.params, pen);
        if (result.hessian.isPositiveDefinite()) {
            // Covariance H^{-1} of the negative log-likelihood
            double det = result.hessian.determinant();
            result.seTau = std::sqrt(result.hessian.h22 / det);
            result.seA = std::sqrt(result.hessian.h11 / det);
        }
    }
    return result;
}

Hessian2 TippingEstimator::computeHessian(const TippingParams& params, double pen,
                                          double h_tau, double h_a) const {
    if (h_tau < 0) h_tau = 1e-3 * std::max(1.0, params.tau);
    if (h_a < 0) h_a = 1e-3 * std::max(1.0, params.a);

    auto eval = [this, &params, pen](double dtau, double da) -> double {
        TippingParams y(params.tau + dtau, std::max(params.a + da, kCurvatureFloor));
        return objective(y, pen);
    };

    // Central differences
    double f00 = eval(0, 0);
    double fpp = eval(+h_tau, +h_a);
    double fpm = eval(+h_tau, -h_a);
    double fmp = eval(-h_tau, +h_a);
    double fmm = eval(-h_tau, -h_a);
    double fxp = eval(+h_tau, 0);
    double fxm = eval(-h_tau, 0);
    double fyp = eval(0, +h_a);
    double fym = eval(0, -h_a);

    Hessian2 H;
    H.h11 = (fxp - 2*f00 + fxm) / (h_tau * h_tau);
    H.h22 = (fyp - 2*f00 + fym) / (h_a * h_a);
    H.h12 = (fpp - fpm - fmp + fmm) / (4 * h_tau * h_a);

    return H;
}

std::vector<double> TippingEstimator::residuals(const TippingParams& params) const {
    std::vector<double> r;
    r.reserve(m_segment.size() - 1);
    StrangTransition tr;
    for (std::size_t k = 0; k + 1 < m_segment.size(); ++k) {
        if (params.tau > 0.0 && transition(params, k, tr)) {
            r.push_back(tr.residual());
        } else {
            r.push_back(std::numeric_limits<double>::quiet_NaN());
        }
    }
    return r;
}

} // namespace TippingEstimation
