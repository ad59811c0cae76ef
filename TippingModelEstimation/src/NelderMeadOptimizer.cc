/**
 * @file NelderMeadOptimizer.cc
 * @brief Implementation of Nelder-Mead simplex optimizer
 */

#include "NelderMeadOptimizer.hh"
#include "MathUtilities.hh"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace TippingEstimation {

NelderMeadOptimizer::NelderMeadOptimizer(const NelderMeadOptions& options)
    : m_options(options)
    , m_iterations(0)
    , m_converged(false)
{
}

void NelderMeadOptimizer::setOptions(const NelderMeadOptions& options) {
    m_options = options;
}

const NelderMeadOptions& NelderMeadOptimizer::getOptions() const {
    return m_options;
}

int NelderMeadOptimizer::getIterations() const {
    return m_iterations;
}

bool NelderMeadOptimizer::hasConverged() const {
    return m_converged;
}

double NelderMeadOptimizer::squaredDistance(const std::vector<double>& a,
                                            const std::vector<double>& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = a[i] - b[i];
        s += d * d;
    }
    return s;
}

std::vector<double> NelderMeadOptimizer::optimize(const Objective& objective,
                                                  const std::vector<double>& x0,
                                                  const std::vector<double>& step,
                                                  double& best_value)
{
    if (x0.empty() || step.size() != x0.size()) {
        std::ostringstream os;
        os << "NelderMeadOptimizer: start point of dimension " << x0.size()
           << " needs a step vector of the same dimension (got " << step.size() << ")";
        throw std::invalid_argument(os.str());
    }

    m_iterations = 0;
    m_converged = false;

    const int n = static_cast<int>(x0.size());
    const int m = n + 1;

    auto f = [&objective](const std::vector<double>& p) {
        return finiteOrPenalty(objective(p));
    };

    // Initialize simplex: x0 and x0 + step along each axis
    std::vector<std::vector<double>> x(m, x0);
    for (int i = 1; i < m; ++i) {
        x[i][i-1] += step[i-1];
    }

    std::vector<double> fx(m);
    for (int i = 0; i < m; ++i) {
        fx[i] = f(x[i]);
    }

    auto sort_simplex = [&]() {
        std::vector<int> idx(m);
        std::iota(idx.begin(), idx.end(), 0);
        std::stable_sort(idx.begin(), idx.end(), [&](int i, int j) {
            return fx[i] < fx[j];
        });
        std::vector<std::vector<double>> x2(m);
        std::vector<double> fx2(m);
        for (int k = 0; k < m; ++k) {
            x2[k] = x[idx[k]];
            fx2[k] = fx[idx[k]];
        }
        x.swap(x2);
        fx.swap(fx2);
    };

    sort_simplex();

    for (int iter = 0; iter < m_options.max_iter; ++iter) {
        m_iterations = iter + 1;

        // Check convergence
        double fspan = std::abs(fx[m-1] - fx[0]);
        double xspan = 0.0;
        for (int i = 1; i < m; ++i) {
            xspan = std::max(xspan, std::sqrt(squaredDistance(x[i], x[0])));
        }

        if (fspan < m_options.tol_f && xspan < m_options.tol_x) {
            m_converged = true;
            break;
        }

        // Centroid of all but the worst vertex
        std::vector<double> xc(n, 0.0);
        for (int i = 0; i < n; ++i) {
            for (int d = 0; d < n; ++d) {
                xc[d] += x[i][d];
            }
        }
        for (int d = 0; d < n; ++d) {
            xc[d] /= static_cast<double>(n);
        }

        // Reflection
        std::vector<double> xr(n);
        for (int d = 0; d < n; ++d) {
            xr[d] = xc[d] + m_options.alpha * (xc[d] - x[m-1][d]);
        }
        double fr = f(xr);

        if (fr < fx[0]) {
            // Try expansion
            std::vector<double> xe(n);
            for (int d = 0; d < n; ++d) {
                xe[d] = xc[d] + m_options.gamma * (xr[d] - xc[d]);
            }
                double fe = f(xe);

            if (fe < fr) {
                x[m-1] = xe;
                fx[m-1] = fe;
            } else {
                x[m-1] = xr;
                fx[m-1] = fr;
            }
        } else if (fr < fx[n-1]) {
            // Accept reflection
            x[m-1] = xr;
            fx[m-1] = fr;
        } else {
            // Contraction
            std::vector<double> xk(n);
            if (fr < fx[m-1]) {
                // Outside contraction
                for (int d = 0; d < n; ++d) {
                    xk[d] = xc[d] + m_options.rho * (xr[d] - xc[d]);
                }
            } else {
                // Inside contraction
                for (int d = 0; d < n; ++d) {
                    xk[d] = xc[d] - m_options.rho * (xc[d] - x[m-1][d]);
                }
            }
                double fk = f(xk);

            if (fk < std::min(fr, fx[m-1])) {
                x[m-1] = xk;
                fx[m-1] = fk;
            } else {
                // Shrink toward best point
                for (int i = 1; i < m; ++i) {
                    for (int d = 0; d < n; ++d) {
                        x[i][d] = x[0][d] + m_options.sigma * (x[i][d] - x[0][d]);
                    }
                    fx[i] = f(x[i]);
                }
            }
        }

        sort_simplex();
    }

    best_value = fx[0];
    return x[0];
}

} // namespace TippingEstimation
