#ifndef DATA_TYPES_HH
#define DATA_TYPES_HH

/**
 * @file DataTypes.hh
 * @brief Data structures for tipping-point estimation
 *
 * Defines the core data types used in the estimation pipeline:
 * - Trace: one replicate time series on a uniform grid
 * - OUParams / TippingParams: fitted parameter sets
 * - DerivedQuantities: m, lambda0 and tc computed from a fit
 * - EstimationConfig: dataset-wide constants shared by all fits
 * - NelderMeadOptions: optimizer configuration
 * - EstimateRow / EstimateTable: per-replicate results
 */

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace TippingEstimation {

/**
 * @brief One replicate time series on a uniform time grid
 *
 * Missing observations (NA cells, padding of early-tipped
 * simulations) are stored as NaN.
 */
struct Trace {
    std::string id;              ///< Replicate identifier
    double startTime;            ///< Absolute time of values[0]
    double delta;                ///< Observation time step
    std::vector<double> values;  ///< Observations

    Trace() : startTime(0.0), delta(1.0 / 12.0) {}
    Trace(const std::string& name, double t_start, double dt, const std::vector<double>& x)
        : id(name), startTime(t_start), delta(dt), values(x) {}

    std::size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }

    /// Absolute time of observation k
    double timeAt(std::size_t k) const {
        return startTime + static_cast<double>(k) * delta;
    }
};

/**
 * @brief Stationary Ornstein-Uhlenbeck parameters
 *
 *   dX = -alpha0 (X - mu0) dt + sqrt(sigma2) dW
 */
struct OUParams {
    double alpha0;  ///< Decay rate (>0)
    double mu0;     ///< Mean level
    double sigma2;  ///< Infinitesimal variance (>=0)

    OUParams() : alpha0(1.0), mu0(0.0), sigma2(0.0) {}
    OUParams(double alpha, double mu, double s2) : alpha0(alpha), mu0(mu), sigma2(s2) {}

    /// Variance of the stationary distribution sigma2 / (2 alpha0)
    double stationaryVariance() const {
        return (alpha0 > 0) ? sigma2 / (2.0 * alpha0) : 0.0;
    }
};

/**
 * @brief Tipping-model parameters estimated from the post-onset segment
 */
struct TippingParams {
    double tau;  ///< Ramp duration (>0)
    double a;    ///< Curvature coefficient (>0)

    TippingParams() : tau(100.0), a(1.0) {}
    TippingParams(double tau_val, double a_val) : tau(tau_val), a(a_val) {}
};

/**
 * @brief Quantities that are pure functions of (alpha0, mu0, a, tau, t0)
 */
struct DerivedQuantities {
    double m;        ///< Mean shift mu0 - alpha0/(2a)
    double lambda0;  ///< Stationary control level -alpha0^2/(4a)
    double tc;       ///< Critical time tau + t0

    DerivedQuantities() : m(0.0), lambda0(0.0), tc(0.0) {}

    /**
     * @brief Compute the derived quantities of a fit
     * @param ou Baseline OU parameters
     * @param tip Tipping parameters
     * @param t0 Onset time
     */
    static DerivedQuantities fromParams(const OUParams& ou, const TippingParams& tip, double t0) {
        DerivedQuantities d;
        d.m = ou.mu0 - ou.alpha0 / (2.0 * tip.a);
        d.lambda0 = -ou.alpha0 * ou.alpha0 / (4.0 * tip.a);
        d.tc = tip.tau + t0;
        return d;
    }
};

/**
 * @brief Options for Nelder-Mead optimizer
 */
struct NelderMeadOptions {
    int max_iter;      ///< Maximum iterations
    double tol_f;      ///< Tolerance on function value
    double tol_x;      ///< Tolerance on parameter values
    double alpha;      ///< Reflection coefficient
    double gamma;      ///< Expansion coefficient
    double rho;        ///< Contraction coefficient
    double sigma;      ///< Shrink coefficient

    NelderMeadOptions()
        : max_iter(2000)
        , tol_f(1e-8)
        , tol_x(1e-6)
        , alpha(1.0)
        , gamma(2.0)
        , rho(0.5)
        , sigma(0.5)
    {}
};

/**
 * @brief Dataset-wide constants of an estimation run
 *
 * Built once (defaults, then command-line overrides) and passed by
 * const reference to every estimator; never modified during a run.
 */
struct EstimationConfig {
    double delta;                   ///< Observation step (years)
    double startTime;               ///< Time of the first observation
    double t0;                      ///< Onset time shared by all datasets
    double postOnsetThreshold;      ///< Trailing post-onset values at or below this are dropped
    TippingParams tippingStart;     ///< Starting point of the tipping fit
    int crossvalNsim;               ///< Cross-validation replicates
    int nloop;                      ///< Integration sub-steps per observation step
    std::vector<double> penGrid;    ///< Candidate penalization weights
    unsigned long long seed;        ///< Seed of the cross-validation noise
    int numThreads;                 ///< OpenMP threads (0 = runtime default)
    bool verbose;                   ///< Progress output on std::cout
    NelderMeadOptions ouOptimizer;
    NelderMeadOptions tippingOptimizer;

    EstimationConfig()
        : delta(1.0 / 12.0)
        , startTime(1870.0)
        , t0(1924.0)
        , postOnsetThreshold(-1.2)
        , tippingStart(100.0, 1.0)
        , crossvalNsim(100)
        , nloop(10)
        , penGrid({0.0, 0.025, 0.05, 0.1, 0.2, 0.4, 0.8})
        , seed(1234)
        , numThreads(0)
        , verbose(true)
    {
        ouOptimizer.max_iter = 3000;
        ouOptimizer.tol_f = 1e-10;
        ouOptimizer.tol_x = 1e-8;
        tippingOptimizer.max_iter = 3000;
        tippingOptimizer.tol_f = 1e-10;
        tippingOptimizer.tol_x = 1e-8;
    }

    /**
     * @brief Print configuration
     */
    void print() const;
};

/**
 * @brief 2x2 Hessian matrix for parameter uncertainty
 */
struct Hessian2 {
    double h11;  ///< d2f/dtau2
    double h12;  ///< d2f/dtau da
    double h22;  ///< d2f/da2

    Hessian2() : h11(0.0), h12(0.0), h22(0.0) {}

    double determinant() const {
        return h11 * h22 - h12 * h12;
    }

    bool isPositiveDefinite() const {
        return h11 > 0 && determinant() > 0;
    }
};

/**
 * @brief One row of the estimate table
 */
struct EstimateRow {
    std::string replicate;
    OUParams ou;
    TippingParams tipping;
    DerivedQuantities derived;
    double pen;
    double seTau;  ///< Standard error of tau (NaN if the Hessian is not positive definite)
    double seA;    ///< Standard error of a
    bool ouConverged;
    bool tippingConverged;
    std::size_t nBaseline;
    std::size_t nPostOnset;
    bool valid;  ///< False when the replicate could not be fitted

    EstimateRow()
        : pen(0.0)
        , seTau(std::numeric_limits<double>::quiet_NaN())
        , seA(std::numeric_limits<double>::quiet_NaN())
        , ouConverged(false), tippingConverged(false)
        , nBaseline(0), nPostOnset(0), valid(false) {}

    /// Mark the estimates of an unfittable replicate as missing
    void setMissing() {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        ou = OUParams(nan, nan, nan);
        tipping = TippingParams(nan, nan);
        derived.m = derived.lambda0 = derived.tc = nan;
        seTau = seA = nan;
        valid = false;
    }
};

/**
 * @brief Estimates of all replicates of one dataset
 */
struct EstimateTable {
    std::string dataset;
    std::vector<EstimateRow> rows;
    bool includePen;

    EstimateTable() : includePen(false) {}

    /// Column names of the exported table
    std::vector<std::string> columnNames() const;

    /// Numeric cells of row i, in columnNames() order (replicate excluded)
    std::vector<double> rowValues(std::size_t i) const;

    std::size_t convergenceFailures() const;
};

} // namespace TippingEstimation

#endif // DATA_TYPES_HH
