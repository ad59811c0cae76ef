#ifndef NELDER_MEAD_OPTIMIZER_HH
#define NELDER_MEAD_OPTIMIZER_HH

/**
 * @file NelderMeadOptimizer.hh
 * @brief Nelder-Mead simplex optimizer for N-dimensional parameter spaces
 *
 * Derivative-free minimizer used by both the OU fit (3 parameters) and
 * the tipping fit (2 parameters).
 *
 * Objective contract: the objective should return a finite value for
 * every proposal. Infeasible or undefined proposals are expected to be
 * mapped to kObjectivePenalty by the objective itself; as a second line
 * the optimizer replaces any non-finite return value by kObjectivePenalty
 * before comparing vertices.
 */

#include "DataTypes.hh"
#include <functional>
#include <vector>

namespace TippingEstimation {

/**
 * @class NelderMeadOptimizer
 * @brief N-dimensional Nelder-Mead simplex optimizer
 *
 * The algorithm maintains a simplex of N+1 points and iteratively
 * improves it by reflection, expansion, contraction and shrinkage.
 */
class NelderMeadOptimizer {
public:
    typedef std::function<double(const std::vector<double>&)> Objective;

    /**
     * @brief Constructor with options
     * @param options Optimizer configuration
     */
    explicit NelderMeadOptimizer(const NelderMeadOptions& options = NelderMeadOptions());

    void setOptions(const NelderMeadOptions& options);
    const NelderMeadOptions& getOptions() const;

    /**
     * @brief Minimize the objective function
     *
     * @param objective Function to minimize
     * @param x0 Initial guess
     * @param step Initial step per coordinate for simplex construction
     * @param[out] best_value Optimal function value found
     * @return Best vertex of the final simplex
     */
    std::vector<double> optimize(const Objective& objective,
                                 const std::vector<double>& x0,
                                 const std::vector<double>& step,
                                 double& best_value);

    /**
     * @brief Get number of iterations used in last optimization
     */
    int getIterations() const;

    /**
     * @brief Whether the last optimization met both tolerances
     *
     * False means the iteration cap was hit and the returned point is
     * simply the last best vertex.
     */
    bool hasConverged() const;

private:
    static double squaredDistance(const std::vector<double>& a, const std::vector<double>& b);

    NelderMeadOptions m_options;
    int m_iterations;
    bool m_converged;
};

} // namespace TippingEstimation

#endif // NELDER_MEAD_OPTIMIZER_HH
