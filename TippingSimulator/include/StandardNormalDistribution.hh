#ifndef StandardNormalDistribution_h
#define StandardNormalDistribution_h
#include <cmath>
#include <vector>

namespace TippingSimulation {

class StandardNormalDistribution
{
 public:
  StandardNormalDistribution();
  ~StandardNormalDistribution();

  // Distribution functions
  double pdf(const double& x) const;
  double cdf(const double& x) const;

  // Inverse cumulative distribution function (aka the probit function),
  // throws std::invalid_argument outside (0,1)
  double inv_cdf(const double& quantile) const;

  // Plotting positions (i-0.5)/n mapped through inv_cdf, i = 1..n
  std::vector<double> quantiles(std::size_t n) const;

  // sup_x |F_n(x) - Phi(x)| for the empirical distribution of the sample
  double KolmogorovSmirnovDistance(std::vector<double> sample) const;
};

} // namespace TippingSimulation

#endif
