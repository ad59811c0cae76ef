#include "StandardNormalDistribution.hh"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace TippingSimulation {

static const double kPi = 3.14159265358979323846;

StandardNormalDistribution::StandardNormalDistribution()
{
}

StandardNormalDistribution::~StandardNormalDistribution()
{
}

// Probability density function
double StandardNormalDistribution::pdf(const double& x) const {
  return (1.0/std::sqrt(2.0 * kPi)) * std::exp(-0.5*x*x);
}

// Cumulative density function
double StandardNormalDistribution::cdf(const double& x) const {
  return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

// Inverse cumulative distribution function (aka the probit function)
double StandardNormalDistribution::inv_cdf(const double& quantile) const {
  if (!(quantile > 0.0 && quantile < 1.0)) {
    std::stringstream os;
    os << "Invalid input argument (" << quantile
       << "); must be larger than 0 but less than 1.";
    throw std::invalid_argument(os.str());
  }

  // Beasley-Springer-Moro, see Glasserman [2004]
  static const double a[4] = {   2.50662823884,
                               -18.61500062529,
                                41.39119773534,
                               -25.44106049637};

  static const double b[4] = {  -8.47351093090,
                                23.08336743743,
                               -21.06224101826,
                                 3.13082909833};

  static const double c[9] = {0.3374754822726147,
                              0.9761690190917186,
                              0.1607979714918209,
                              0.0276438810333863,
                              0.0038405729373609,
                              0.0003951896511919,
                              0.0000321767881768,
                              0.0000002888167364,
                              0.0000003960315187};

  if (quantile >= 0.5 && quantile <= 0.92) {
    double num = 0.0;
    double denom = 1.0;

    for (int i=0; i<4; i++) {
      num += a[i] * std::pow((quantile - 0.5), 2*i + 1);
      denom += b[i] * std::pow((quantile - 0.5), 2*i + 2);
    }
    return num/denom;

  } else if (quantile > 0.92) {
    double num = 0.0;

    for (int i=0; i<9; i++) {
      num += c[i] * std::pow((std::log(-std::log(1-quantile))), i);
    }
    return num;

  } else {
    return -1.0*inv_cdf(1-quantile);
  }
}

std::vector<double> StandardNormalDistribution::quantiles(std::size_t n) const {
  std::vector<double> q;
  q.reserve(n);
  for (std::size_t i = 1; i <= n; ++i) {
    q.push_back(inv_cdf((static_cast<double>(i) - 0.5) / static_cast<double>(n)));
  }
  return q;
}

double StandardNormalDistribution::KolmogorovSmirnovDistance(std::vector<double> sample) const {
  if (sample.empty()) return 0.0;
  std::sort(sample.begin(), sample.end());
  const double n = static_cast<double>(sample.size());
  double d = 0.0;
  for (std::size_t i = 0; i < sample.size(); ++i) {
    double F = cdf(sample[i]);
    double above = (static_cast<double>(i) + 1.0) / n - F;
    double below = F - static_cast<double>(i) / n;
    d = std::max(d, std::max(above, below));
  }
  return d;
}

} // namespace TippingSimulation
