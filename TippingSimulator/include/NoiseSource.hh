#ifndef NOISE_SOURCE_HH
#define NOISE_SOURCE_HH

/**
 * @file NoiseSource.hh
 * @brief Injectable source of standard-normal increments
 *
 * All randomness of the simulator and of the cross-validation ensemble
 * is drawn through this interface, so estimation code stays
 * deterministic and a test can substitute a fixed sequence.
 */

#include <random>

namespace TippingSimulation {

/**
 * @class NoiseSource
 * @brief Abstract generator of independent N(0,1) draws
 */
class NoiseSource {
public:
    virtual ~NoiseSource() {}

    /**
     * @brief Draw one standard-normal variate
     */
    virtual double standardNormal() = 0;
};

/**
 * @class MersenneNoiseSource
 * @brief Seeded std::mt19937 backed noise source
 */
class MersenneNoiseSource : public NoiseSource {
public:
    explicit MersenneNoiseSource(unsigned long long seed = 5489u);

    double standardNormal() override;

    /**
     * @brief Reset the engine (reproducible Monte Carlo)
     */
    void setSeed(unsigned long long seed);

private:
    std::mt19937 m_engine;
    std::normal_distribution<double> m_normal;
};

} // namespace TippingSimulation

#endif // NOISE_SOURCE_HH
