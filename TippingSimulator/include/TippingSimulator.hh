#ifndef TIPPING_SIMULATOR_HH
#define TIPPING_SIMULATOR_HH

/**
 * @file TippingSimulator.hh
 * @brief Euler-Maruyama simulation of the ramped saddle-node SDE
 *
 *   dX = -(a (X - m)^2 + lambda(t)) dt + sigma dW
 *
 * The control level stays at lambda0 for a pre-ramp duration and then
 * decreases linearly, lambda(t) = lambda0 (1 - t/tau), t measured from
 * the start of the ramp. A trajectory terminates when it falls below
 * the barrier m - 2 or when the step cap is reached.
 */

#include "NoiseSource.hh"
#include <cstddef>
#include <string>
#include <vector>

namespace TippingSimulation {

/**
 * @brief Phases of the two-phase integrator
 */
enum class SimulationPhase {
    Stationary,  ///< lambda fixed at lambda0
    Ramping,     ///< lambda decreasing linearly over tau
    Terminated
};

/**
 * @brief Why a trajectory stopped
 */
enum class TerminationReason {
    None,
    Crossed,         ///< state fell below the barrier
    StepCapReached   ///< step cap exhausted before crossing
};

std::string toString(TerminationReason reason);

/**
 * @brief Inputs of one simulated trajectory
 */
struct SimulationSettings {
    double sigma;            ///< Noise scale (sqrt of infinitesimal variance)
    double lambda0;          ///< Initial control level
    double tau;              ///< Ramp duration
    double m;                ///< Mean shift
    double a;                ///< Curvature
    double preRampDuration;  ///< Time spent in the stationary phase
    double x0;               ///< Initial state
    double dt;               ///< Integration step
    std::size_t maxSteps;    ///< Cap on integration steps (both phases)

    SimulationSettings()
        : sigma(0.0), lambda0(-1.0), tau(100.0), m(0.0), a(1.0)
        , preRampDuration(0.0), x0(0.0), dt(0.01), maxSteps(10000) {}

    /// Barrier below which the trajectory is considered tipped
    double barrier() const { return m - 2.0; }
};

/**
 * @brief Simulated trajectory and its terminal outcome
 */
struct SimulationResult {
    std::vector<double> trajectory;  ///< X0 followed by one value per step
    double firstPassageTime;         ///< steps * dt at termination
    std::size_t stationarySteps;     ///< Steps integrated before the ramp
    TerminationReason reason;

    SimulationResult()
        : firstPassageTime(0.0), stationarySteps(0), reason(TerminationReason::None) {}

    bool crossed() const { return reason == TerminationReason::Crossed; }
};

/**
 * @class TippingSimulator
 * @brief Two-phase Euler-Maruyama integrator
 *
 * Holds a reference to the noise source; the caller owns it and must
 * keep it alive for the lifetime of the simulator.
 */
class TippingSimulator {
public:
    explicit TippingSimulator(NoiseSource& noise);

    /**
     * @brief Integrate one trajectory
     * @param settings Model and integration parameters
     * @return Trajectory, first-passage time and termination reason
     */
    SimulationResult simulate(const SimulationSettings& settings) const;

    /**
     * @brief Single Euler-Maruyama increment
     * @param x Current state
     * @param lambda Current control level
     * @param xi Standard-normal draw
     */
    static double eulerStep(double x, double lambda, double xi,
                            const SimulationSettings& settings);

private:
    NoiseSource& m_noise;
};

} // namespace TippingSimulation

#endif // TIPPING_SIMULATOR_HH
