/**
 * @file TippingSimulator.cc
 * @brief Implementation of the two-phase Euler-Maruyama integrator
 */

#include "TippingSimulator.hh"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace TippingSimulation {

std::string toString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::Crossed:        return "crossed";
        case TerminationReason::StepCapReached: return "step_cap";
        default:                                return "none";
    }
}

TippingSimulator::TippingSimulator(NoiseSource& noise)
    : m_noise(noise)
{
}

double TippingSimulator::eulerStep(double x, double lambda, double xi,
                                   const SimulationSettings& s) {
    double d = x - s.m;
    return x - s.a * d * d * s.dt - lambda * s.dt + std::sqrt(s.dt) * s.sigma * xi;
}

SimulationResult TippingSimulator::simulate(const SimulationSettings& settings) const {
    if (!(settings.dt > 0.0)) {
        std::ostringstream os;
        os << "TippingSimulator: integration step must be positive (dt=" << settings.dt << ")";
        throw std::invalid_argument(os.str());
    }

    SimulationResult result;
    result.trajectory.reserve(settings.maxSteps + 1);
    result.trajectory.push_back(settings.x0);

    const double barrier = settings.barrier();
    const std::size_t preRampSteps = settings.preRampDuration > 0.0
        ? static_cast<std::size_t>(std::llround(settings.preRampDuration / settings.dt))
        : 0;

    double x = settings.x0;
    std::size_t steps = 0;
    std::size_t rampSteps = 0;
    SimulationPhase phase = preRampSteps > 0 ? SimulationPhase::Stationary
                                             : SimulationPhase::Ramping;

    while (phase != SimulationPhase::Terminated) {
        if (steps >= settings.maxSteps) {
            result.reason = TerminationReason::StepCapReached;
            phase = SimulationPhase::Terminated;
            break;
        }

        double lambda = settings.lambda0;
        if (phase == SimulationPhase::Ramping) {
            double t = static_cast<double>(rampSteps) * settings.dt;
            lambda = settings.lambda0 * (1.0 - t / settings.tau);
        }

        x = eulerStep(x, lambda, m_noise.standardNormal(), settings);
        result.trajectory.push_back(x);
        ++steps;

        if (phase == SimulationPhase::Stationary) {
            result.stationarySteps = steps;
            if (steps >= preRampSteps) phase = SimulationPhase::Ramping;
        } else {
            ++rampSteps;
        }

        if (x < barrier) {
            result.reason = TerminationReason::Crossed;
            phase = SimulationPhase::Terminated;
        }
    }

    result.firstPassageTime = static_cast<double>(steps) * settings.dt;
    return result;
}

} // namespace TippingSimulation
