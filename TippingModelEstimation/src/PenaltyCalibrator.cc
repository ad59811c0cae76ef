/**
 * @file PenaltyCalibrator.cc
 * @brief Implementation of the cross-validated penalty calibration
 */

#include "PenaltyCalibrator.hh"
#include "MathUtilities.hh"
#include "TippingSimulator.hh"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace TippingEstimation {

MedianEstimates MedianEstimates::fromTable(const EstimateTable& table) {
    std::vector<double> alpha0, mu0, sigma2, tau, a;
    for (const auto& r : table.rows) {
        if (!r.valid) continue;
        alpha0.push_back(r.ou.alpha0);
        mu0.push_back(r.ou.mu0);
        sigma2.push_back(r.ou.sigma2);
        tau.push_back(r.tipping.tau);
        a.push_back(r.tipping.a);
    }

    MedianEstimates med;
    med.replicates = alpha0.size();
    med.ou = OUParams(median(alpha0), median(mu0), median(sigma2));
    med.tipping = TippingParams(median(tau), median(a));
    return med;
}

void PenaltySelection::print() const {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "=== Penalty Calibration ===\n";
    std::cout << "  ensemble size   = " << ensembleSize << "\n";
    std::cout << "  tau reference   = " << tauReference << "\n";
    std::cout << "  " << std::setw(10) << "pen" << std::setw(16) << "MSE(tau)"
              << std::setw(10) << "fitted" << "\n";
    for (size_t i = 0; i < penGrid.size(); ++i) {
        std::cout << "  " << std::setw(10) << penGrid[i]
                  << std::setw(16) << meanSquaredError[i]
                  << std::setw(10) << fittedReplicates[i]
                  << (i == bestIndex ? "  <-- selected" : "") << "\n";
    }
    std::cout << "===========================\n";
}

PenaltyCalibrator::PenaltyCalibrator(const EstimationConfig& config)
    : m_config(config)
    , m_replicate(config)
{
}

std::size_t PenaltyCalibrator::argminFirst(const std::vector<double>& values) {
    std::size_t best = 0;
    double bestValue = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::isfinite(values[i]) && values[i] < bestValue) {
            bestValue = values[i];
            best = i;
        }
    }
    return best;
}

std::vector<Trace> PenaltyCalibrator::simulateEnsemble(const MedianEstimates& medians,
                                                       const Trace& reference,
                                                       TippingSimulation::NoiseSource& noise) const {
    if (m_config.nloop < 1 || reference.empty()) {
        std::ostringstream os;
        os << "PenaltyCalibrator: need nloop >= 1 and a non-empty reference trace (nloop="
           << m_config.nloop << ", length=" << reference.size() << ")";
        throw std::invalid_argument(os.str());
    }

    const DerivedQuantities d = medians.derived(m_config.t0);
    const std::size_t nloop = static_cast<std::size_t>(m_config.nloop);
    const std::size_t length = reference.size();

    TippingSimulation::SimulationSettings s;
    s.sigma = std::sqrt(std::max(medians.ou.sigma2, 0.0));
    s.lambda0 = d.lambda0;
    s.tau = medians.tipping.tau;
    s.m = d.m;
    s.a = medians.tipping.a;
    s.preRampDuration = std::max(0.0, m_config.t0 - reference.startTime);
    s.dt = reference.delta / static_cast<double>(nloop);
    s.maxSteps = (length - 1) * nloop;

    const double sd0 = std::sqrt(medians.ou.stationaryVariance());

    TippingSimulation::TippingSimulator simulator(noise);
    std::vector<Trace> ensemble;
    ensemble.reserve(m_config.crossvalNsim);

    for (int i = 0; i < m_config.crossvalNsim; ++i) {
        s.x0 = medians.ou.mu0 + sd0 * noise.standardNormal();
        TippingSimulation::SimulationResult sim = simulator.simulate(s);

        std::ostringstream name;
        name << "cv" << (i + 1);
        Trace trace(name.str(), reference.startTime, reference.delta,
                    std::vector<double>(length, std::numeric_limits<double>::quiet_NaN()));
        for (std::size_t k = 0; k < length && k * nloop < sim.trajectory.size(); ++k) {
            trace.values[k] = sim.trajectory[k * nloop];
        }
        ensemble.push_back(trace);
    }
    return ensemble;
}

PenaltySelection PenaltyCalibrator::selectPenalty(const std::vector<Trace>& ensemble,
                                                  double tauReference) const {
    if (m_config.penGrid.empty()) {
        throw std::invalid_argument("PenaltyCalibrator: the pen grid is empty");
    }

    PenaltySelection sel;
    sel.penGrid = m_config.penGrid;
    sel.tauReference = tauReference;
    sel.ensembleSize = ensemble.size();
    sel.meanSquaredError.assign(sel.penGrid.size(), std::numeric_limits<double>::quiet_NaN());
    sel.fittedReplicates.assign(sel.penGrid.size(), 0);

    const int n = static_cast<int>(ensemble.size());

    // Baseline fits do not depend on pen: fit once, reuse for every grid point
    std::vector<ReplicateFit> baselines(n);
    std::vector<char> usable(n, 0);

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        try {
            baselines[i] = m_replicate.fitBaseline(ensemble[i]);
            usable[i] = 1;
        } catch (const std::invalid_argument& e) {
            if (m_config.verbose) {
                #pragma omp critical
                {
                    std::cerr << "Warning: skipping cross-validation replicate "
                              << ensemble[i].id << ": " << e.what() << std::endl;
                }
            }
        }
    }

    for (size_t g = 0; g < sel.penGrid.size(); ++g) {
        const double pen = sel.penGrid[g];
        std::vector<double> dev2(n, std::numeric_limits<double>::quiet_NaN());

        #pragma omp parallel for schedule(dynamic)
        for (int i = 0; i < n; ++i) {
            if (!usable[i]) continue;
            try {
                ReplicateFit fit = baselines[i];
                m_replicate.fitTipping(fit, pen);
                if (fit.tipping.objective < kObjectivePenalty) {
                    double dev = fit.row.tipping.tau - tauReference;
                    dev2[i] = dev * dev;
                }
            } catch (const std::invalid_argument& e) {
                if (m_config.verbose && g == 0) {
                    #pragma omp critical
                    {
                        std::cerr << "Warning: skipping cross-validation replicate "
                                  << ensemble[i].id << ": " << e.what() << std::endl;
                    }
                }
            }
        }

        sel.meanSquaredError[g] = mean(dev2);
        sel.fittedReplicates[g] = static_cast<int>(finiteValues(dev2).size());

        if (m_config.verbose) {
            std::cout << "  pen = " << std::setw(8) << std::setprecision(4) << pen
                      << "  MSE(tau) = " << std::setw(12) << sel.meanSquaredError[g]
                      << "  (" << sel.fittedReplicates[g] << "/" << n << " replicates)"
                      << std::endl;
        }
    }

    sel.bestIndex = argminFirst(sel.meanSquaredError);
    sel.pen = sel.penGrid[sel.bestIndex];
    if (!std::isfinite(sel.meanSquaredError[sel.bestIndex])) {
        std::cerr << "Warning: no cross-validation replicate could be fitted; "
                  << "falling back to pen = " << sel.pen << std::endl;
    }
    return sel;
}

PenaltySelection PenaltyCalibrator::calibrate(const MedianEstimates& medians,
                                              const Trace& reference,
                                              TippingSimulation::NoiseSource& noise) const {
    std::vector<Trace> ensemble = simulateEnsemble(medians, reference, noise);
    return selectPenalty(ensemble, medians.tipping.tau);
}

} // namespace TippingEstimation
