/**
 * @file test_tipping_estimator.cc
 * @brief Test program for the Strang-splitting tipping estimator
 *
 * Checks:
 * 1. Strang transition bookkeeping at the onset
 * 2. Penalty is strictly increasing in pen for a < 1 and absent for a >= 1
 * 3. Objective is the Gaussian NLL of the transitions plus the penalty
 * 4. Recovery of (tau, a) at pen = 0 with the true OU parameters
 * 5. Standard errors against the replicate spread
 * 6. Derived quantities are a pure function of the stored parameters
 * 7. Residuals of a well-specified fit look standard normal
 */

#include "TippingEstimator.hh"
#include "ReplicateEstimator.hh"
#include "ResidualDiagnostics.hh"
#include "MathUtilities.hh"
#include "TippingSimulator.hh"
#include "NoiseSource.hh"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace TippingEstimation;

namespace {

int g_failures = 0;

void check(bool condition, const std::string& what) {
    std::cout << "  [" << (condition ? " OK " : "FAIL") << "] " << what << "\n";
    if (!condition) ++g_failures;
}

const double kDelta = 1.0 / 12.0;
const double kStart = 1870.0;
const double kOnset = 1924.0;
const int kNloop = 10;

/**
 * @brief Monthly trace of the tipping model, stationary until kOnset
 */
Trace simulateTrace(const OUParams& ou, const TippingParams& tip, std::size_t postPoints,
                    TippingSimulation::NoiseSource& noise, const std::string& id) {
    const DerivedQuantities d = DerivedQuantities::fromParams(ou, tip, kOnset);
    const std::size_t baseline = static_cast<std::size_t>(std::lround((kOnset - kStart) / kDelta));
    const std::size_t length = baseline + postPoints;

    TippingSimulation::SimulationSettings s;
    s.sigma = std::sqrt(ou.sigma2);
    s.lambda0 = d.lambda0;
    s.tau = tip.tau;
    s.m = d.m;
    s.a = tip.a;
    s.preRampDuration = kOnset - kStart;
    s.dt = kDelta / kNloop;
    s.maxSteps = (length - 1) * kNloop;
    s.x0 = ou.mu0 + std::sqrt(ou.stationaryVariance()) * noise.standardNormal();

    TippingSimulation::TippingSimulator simulator(noise);
    TippingSimulation::SimulationResult sim = simulator.simulate(s);

    std::vector<double> values(length, std::nan(""));
    for (std::size_t k = 0; k < length && k * kNloop < sim.trajectory.size(); ++k) {
        values[k] = sim.trajectory[k * kNloop];
    }
    return Trace(id, kStart, kDelta, values);
}

} // namespace

int main() {
    std::cout << "========================================\n";
    std::cout << "Tipping Estimator Test\n";
    std::cout << "========================================\n\n";
    std::cout << std::fixed << std::setprecision(4);

    const OUParams ou(3.0, 0.25, 0.033);
    const TippingParams truth(130.0, 0.9);
    TippingSimulation::MersenneNoiseSource noise(1924);

    EstimationConfig config;
    config.t0 = kOnset;
    config.verbose = false;
    ReplicateEstimator replicate(config);

    Trace first = simulateTrace(ou, truth, 1000, noise, "rep1");
    SegmentedTrace seg = replicate.split(first);
    TippingEstimator estimator(seg.postOnset, ou, kOnset, config.tippingOptimizer);

    // --- 1. Transition ---
    std::cout << "--- Strang transition at the onset ---\n";
    {
        const DerivedQuantities d = DerivedQuantities::fromParams(ou, truth, kOnset);
        StrangTransition tr;
        bool ok = estimator.transition(truth, 0, tr);
        check(ok, "first transition is defined");
        check(std::abs(tr.lambda - d.lambda0) < 1e-9, "control level at the onset is lambda0");
        check(std::abs(tr.mu - ou.mu0) < 1e-9, "fixed point at the onset is mu0");
        check(tr.variance > 0.0, "positive transition variance");

        // Past the end of the ramp the control level is non-negative
        TippingParams shortRamp(1.0, truth.a);
        check(!estimator.transition(shortRamp, 100, tr), "no transition once lambda >= 0");
        check(estimator.negativeLogLikelihood(shortRamp) == kObjectivePenalty, "likelihood is the penalty value");
        check(estimator.objective(TippingParams(-5.0, 1.0), 0.0) == kObjectivePenalty, "tau <= 0 is the penalty value");
    }

    // --- 2. Penalty monotonicity ---
    std::cout << "\n--- Penalty monotonicity at fixed (tau, a) ---\n";
    {
        const double pens[] = {0.0, 0.025, 0.1, 0.4, 0.8};
        bool strict = true;
        bool flat = true;
        TippingParams low(130.0, 0.6);
        TippingParams high(130.0, 1.4);
        double prevLow = estimator.objective(low, pens[0]);
        const double flatValue = estimator.objective(high, pens[0]);
        for (size_t i = 1; i < 5; ++i) {
            double vLow = estimator.objective(low, pens[i]);
            if (!(vLow > prevLow)) strict = false;
            prevLow = vLow;
            if (estimator.objective(high, pens[i]) != flatValue) flat = false;
        }
        check(prevLow < kObjectivePenalty, "objective at a = 0.6 is finite");
        check(strict, "a = 0.6: objective strictly increases with pen");
        check(flat, "a = 1.4: objective does not depend on pen");
        check(estimator.penalty(TippingParams(130.0, 1.0), 0.8) == 0.0, "no penalty at a = 1");
        check(std::abs(estimator.penalty(TippingParams(130.0, 0.5), 0.1)
                       - 0.1 * seg.postOnset.size()) < 1e-9, "penalty is pen * n * (1/a - 1)");
    }

    // --- 3. Objective scale ---
    std::cout << "\n--- Objective against the transition densities ---\n";
    {
        const double kLog2Pi = std::log(2.0 * 3.14159265358979323846);
        TippingParams p(130.0, 0.6);
        double nll = 0.0;
        StrangTransition tr;
        bool defined = true;
        for (std::size_t k = 0; k + 1 < seg.postOnset.size(); ++k) {
            if (!estimator.transition(p, k, tr)) {
                defined = false;
                break;
            }
            double r = tr.transformed - tr.mean;
            nll += 0.5 * (kLog2Pi + std::log(tr.variance) + r * r / tr.variance) - tr.logJacobian;
        }
        const double n = static_cast<double>(seg.postOnset.size());
        const double constant = 0.5 * (n - 1.0) * kLog2Pi;
        const double base = estimator.objective(p, 0.0);
        std::cout << "  summed NLL = " << nll << ", objective + constant = " << base + constant << "\n";
        check(defined, "every transition is defined at (130, 0.6)");
        check(std::abs(base + constant - nll) < 1e-8 * std::max(1.0, std::abs(nll)),
              "pen = 0 objective is the negative log-likelihood");

        const double expected = n * (1.0 / 0.6 - 1.0);
        const double added = estimator.objective(p, 1.0) - base;
        std::cout << "  pen = 1 adds " << added << " (n (1/a - 1) = " << expected << ")\n";
        check(std::abs(added - expected) < 1e-6 * expected, "pen = 1 adds n (1/a - 1) to the NLL");
        check(std::abs(estimator.objective(p, 0.4) - base - 0.4 * expected) < 1e-6 * expected,
              "penalty scales linearly with pen");
    }

    // --- 4. Recovery and standard errors ---
    std::cout << "\n--- Recovery at pen = 0 (median of 12 replicates) ---\n";
    std::vector<double> tau, a, seTau, seA;
    {
        for (int r = 0; r < 12; ++r) {
            std::ostringstream id;
            id << "rep" << r + 1;
            Trace trace = (r == 0) ? first : simulateTrace(ou, truth, 1000, noise, id.str());
            SegmentedTrace s = replicate.split(trace);
            TippingEstimator est(s.postOnset, ou, kOnset, config.tippingOptimizer);
            TippingFitResult fit = est.fit(0.0, config.tippingStart);
            std::cout << "  " << std::setw(6) << trace.id << ": tau = " << std::setw(9) << fit.params.tau
                      << ", a = " << fit.params.a << (fit.converged ? "" : "  (not converged)") << "\n";
            tau.push_back(fit.params.tau);
            a.push_back(fit.params.a);
            seTau.push_back(fit.seTau);
            seA.push_back(fit.seA);
        }
        double medTau = median(tau);
        double medA = median(a);
        std::cout << "  median: tau = " << medTau << ", a = " << medA << "\n";
        check(std::abs(medTau - truth.tau) < 0.15 * truth.tau, "tau within 15%");
        check(std::abs(medA - truth.a) < 0.20 * truth.a, "a within 20%");
    }

    // --- 5. Standard errors ---
    std::cout << "\n--- Standard errors ---\n";
    {
        // Scaled median absolute deviation
        auto spread = [](const std::vector<double>& x) {
            double m = median(x);
            std::vector<double> dev;
            for (double v : x) dev.push_back(std::abs(v - m));
            return 1.4826 * median(dev);
        };
        const double sdTau = spread(tau);
        const double sdA = spread(a);
        const double medSeTau = median(seTau);
        const double medSeA = median(seA);
        std::cout << "  tau: median se = " << medSeTau << ", replicate sd = " << sdTau << "\n";
        std::cout << "  a:   median se = " << medSeA << ", replicate sd = " << sdA << "\n";
        check(std::isfinite(medSeTau) && std::isfinite(medSeA), "standard errors are available");
        check(medSeTau > sdTau / 3.0 && medSeTau < 3.0 * sdTau, "se(tau) matches the replicate spread");
        check(medSeA > sdA / 3.0 && medSeA < 3.0 * sdA, "se(a) matches the replicate spread");

        TippingFitResult fit = estimator.fit(0.0, config.tippingStart);
        Hessian2 h = estimator.computeHessian(fit.params, 0.0);
        check(h.isPositiveDefinite(), "Hessian at the optimum is positive definite");
        check(std::abs(fit.seTau - std::sqrt(h.h22 / h.determinant())) < 1e-9 * fit.seTau,
              "se(tau) is the square root of the inverse-Hessian diagonal");

        EstimateRow row = replicate.estimate(first, 0.0);
        check(std::isfinite(row.seTau) && row.seTau > 0.0 && std::isfinite(row.seA) && row.seA > 0.0,
              "estimate row carries the standard errors");
    }

    // --- 6. Derived quantities ---
    std::cout << "\n--- Derived quantities ---\n";
    {
        EstimateRow row = replicate.estimate(first, 0.0);
        DerivedQuantities again = DerivedQuantities::fromParams(row.ou, row.tipping, config.t0);
        check(row.valid, "replicate was fitted");
        check(again.m == row.derived.m && again.lambda0 == row.derived.lambda0 && again.tc == row.derived.tc,
              "m, lambda0 and tc reproduce exactly");
        check(row.derived.tc == row.tipping.tau + config.t0, "tc = tau + t0");
    }

    // --- 7. Residuals ---
    std::cout << "\n--- Residuals at the true parameters ---\n";
    {
        ResidualReport report = ResidualDiagnostics::summarize(estimator.residuals(truth));
        std::cout << "  mean = " << report.mean << ", sd = " << report.standardDeviation
                  << ", KS = " << report.ksDistance << "\n";
        check(report.residuals.size() == seg.postOnset.size() - 1, "one residual per transition");
        check(report.undefined == 0, "every residual is defined");
        check(std::abs(report.mean) < 0.15, "mean near 0");
        check(std::abs(report.standardDeviation - 1.0) < 0.1, "standard deviation near 1");
        check(report.qq.size() == report.residuals.size(), "QQ table has one point per residual");

        bool threw = false;
        try {
            Trace tiny("tiny", kOnset, kDelta, std::vector<double>{0.2, 0.1});
            TippingEstimator bad(tiny, ou, kOnset);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "segments shorter than 3 points are rejected");
    }

    std::cout << "\n========================================\n";
    if (g_failures == 0) {
        std::cout << "Tipping estimator test completed successfully!\n";
    } else {
        std::cout << g_failures << " check(s) FAILED\n";
    }
    std::cout << "========================================\n";
    return g_failures == 0 ? 0 : 1;
}
