/**
 * @file DataTypes.cc
 * @brief Implementation of data type methods
 */

#include "DataTypes.hh"
#include <iostream>
#include <iomanip>

namespace TippingEstimation {

void EstimationConfig::print() const {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "=== Estimation Configuration ===\n";
    std::cout << "  delta              = " << delta << "\n";
    std::cout << "  start time         = " << startTime << "\n";
    std::cout << "  onset time t0      = " << t0 << "\n";
    std::cout << "  post-onset cutoff  = " << postOnsetThreshold << "\n";
    std::cout << "  start (tau, a)     = (" << tippingStart.tau << ", " << tippingStart.a << ")\n";
    std::cout << "  crossval_nsim      = " << crossvalNsim << "\n";
    std::cout << "  nloop              = " << nloop << "\n";
    std::cout << "  pen grid           = {";
    for (size_t i = 0; i < penGrid.size(); ++i) {
        std::cout << (i ? ", " : "") << penGrid[i];
    }
    std::cout << "}\n";
    std::cout << "  seed               = " << seed << "\n";
    std::cout << "================================\n";
}

std::vector<std::string> EstimateTable::columnNames() const {
    std::vector<std::string> names = {
        "alpha0", "mu0", "lambda0", "tau", "s2", "m", "a", "tc"
    };
    if (includePen) names.push_back("pen");
    names.push_back("se_tau");
    names.push_back("se_a");
    names.push_back("ou_converged");
    names.push_back("tip_converged");
    names.push_back("n_baseline");
    names.push_back("n_post");
    return names;
}

std::vector<double> EstimateTable::rowValues(std::size_t i) const {
    const EstimateRow& r = rows.at(i);
    std::vector<double> v = {
        r.ou.alpha0, r.ou.mu0, r.derived.lambda0, r.tipping.tau,
        r.ou.sigma2, r.derived.m, r.tipping.a, r.derived.tc
    };
    if (includePen) v.push_back(r.pen);
    v.push_back(r.seTau);
    v.push_back(r.seA);
    v.push_back(r.ouConverged ? 1.0 : 0.0);
    v.push_back(r.tippingConverged ? 1.0 : 0.0);
    v.push_back(static_cast<double>(r.nBaseline));
    v.push_back(static_cast<double>(r.nPostOnset));
    return v;
}

std::size_t EstimateTable::convergenceFailures() const {
    std::size_t n = 0;
    for (const auto& r : rows) {
        if (r.valid && !(r.ouConverged && r.tippingConverged)) ++n;
    }
    return n;
}

} // namespace TippingEstimation
