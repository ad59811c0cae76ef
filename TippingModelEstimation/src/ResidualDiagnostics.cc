/**
 * @file ResidualDiagnostics.cc
 * @brief Implementation of residual diagnostics
 */

#include "ResidualDiagnostics.hh"
#include "MathUtilities.hh"
#include "StandardNormalDistribution.hh"
#include "TippingEstimator.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace TippingEstimation {

void ResidualReport::print() const {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "=== Residual Diagnostics: " << replicate << " ===\n";
    std::cout << "  residuals   = " << residuals.size()
              << " (" << undefined << " undefined)\n";
    std::cout << "  mean        = " << mean << "\n";
    std::cout << "  std. dev.   = " << standardDeviation << "\n";
    std::cout << "  KS distance = " << ksDistance << "\n";
}

ResidualReport ResidualDiagnostics::summarize(const std::vector<double>& residuals) {
    ResidualReport report;
    report.residuals = residuals;

    std::vector<double> r = finiteValues(residuals);
    report.undefined = residuals.size() - r.size();
    if (r.empty()) {
        report.mean = report.standardDeviation = std::numeric_limits<double>::quiet_NaN();
        report.ksDistance = std::numeric_limits<double>::quiet_NaN();
        return report;
    }

    report.mean = mean(r);
    double ss = 0.0;
    for (double v : r) ss += (v - report.mean) * (v - report.mean);
    report.standardDeviation = (r.size() > 1) ? std::sqrt(ss / (r.size() - 1)) : 0.0;

    TippingSimulation::StandardNormalDistribution normal;
    report.ksDistance = normal.KolmogorovSmirnovDistance(r);

    std::sort(r.begin(), r.end());
    std::vector<double> q = normal.quantiles(r.size());
    report.qq.reserve(r.size());
    for (size_t i = 0; i < r.size(); ++i) {
        QQPoint p;
        p.theoretical = q[i];
        p.sample = r[i];
        report.qq.push_back(p);
    }
    return report;
}

ResidualReport ResidualDiagnostics::analyze(const EstimateRow& row, const Trace& postOnset, double t0) {
    TippingEstimator estimator(postOnset, row.ou, t0);
    ResidualReport report = summarize(estimator.residuals(row.tipping));
    report.replicate = row.replicate;
    return report;
}

} // namespace TippingEstimation
