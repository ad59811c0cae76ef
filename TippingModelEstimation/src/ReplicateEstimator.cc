/**
 * @file ReplicateEstimator.cc
 * @brief Implementation of the per-replicate estimation pipeline
 */

#include "ReplicateEstimator.hh"
#include <cmath>

namespace TippingEstimation {

ReplicateEstimator::ReplicateEstimator(const EstimationConfig& config)
    : m_config(config)
{
}

SegmentedTrace ReplicateEstimator::split(const Trace& trace) const {
    SegmentedTrace seg;
    const std::size_t n = trace.size();

    // First index with time >= t0 (small tolerance for grid round-off)
    std::size_t onset = 0;
    double k = (m_config.t0 - trace.startTime) / trace.delta;
    if (k > 0.0) {
        onset = static_cast<std::size_t>(std::ceil(k - 1e-6));
    }
    if (onset > n) onset = n;

    seg.baseline = Trace(trace.id, trace.startTime, trace.delta, std::vector<double>());
    for (std::size_t i = 0; i < onset && std::isfinite(trace.values[i]); ++i) {
        seg.baseline.values.push_back(trace.values[i]);
    }

    seg.postOnset = Trace(trace.id, trace.timeAt(onset), trace.delta, std::vector<double>());
    for (std::size_t i = onset; i < n && std::isfinite(trace.values[i]); ++i) {
        seg.postOnset.values.push_back(trace.values[i]);
    }
    while (!seg.postOnset.values.empty()
           && seg.postOnset.values.back() <= m_config.postOnsetThreshold) {
        seg.postOnset.values.pop_back();
        ++seg.droppedTrailing;
    }
    return seg;
}

ReplicateFit ReplicateEstimator::fitBaseline(const Trace& trace) const {
    ReplicateFit fit;
    fit.segments = split(trace);
    fit.row.replicate = trace.id;
    fit.row.nBaseline = fit.segments.baseline.size();
    fit.row.nPostOnset = fit.segments.postOnset.size();

    OUEstimator ou(trace.delta, m_config.ouOptimizer);
    fit.ou = ou.fit(fit.segments.baseline.values);
    fit.row.ou = fit.ou.params;
    fit.row.ouConverged = fit.ou.converged;
    return fit;
}

void ReplicateEstimator::fitTipping(ReplicateFit& fit, double pen) const {
    TippingEstimator tipping(fit.segments.postOnset, fit.ou.params, m_config.t0,
                             m_config.tippingOptimizer);
    fit.tipping = tipping.fit(pen, m_config.tippingStart);

    fit.row.tipping = fit.tipping.params;
    fit.row.tippingConverged = fit.tipping.converged;
    fit.row.pen = pen;
    fit.row.seTau = fit.tipping.seTau;
    fit.row.seA = fit.tipping.seA;
    fit.row.derived = DerivedQuantities::fromParams(fit.row.ou, fit.row.tipping, m_config.t0);
    fit.row.valid = true;
}

EstimateRow ReplicateEstimator::estimate(const Trace& trace, double pen) const {
    ReplicateFit fit = fitBaseline(trace);
    fitTipping(fit, pen);
    return fit.row;
}

} // namespace TippingEstimation
