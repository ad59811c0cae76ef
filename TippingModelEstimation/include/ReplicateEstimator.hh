#ifndef REPLICATE_ESTIMATOR_HH
#define REPLICATE_ESTIMATOR_HH

/**
 * @file ReplicateEstimator.hh
 * @brief Two-stage estimation of a single replicate
 *
 * 1. Split the trace at the onset time t0 into a baseline segment
 *    (time < t0) and a post-onset segment (time >= t0).
 * 2. Drop the trailing post-onset observations at or below the
 *    configured threshold (the trajectory has already tipped there).
 * 3. Fit the OU model to the baseline.
 * 4. Fit the tipping model to the post-onset segment conditioned on
 *    the OU parameters.
 */

#include "DataTypes.hh"
#include "OUEstimator.hh"
#include "TippingEstimator.hh"

namespace TippingEstimation {

/**
 * @brief Baseline and post-onset parts of a trace
 */
struct SegmentedTrace {
    Trace baseline;
    Trace postOnset;
    std::size_t droppedTrailing;  ///< Post-onset points removed by the threshold filter

    SegmentedTrace() : droppedTrailing(0) {}
};

/**
 * @brief Intermediate and final results of one replicate
 */
struct ReplicateFit {
    SegmentedTrace segments;
    OUFitResult ou;
    TippingFitResult tipping;
    EstimateRow row;
};

/**
 * @class ReplicateEstimator
 * @brief Split, OU fit and tipping fit of one replicate
 *
 * Stateless apart from a copy of the configuration; safe to share
 * across OpenMP threads.
 */
class ReplicateEstimator {
public:
    explicit ReplicateEstimator(const EstimationConfig& config);

    /**
     * @brief Split a trace at t0 and filter the post-onset tail
     *
     * Both segments stop at the first missing value.
     */
    SegmentedTrace split(const Trace& trace) const;

    /**
     * @brief Split and fit the baseline OU model
     * @throws std::invalid_argument if the baseline is too short
     */
    ReplicateFit fitBaseline(const Trace& trace) const;

    /**
     * @brief Fit the tipping model on top of a baseline fit and fill the row
     * @throws std::invalid_argument if the post-onset segment is too short
     */
    void fitTipping(ReplicateFit& fit, double pen) const;

    /**
     * @brief Full two-stage estimation of one replicate
     */
    EstimateRow estimate(const Trace& trace, double pen) const;

    const EstimationConfig& getConfig() const { return m_config; }

private:
    EstimationConfig m_config;
};

} // namespace TippingEstimation

#endif // REPLICATE_ESTIMATOR_HH
