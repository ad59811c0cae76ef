#ifndef BATCH_ESTIMATOR_HH
#define BATCH_ESTIMATOR_HH

/**
 * @file BatchEstimator.hh
 * @brief Dataset-level orchestration of the estimation pipeline
 *
 * For every dataset:
 * 1. pen = 0 pass over all replicates
 * 2. column medians of the pen = 0 estimates
 * 3. penalty calibration on a simulated ensemble at the medians
 * 4. final pass over all replicates at the selected pen
 *
 * Replicate fits are independent and run in an OpenMP parallel loop;
 * each thread writes only its own row.
 */

#include "DataTypes.hh"
#include "PenaltyCalibrator.hh"
#include "ReplicateEstimator.hh"
#include "ResidualDiagnostics.hh"
#include "NoiseSource.hh"
#include <string>
#include <vector>

namespace TippingEstimation {

/**
 * @brief All replicate traces of one synthetic model
 */
struct Dataset {
    std::string name;
    std::vector<Trace> replicates;
};

/**
 * @brief Everything produced for one dataset
 */
struct DatasetResult {
    EstimateTable initial;       ///< pen = 0 pass
    MedianEstimates medians;     ///< Medians of the pen = 0 pass
    PenaltySelection selection;  ///< Calibrated pen
    EstimateTable final;         ///< Pass at the selected pen
};

/**
 * @class BatchEstimator
 * @brief Runs the two-stage estimation over datasets and replicates
 */
class BatchEstimator {
public:
    explicit BatchEstimator(const EstimationConfig& config);

    /**
     * @brief Fit every replicate of a dataset at a fixed pen
     *
     * Replicates that cannot be fitted keep a row with NaN estimates.
     *
     * @param includePen Whether the exported table carries a pen column
     */
    EstimateTable estimateDataset(const Dataset& dataset, double pen, bool includePen = false) const;

    /**
     * @brief pen = 0 pass, calibration, and final pass for one dataset
     * @param noise Source of randomness of the cross-validation ensemble
     */
    DatasetResult processDataset(const Dataset& dataset, TippingSimulation::NoiseSource& noise) const;

    /**
     * @brief Combined table of one reference dataset over several pen values
     *
     * Rows are grouped by pen in the order given; the table has a pen column.
     */
    EstimateTable sweepPenalties(const Dataset& reference, const std::vector<double>& pens) const;

    /**
     * @brief Fit one replicate and compute its residual diagnostics
     */
    ResidualReport diagnose(const Trace& trace, double pen) const;

    const EstimationConfig& getConfig() const { return m_config; }

private:
    EstimationConfig m_config;
    ReplicateEstimator m_replicate;
};

} // namespace TippingEstimation

#endif // BATCH_ESTIMATOR_HH
