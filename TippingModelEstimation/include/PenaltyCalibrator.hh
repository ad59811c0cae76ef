#ifndef PENALTY_CALIBRATOR_HH
#define PENALTY_CALIBRATOR_HH

/**
 * @file PenaltyCalibrator.hh
 * @brief Cross-validated choice of the penalization weight
 *
 * The pen = 0 fit is the maximum-likelihood answer but is unstable on
 * short post-onset segments. The calibrator simulates an ensemble of
 * traces at the dataset's median pen = 0 estimates, refits every
 * ensemble member for each candidate pen, and keeps the pen whose ramp
 * durations have the smallest mean squared deviation from the pen = 0
 * median ramp duration.
 */

#include "DataTypes.hh"
#include "ReplicateEstimator.hh"
#include "NoiseSource.hh"
#include <vector>

namespace TippingEstimation {

/**
 * @brief Median estimates of a pen = 0 pass over a dataset
 */
struct MedianEstimates {
    OUParams ou;
    TippingParams tipping;
    std::size_t replicates;  ///< Valid rows the medians were taken over

    MedianEstimates() : replicates(0) {}

    /**
     * @brief Column-wise medians over the valid rows of a table
     */
    static MedianEstimates fromTable(const EstimateTable& table);

    DerivedQuantities derived(double t0) const {
        return DerivedQuantities::fromParams(ou, tipping, t0);
    }
};

/**
 * @brief Outcome of a penalty calibration
 */
struct PenaltySelection {
    double pen;                            ///< Selected penalization weight
    std::size_t bestIndex;                 ///< Index of pen in penGrid
    double tauReference;                   ///< pen = 0 median ramp duration
    std::vector<double> penGrid;
    std::vector<double> meanSquaredError;  ///< One per grid point (NaN if no replicate fitted)
    std::vector<int> fittedReplicates;     ///< Replicates that entered each MSE
    std::size_t ensembleSize;

    PenaltySelection() : pen(0.0), bestIndex(0), tauReference(0.0), ensembleSize(0) {}

    void print() const;
};

/**
 * @class PenaltyCalibrator
 * @brief Simulation-based calibration of pen
 */
class PenaltyCalibrator {
public:
    explicit PenaltyCalibrator(const EstimationConfig& config);

    /**
     * @brief Simulate the cross-validation ensemble
     *
     * Each trajectory starts from the OU stationary distribution, is
     * integrated on a grid nloop times finer than the observations and
     * downsampled to the observation grid of the reference trace.
     * Trajectories that tip early are NaN-padded to the reference length.
     *
     * @param medians Median pen = 0 estimates
     * @param reference Trace whose start time, step and length are reproduced
     * @param noise Source of randomness
     */
    std::vector<Trace> simulateEnsemble(const MedianEstimates& medians,
                                        const Trace& reference,
                                        TippingSimulation::NoiseSource& noise) const;

    /**
     * @brief Refit the ensemble for every grid point and pick pen
     * @param ensemble Cross-validation traces
     * @param tauReference pen = 0 median ramp duration
     */
    PenaltySelection selectPenalty(const std::vector<Trace>& ensemble, double tauReference) const;

    /**
     * @brief simulateEnsemble followed by selectPenalty
     */
    PenaltySelection calibrate(const MedianEstimates& medians,
                               const Trace& reference,
                               TippingSimulation::NoiseSource& noise) const;

    /**
     * @brief Index of the smallest finite value; ties go to the first one
     *
     * Returns 0 when no value is finite.
     */
    static std::size_t argminFirst(const std::vector<double>& values);

private:
    EstimationConfig m_config;
    ReplicateEstimator m_replicate;
};

} // namespace TippingEstimation

#endif // PENALTY_CALIBRATOR_HH
