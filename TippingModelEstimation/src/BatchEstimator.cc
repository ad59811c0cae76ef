/**
 * @file BatchEstimator.cc
 * @brief Implementation of the dataset-level driver
 */

#include "BatchEstimator.hh"
#include "MathUtilities.hh"
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace TippingEstimation {

BatchEstimator::BatchEstimator(const EstimationConfig& config)
    : m_config(config)
    , m_replicate(config)
{
}

EstimateTable BatchEstimator::estimateDataset(const Dataset& dataset, double pen, bool includePen) const {
    EstimateTable table;
    table.dataset = dataset.name;
    table.includePen = includePen;
    table.rows.resize(dataset.replicates.size());

    const int n = static_cast<int>(dataset.replicates.size());

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        const Trace& trace = dataset.replicates[i];
        try {
            table.rows[i] = m_replicate.estimate(trace, pen);
        } catch (const std::invalid_argument& e) {
            table.rows[i].replicate = trace.id;
            table.rows[i].pen = pen;
            table.rows[i].setMissing();
            #pragma omp critical
            {
                std::cerr << "Warning: " << dataset.name << "/" << trace.id
                          << " not fitted: " << e.what() << std::endl;
            }
        }
    }

    std::size_t failures = table.convergenceFailures();
    if (failures > 0) {
        std::cerr << "Warning: " << dataset.name << " (pen = " << pen << "): "
                  << failures << " of " << n << " replicate fits did not converge" << std::endl;
    }
    return table;
}

DatasetResult BatchEstimator::processDataset(const Dataset& dataset,
                                             TippingSimulation::NoiseSource& noise) const {
    DatasetResult result;
    if (dataset.replicates.empty()) {
        throw std::invalid_argument("BatchEstimator: dataset '" + dataset.name + "' has no replicates");
    }

    if (m_config.verbose) {
        std::cout << "\n--- Dataset " << dataset.name << " ("
                  << dataset.replicates.size() << " replicates) ---" << std::endl;
        std::cout << "Step 1: pen = 0 pass" << std::endl;
    }
    result.initial = estimateDataset(dataset, 0.0);
    result.medians = MedianEstimates::fromTable(result.initial);

    if (result.medians.replicates == 0) {
        throw std::invalid_argument("BatchEstimator: no replicate of '" + dataset.name
                                    + "' could be fitted at pen = 0");
    }

    if (m_config.verbose) {
        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Step 2: medians over " << result.medians.replicates << " replicates: "
                  << "alpha0 = " << result.medians.ou.alpha0
                  << ", mu0 = " << result.medians.ou.mu0
                  << ", sigma2 = " << result.medians.ou.sigma2
                  << ", tau = " << result.medians.tipping.tau
                  << ", a = " << result.medians.tipping.a << std::endl;
        std::cout << "Step 3: penalty calibration (" << m_config.crossvalNsim
                  << " simulated replicates)" << std::endl;
    }

    PenaltyCalibrator calibrator(m_config);
    result.selection = calibrator.calibrate(result.medians, dataset.replicates.front(), noise);

    if (m_config.verbose) {
        std::cout << "Step 4: final pass at pen = " << result.selection.pen << std::endl;
    }
    result.final = estimateDataset(dataset, result.selection.pen, true);
    return result;
}

EstimateTable BatchEstimator::sweepPenalties(const Dataset& reference,
                                             const std::vector<double>& pens) const {
    EstimateTable table;
    table.dataset = reference.name;
    table.includePen = true;

    const int n = static_cast<int>(reference.replicates.size());
    std::vector<ReplicateFit> baselines(n);
    std::vector<char> usable(n, 0);

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        try {
            baselines[i] = m_replicate.fitBaseline(reference.replicates[i]);
            usable[i] = 1;
        } catch (const std::invalid_argument& e) {
            #pragma omp critical
            {
                std::cerr << "Warning: " << reference.name << "/" << reference.replicates[i].id
                          << " not fitted: " << e.what() << std::endl;
            }
        }
    }

    for (double pen : pens) {
        std::vector<EstimateRow> rows(n);

        #pragma omp parallel for schedule(dynamic)
        for (int i = 0; i < n; ++i) {
            rows[i].replicate = reference.replicates[i].id;
            rows[i].pen = pen;
            if (!usable[i]) {
                rows[i].setMissing();
                continue;
            }
            try {
                ReplicateFit fit = baselines[i];
                m_replicate.fitTipping(fit, pen);
                rows[i] = fit.row;
            } catch (const std::invalid_argument& e) {
                rows[i].setMissing();
                rows[i].ou = baselines[i].ou.params;
                rows[i].nBaseline = baselines[i].row.nBaseline;
                rows[i].nPostOnset = baselines[i].row.nPostOnset;
            }
        }

        if (m_config.verbose) {
            std::cout << "  pen = " << pen << ": " << n << " replicates fitted" << std::endl;
        }
        table.rows.insert(table.rows.end(), rows.begin(), rows.end());
    }
    return table;
}

ResidualReport BatchEstimator::diagnose(const Trace& trace, double pen) const {
    ReplicateFit fit = m_replicate.fitBaseline(trace);
    m_replicate.fitTipping(fit, pen);
    return ResidualDiagnostics::analyze(fit.row, fit.segments.postOnset, m_config.t0);
}

} // namespace TippingEstimation
