/**
 * @file test_batch_estimation.cc
 * @brief Test program for the replicate pipeline and the batch driver
 *
 * Checks:
 * 1. Trace splitting at t0 and trailing-threshold filter
 * 2. Unfittable replicates keep a NaN row
 * 3. End-to-end recovery of the OU and tipping parameters
 * 4. Two-stage dataset processing and the pen sweep table
 * 5. Model-file loading and table export
 */

#include "BatchEstimator.hh"
#include "DatasetIO.hh"
#include "TraceDataReader.hh"
#include "TippingSimulator.hh"
#include "NoiseSource.hh"
#include "MathUtilities.hh"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
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
const std::size_t kBaseline = 648;

Trace simulateTrace(const OUParams& ou, const TippingParams& tip, std::size_t postPoints,
                    TippingSimulation::NoiseSource& noise, const std::string& id) {
    const int nloop = 10;
    const DerivedQuantities d = DerivedQuantities::fromParams(ou, tip, kOnset);
    const std::size_t length = kBaseline + postPoints;

    TippingSimulation::SimulationSettings s;
    s.sigma = std::sqrt(ou.sigma2);
    s.lambda0 = d.lambda0;
    s.tau = tip.tau;
    s.m = d.m;
    s.a = tip.a;
    s.preRampDuration = kOnset - kStart;
    s.dt = kDelta / nloop;
    s.maxSteps = (length - 1) * nloop;
    s.x0 = ou.mu0 + std::sqrt(ou.stationaryVariance()) * noise.standardNormal();

    TippingSimulation::TippingSimulator simulator(noise);
    TippingSimulation::SimulationResult sim = simulator.simulate(s);

    std::vector<double> values(length, std::nan(""));
    for (std::size_t k = 0; k < length && k * nloop < sim.trajectory.size(); ++k) {
        values[k] = sim.trajectory[k * nloop];
    }
    return Trace(id, kStart, kDelta, values);
}

Dataset simulateDataset(const std::string& name, std::size_t replicates, std::size_t postPoints,
                        TippingSimulation::NoiseSource& noise) {
    Dataset dataset;
    dataset.name = name;
    for (std::size_t r = 0; r < replicates; ++r) {
        std::ostringstream id;
        id << "rep" << r + 1;
        dataset.replicates.push_back(simulateTrace(OUParams(3.0, 0.25, 0.033), TippingParams(130.0, 0.9),
                                                   postPoints, noise, id.str()));
    }
    return dataset;
}

std::string firstLine(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return line;
}

} // namespace

int main() {
    std::cout << "========================================\n";
    std::cout << "Batch Estimation Test\n";
    std::cout << "========================================\n\n";
    std::cout << std::fixed << std::setprecision(4);

    EstimationConfig config;
    config.t0 = kOnset;
    config.verbose = false;
    ReplicateEstimator replicate(config);
    const double nan = std::nan("");

    // --- 1. Splitting ---
    std::cout << "--- Splitting at t0 ---\n";
    {
        std::vector<double> x(kBaseline, 0.2);
        const double post[] = {0.1, -1.5, 0.0, -1.3, -2.0};
        x.insert(x.end(), post, post + 5);
        Trace trace("split", kStart, kDelta, x);
        SegmentedTrace seg = replicate.split(trace);

        check(seg.baseline.size() == kBaseline, "baseline holds every point before t0");
        check(seg.baseline.timeAt(seg.baseline.size() - 1) < kOnset, "baseline ends before t0");
        check(std::abs(seg.postOnset.startTime - kOnset) < 1e-9, "post-onset segment starts at t0");
        check(seg.postOnset.size() == 3 && seg.droppedTrailing == 2, "only the trailing run <= -1.2 is dropped");
        check(seg.postOnset.values[1] == -1.5, "interior values below the threshold are kept");
        check(seg.baseline.size() + seg.postOnset.size() + seg.droppedTrailing == trace.size(),
              "segments and dropped points cover the trace");

        x.resize(kBaseline);
        const double gap[] = {0.1, 0.05, nan, 0.2};
        x.insert(x.end(), gap, gap + 4);
        SegmentedTrace cut = replicate.split(Trace("gap", kStart, kDelta, x));
        check(cut.postOnset.size() == 2, "post-onset segment stops at the first NaN");
    }

    TippingSimulation::MersenneNoiseSource noise(2054);
    BatchEstimator batch(config);

    // --- 2. Unfittable replicate ---
    std::cout << "\n--- Unfittable replicate ---\n";
    {
        Dataset dataset = simulateDataset("mixed", 2, 400, noise);
        std::vector<double> shortPost(kBaseline + 2, 0.2);
        dataset.replicates.push_back(Trace("short", kStart, kDelta, shortPost));

        EstimateTable table = batch.estimateDataset(dataset, 0.0);
        check(table.rows.size() == 3, "one row per replicate");
        check(table.rows[0].valid && table.rows[1].valid, "simulated replicates are fitted");
        check(!table.rows[2].valid && table.rows[2].replicate == "short", "short replicate keeps its row");
        check(std::isnan(table.rows[2].tipping.tau) && std::isnan(table.rows[2].ou.alpha0)
              && std::isnan(table.rows[2].seTau),
              "its estimates are NaN");

        MedianEstimates med = MedianEstimates::fromTable(table);
        check(med.replicates == 2, "medians skip the unfitted row");
    }

    // --- 3. End-to-end recovery ---
    std::cout << "\n--- End-to-end recovery (16 replicates, 1000 post-onset points) ---\n";
    {
        Dataset dataset = simulateDataset("scenario", 16, 1000, noise);
        EstimateTable table = batch.estimateDataset(dataset, 0.0);
        MedianEstimates med = MedianEstimates::fromTable(table);
        std::cout << "  medians: alpha0 = " << med.ou.alpha0 << ", mu0 = " << med.ou.mu0
                  << ", sigma2 = " << med.ou.sigma2 << ", tau = " << med.tipping.tau
                  << ", a = " << med.tipping.a << "\n";
        std::cout << "  convergence failures: " << table.convergenceFailures() << "\n";

        check(std::abs(med.ou.alpha0 - 3.0) < 0.30, "alpha0 within 10%");
        check(std::abs(med.ou.mu0 - 0.25) < 0.025, "mu0 within 10%");
        check(std::abs(med.ou.sigma2 - 0.033) < 0.0033, "sigma2 within 10%");
        check(std::abs(med.tipping.tau - 130.0) < 0.15 * 130.0, "tau within 15%");
        check(std::abs(med.tipping.a - 0.9) < 0.20 * 0.9, "a within 20%");

        bool derivedOk = true;
        for (const auto& row : table.rows) {
            DerivedQuantities d = DerivedQuantities::fromParams(row.ou, row.tipping, config.t0);
            if (d.m != row.derived.m || d.lambda0 != row.derived.lambda0 || d.tc != row.derived.tc) {
                derivedOk = false;
            }
        }
        check(derivedOk, "stored derived quantities match the stored parameters");

        ResidualReport report = batch.diagnose(dataset.replicates[0], 0.0);
        std::cout << "  residuals of " << report.replicate << ": mean = " << report.mean
                  << ", sd = " << report.standardDeviation << "\n";
        check(std::abs(report.mean) < 0.15 && std::abs(report.standardDeviation - 1.0) < 0.15,
              "fitted residuals are close to N(0,1)");
    }

    // --- 4. Two-stage processing and sweep ---
    std::cout << "\n--- Two-stage processing and pen sweep ---\n";
    {
        EstimationConfig cfg = config;
        cfg.crossvalNsim = 4;
        cfg.penGrid = {0.0, 0.05};
        BatchEstimator small(cfg);

        Dataset dataset = simulateDataset("small", 4, 600, noise);
        TippingSimulation::MersenneNoiseSource cvNoise(cfg.seed);
        DatasetResult result = small.processDataset(dataset, cvNoise);

        check(result.initial.rows.size() == 4 && result.final.rows.size() == 4, "both passes cover every replicate");
        check(result.medians.replicates == 4, "medians over every replicate");
        check(result.selection.pen == 0.0 || result.selection.pen == 0.05, "selected pen is on the grid");
        check(result.final.rows[0].pen == result.selection.pen, "final pass uses the selected pen");
        check(!result.initial.includePen && result.final.includePen, "final table carries the pen column");

        std::vector<double> pens = {0.0, 0.1, 0.4};
        EstimateTable sweep = small.sweepPenalties(dataset, pens);
        check(sweep.includePen, "sweep table has a pen column");
        check(sweep.rows.size() == 12, "one row per replicate and pen");
        check(sweep.rows[0].pen == 0.0 && sweep.rows[4].pen == 0.1 && sweep.rows[11].pen == 0.4,
              "rows grouped by pen in the given order");
        check(sweep.rows[0].ou.alpha0 == sweep.rows[8].ou.alpha0, "baseline fit is shared across pens");

        check(sweep.columnNames() == result.final.columnNames()
              && result.initial.columnNames().size() + 1 == result.final.columnNames().size(),
              "pen column in the final and sweep tables only");

        // --- 5. I/O ---
        std::cout << "\n--- Model files and exported tables ---\n";
        const char* tmp = std::getenv("TMPDIR");
        std::string dir = std::string(tmp ? tmp : "/tmp") + "/test_batch_estimation";
        check(TraceData::TraceDataWriter::makeDirectory(dir), "output directory");

        TraceData::DataTable model;
        model.timeName = "time";
        for (std::size_t k = 0; k < dataset.replicates[0].size(); ++k) {
            model.time.push_back(dataset.replicates[0].timeAt(k));
        }
        for (const auto& t : dataset.replicates) {
            model.columnNames.push_back(t.id);
            model.columns.push_back(t.values);
        }
        std::string modelPath = dir + "/small.csv";
        check(TraceData::TraceDataWriter::writeTable(modelPath, model), "write model file");

        Dataset loaded;
        check(DatasetIO::loadDataset(modelPath, config.delta, loaded), "load model file");
        check(loaded.name == "small" && loaded.replicates.size() == 4, "dataset named after the file");
        check(!loaded.replicates.empty() && std::abs(loaded.replicates[0].delta - kDelta) < 1e-9
              && std::abs(loaded.replicates[0].startTime - kStart) < 1e-9, "time grid recovered from the file");

        EstimateTable reloaded = small.estimateDataset(loaded, 0.0);
        const double tauMem = result.initial.rows[0].tipping.tau;
        check(std::abs(reloaded.rows[0].tipping.tau - tauMem) < 1e-4 * std::abs(tauMem),
              "estimates from the loaded file match the in-memory ones");

        std::string estPath = dir + "/small_estimates.csv";
        check(DatasetIO::writeEstimateTable(estPath, result.final), "write estimate table");
        check(firstLine(estPath) == "replicate,alpha0,mu0,lambda0,tau,s2,m,a,tc,pen,se_tau,se_a,"
                                    "ou_converged,tip_converged,n_baseline,n_post",
              "estimate table header");

        std::ifstream rows(estPath);
        std::string line;
        std::getline(rows, line);
        std::getline(rows, line);
        std::vector<std::string> cells;
        std::istringstream cellStream(line);
        std::string cell;
        while (std::getline(cellStream, cell, ',')) cells.push_back(cell);
        check(cells.size() == 16 && std::atof(cells[9].c_str()) == result.selection.pen,
              "exported pen column holds the calibrated pen");
        check(DatasetIO::writeEstimateTable(dir + "/small_sweep.csv", sweep), "write sweep table");
        check(firstLine(dir + "/small_sweep.csv").find(",tc,pen,") != std::string::npos, "sweep header has pen");

        ResidualReport report = small.diagnose(dataset.replicates[0], result.selection.pen);
        std::string prefix = dir + "/small_" + dataset.replicates[0].id;
        check(DatasetIO::writeResidualReport(prefix, report), "write residual and QQ tables");
        check(firstLine(prefix + "_residuals.csv") == "residual", "residual table header");
        check(firstLine(prefix + "_qq.csv") == "theoretical,sample", "QQ table header");
    }

    std::cout << "\n========================================\n";
    if (g_failures == 0) {
        std::cout << "Batch estimation test completed successfully!\n";
    } else {
        std::cout << g_failures << " check(s) FAILED\n";
    }
    std::cout << "========================================\n";
    return g_failures == 0 ? 0 : 1;
}
