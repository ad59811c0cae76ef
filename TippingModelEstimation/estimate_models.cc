/**
 * @file estimate_models.cc
 * @brief Batch estimation of every model file in a directory
 *
 * For each `*.csv` model file:
 * 1. pen = 0 estimates of all replicates
 * 2. penalty calibration at the median estimates
 * 3. final estimates at the selected pen, written to `<out>/<name>_estimates.csv`
 *
 * Usage: estimate_models <model_dir> [--out DIR] [OPTIONS]
 */

#include "BatchEstimator.hh"
#include "CommandLine.hh"
#include "DatasetIO.hh"
#include "NoiseSource.hh"
#include "TraceDataReader.hh"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace TippingEstimation;

int main(int argc, char** argv)
{
    EstimationConfig config;
    string modelDir;
    string outDir = "estimates";

    for (int i = 1; i < argc; i++) {
        string arg = string(argv[i]);

        if (arg == "--out" && i + 1 < argc) {
            outDir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            cout << "Usage: " << argv[0] << " <model_dir> [OPTIONS]" << endl;
            cout << "Options:" << endl;
            cout << "  --out DIR: Output directory (default: estimates)" << endl;
            CommandLine::printConfigOptions(cout);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            CommandLine::OptionStatus status = CommandLine::parseConfigOption(argc, argv, i, config);
            if (status == CommandLine::OptionStatus::Invalid) return 1;
            if (status == CommandLine::OptionStatus::Unknown) {
                cout << "Unknown option: " << arg << endl;
                cout << "Use --help for usage information" << endl;
                return 1;
            }
        } else if (modelDir.empty()) {
            modelDir = arg;
        } else {
            cerr << "Error: unexpected argument " << arg << endl;
            return 1;
        }
    }

    if (modelDir.empty()) {
        cerr << "Usage: " << argv[0] << " <model_dir> [OPTIONS]" << endl;
        return 1;
    }

    cout << "============================================" << endl;
    cout << "  Tipping Model Estimation" << endl;
    cout << "  models: " << modelDir << endl;
    cout << "  output: " << outDir << endl;
    cout << "============================================" << endl;
    if (config.verbose) config.print();
    CommandLine::applyThreads(config);

    vector<string> files = TraceData::TraceDataReader::listFiles(modelDir, ".csv");
    if (files.empty()) {
        cerr << "Error: no .csv model files in " << modelDir << endl;
        return 1;
    }
    if (!TraceData::TraceDataWriter::makeDirectory(outDir)) {
        return 1;
    }

    BatchEstimator batch(config);
    TippingSimulation::MersenneNoiseSource noise(config.seed);
    int failures = 0;

    for (const auto& file : files) {
        Dataset dataset;
        if (!DatasetIO::loadDataset(file, config.delta, dataset)) {
            ++failures;
            continue;
        }
        if (!dataset.replicates.empty()
            && fabs(dataset.replicates.front().delta - config.delta) > 1e-3 * config.delta) {
            cerr << "Warning: " << dataset.name << ": time step " << dataset.replicates.front().delta
                 << " differs from --delta " << config.delta << "; using the file's step" << endl;
        }

        // Same noise stream for every dataset regardless of processing order
        noise.setSeed(config.seed);

        DatasetResult result;
        try {
            result = batch.processDataset(dataset, noise);
        } catch (const std::invalid_argument& e) {
            cerr << "Error: " << dataset.name << ": " << e.what() << endl;
            ++failures;
            continue;
        }

        if (config.verbose) result.selection.print();

        string path = outDir + "/" + dataset.name + "_estimates.csv";
        if (!DatasetIO::writeEstimateTable(path, result.final)) {
            ++failures;
            continue;
        }
        cout << dataset.name << ": pen = " << result.selection.pen
             << ", " << result.final.rows.size() << " replicates -> " << path << endl;
    }

    cout << "\n============================================" << endl;
    cout << "  " << files.size() - failures << " of " << files.size() << " datasets estimated" << endl;
    cout << "============================================" << endl;
    return failures == 0 ? 0 : 1;
}
