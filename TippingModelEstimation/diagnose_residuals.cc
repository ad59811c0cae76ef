/**
 * @file diagnose_residuals.cc
 * @brief Residual and QQ tables of one fitted replicate
 *
 * Writes `<name>_<replicate>_residuals.csv` and `<name>_<replicate>_qq.csv`.
 *
 * Usage: diagnose_residuals <model.csv> [--replicate NAME] [--pen P] [--out DIR] [OPTIONS]
 */

#include "BatchEstimator.hh"
#include "CommandLine.hh"
#include "DatasetIO.hh"
#include "TraceDataReader.hh"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace std;
using namespace TippingEstimation;

int main(int argc, char** argv)
{
    EstimationConfig config;
    string modelFile;
    string replicateName;
    string outDir = ".";
    double pen = 0.0;

    for (int i = 1; i < argc; i++) {
        string arg = string(argv[i]);

        if (arg == "--replicate" && i + 1 < argc) {
            replicateName = argv[++i];
        } else if (arg == "--pen" && i + 1 < argc) {
            pen = atof(argv[++i]);
            if (pen < 0) {
                cerr << "Error: pen must be >= 0" << endl;
                return 1;
            }
        } else if (arg == "--out" && i + 1 < argc) {
            outDir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            cout << "Usage: " << argv[0] << " <model.csv> [OPTIONS]" << endl;
            cout << "Options:" << endl;
            cout << "  --replicate NAME: Replicate column (default: first)" << endl;
            cout << "  --pen P: Penalization weight of the tipping fit (default: 0)" << endl;
            cout << "  --out DIR: Output directory (default: .)" << endl;
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
        } else if (modelFile.empty()) {
            modelFile = arg;
        } else {
            cerr << "Error: unexpected argument " << arg << endl;
            return 1;
        }
    }

    if (modelFile.empty()) {
        cerr << "Usage: " << argv[0] << " <model.csv> [OPTIONS]" << endl;
        return 1;
    }

    Dataset dataset;
    if (!DatasetIO::loadDataset(modelFile, config.delta, dataset)) {
        return 1;
    }
    if (dataset.replicates.empty()) {
        cerr << "Error: " << modelFile << " has no replicate columns" << endl;
        return 1;
    }

    const Trace* trace = &dataset.replicates.front();
    if (!replicateName.empty()) {
        trace = nullptr;
        for (const auto& t : dataset.replicates) {
            if (t.id == replicateName) trace = &t;
        }
        if (!trace) {
            cerr << "Error: no replicate '" << replicateName << "' in " << modelFile << endl;
            return 1;
        }
    }

    BatchEstimator batch(config);
    ResidualReport report;
    try {
        report = batch.diagnose(*trace, pen);
    } catch (const std::invalid_argument& e) {
        cerr << "Error: " << dataset.name << "/" << trace->id << ": " << e.what() << endl;
        return 1;
    }
    report.print();

    if (!TraceData::TraceDataWriter::makeDirectory(outDir)) {
        return 1;
    }
    string prefix = outDir + "/" + dataset.name + "_" + trace->id;
    if (!DatasetIO::writeResidualReport(prefix, report)) {
        return 1;
    }
    cout << "Residuals -> " << prefix << "_residuals.csv, " << prefix << "_qq.csv" << endl;
    return 0;
}
