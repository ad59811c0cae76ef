/**
 * @file sweep_penalization.cc
 * @brief Estimates of one reference model over a list of pen values
 *
 * Writes a single table with a pen column, rows grouped by pen.
 *
 * Usage: sweep_penalization <reference.csv> [--pens a,b,c] [--out FILE] [OPTIONS]
 */

#include "BatchEstimator.hh"
#include "CommandLine.hh"
#include "DatasetIO.hh"

#include <iostream>
#include <string>
#include <vector>

using namespace std;
using namespace TippingEstimation;

int main(int argc, char** argv)
{
    EstimationConfig config;
    string referenceFile;
    string outFile;
    vector<double> pens = config.penGrid;

    for (int i = 1; i < argc; i++) {
        string arg = string(argv[i]);

        if (arg == "--pens" && i + 1 < argc) {
            string list = argv[++i];
            if (!CommandLine::parseList(list, pens)) {
                cerr << "Error: --pens expects comma-separated numbers, got '" << list << "'" << endl;
                return 1;
            }
        } else if (arg == "--out" && i + 1 < argc) {
            outFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            cout << "Usage: " << argv[0] << " <reference.csv> [OPTIONS]" << endl;
            cout << "Options:" << endl;
            cout << "  --pens a,b,c: pen values to sweep (default: the pen grid)" << endl;
            cout << "  --out FILE: Output table (default: <name>_pen_sweep.csv)" << endl;
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
        } else if (referenceFile.empty()) {
            referenceFile = arg;
        } else {
            cerr << "Error: unexpected argument " << arg << endl;
            return 1;
        }
    }

    if (referenceFile.empty()) {
        cerr << "Usage: " << argv[0] << " <reference.csv> [OPTIONS]" << endl;
        return 1;
    }

    Dataset reference;
    if (!DatasetIO::loadDataset(referenceFile, config.delta, reference)) {
        return 1;
    }
    if (outFile.empty()) {
        outFile = reference.name + "_pen_sweep.csv";
    }

    cout << "============================================" << endl;
    cout << "  Penalization Sweep" << endl;
    cout << "  reference: " << referenceFile << " (" << reference.replicates.size() << " replicates)" << endl;
    cout << "  pens: ";
    for (size_t i = 0; i < pens.size(); ++i) cout << (i ? ", " : "") << pens[i];
    cout << endl;
    cout << "============================================" << endl;
    CommandLine::applyThreads(config);

    BatchEstimator batch(config);
    EstimateTable table = batch.sweepPenalties(reference, pens);

    if (!DatasetIO::writeEstimateTable(outFile, table)) {
        return 1;
    }
    cout << table.rows.size() << " rows -> " << outFile << endl;
    return 0;
}
