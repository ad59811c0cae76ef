/**
 * @file CommandLine.cc
 * @brief Implementation of the shared command-line options
 */

#include "CommandLine.hh"
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <omp.h>

namespace TippingEstimation {

namespace CommandLine {

namespace {

bool parseNumber(const std::string& text, double& value) {
    const char* begin = text.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return false;
    value = v;
    return true;
}

} // namespace

bool parseList(const std::string& text, std::vector<double>& values) {
    values.clear();
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        double v = 0.0;
        if (!parseNumber(item, v)) return false;
        values.push_back(v);
    }
    return !values.empty();
}

OptionStatus parseConfigOption(int argc, char** argv, int& i, EstimationConfig& config) {
    const std::string arg = argv[i];
    const bool hasValue = i + 1 < argc;

    if (arg == "--quiet" || arg == "-q") {
        config.verbose = false;
        return OptionStatus::Consumed;
    }

    if (arg != "--t0" && arg != "--delta" && arg != "--threshold" && arg != "--nsim"
        && arg != "--nloop" && arg != "--seed" && arg != "--pen-grid" && arg != "--threads") {
        return OptionStatus::Unknown;
    }
    if (!hasValue) {
        std::cerr << "Error: " << arg << " needs a value" << std::endl;
        return OptionStatus::Invalid;
    }
    const std::string value = argv[++i];

    if (arg == "--pen-grid") {
        std::vector<double> grid;
        if (!parseList(value, grid)) {
            std::cerr << "Error: --pen-grid expects comma-separated numbers, got '" << value << "'" << std::endl;
            return OptionStatus::Invalid;
        }
        for (double p : grid) {
            if (p < 0) {
                std::cerr << "Error: pen values must be >= 0" << std::endl;
                return OptionStatus::Invalid;
            }
        }
        config.penGrid = grid;
        return OptionStatus::Consumed;
    }

    double v = 0.0;
    if (!parseNumber(value, v)) {
        std::cerr << "Error: " << arg << " expects a number, got '" << value << "'" << std::endl;
        return OptionStatus::Invalid;
    }

    if (arg == "--t0") {
        config.t0 = v;
    } else if (arg == "--delta") {
        if (v <= 0) {
            std::cerr << "Error: delta must be > 0" << std::endl;
            return OptionStatus::Invalid;
        }
        config.delta = v;
    } else if (arg == "--threshold") {
        config.postOnsetThreshold = v;
    } else if (arg == "--nsim") {
        if (v < 1) {
            std::cerr << "Error: nsim must be >= 1" << std::endl;
            return OptionStatus::Invalid;
        }
        config.crossvalNsim = static_cast<int>(v);
    } else if (arg == "--nloop") {
        if (v < 1) {
            std::cerr << "Error: nloop must be >= 1" << std::endl;
            return OptionStatus::Invalid;
        }
        config.nloop = static_cast<int>(v);
    } else if (arg == "--seed") {
        if (v < 0) {
            std::cerr << "Error: seed must be >= 0" << std::endl;
            return OptionStatus::Invalid;
        }
        config.seed = static_cast<unsigned long long>(v);
    } else if (arg == "--threads") {
        if (v < 0) {
            std::cerr << "Error: threads must be >= 0" << std::endl;
            return OptionStatus::Invalid;
        }
        config.numThreads = static_cast<int>(v);
    }
    return OptionStatus::Consumed;
}

void printConfigOptions(std::ostream& os) {
    EstimationConfig d;
    os << "  --t0 T: Onset time (default: " << d.t0 << ")\n";
    os << "  --delta D: Observation step for single-row files (default: 1/12)\n";
    os << "  --threshold X: Drop trailing post-onset values <= X (default: " << d.postOnsetThreshold << ")\n";
    os << "  --nsim N: Cross-validation replicates (default: " << d.crossvalNsim << ")\n";
    os << "  --nloop K: Integration sub-steps per observation (default: " << d.nloop << ")\n";
    os << "  --seed S: Seed of the cross-validation noise (default: " << d.seed << ")\n";
    os << "  --pen-grid a,b,c: Candidate penalization weights (default: 0,0.025,0.05,0.1,0.2,0.4,0.8)\n";
    os << "  --threads N: OpenMP threads (default: runtime)\n";
    os << "  --quiet, -q: Only warnings and errors\n";
}

void applyThreads(const EstimationConfig& config) {
    if (config.numThreads > 0) {
        omp_set_num_threads(config.numThreads);
    }
    if (config.verbose) {
        std::cout << "OpenMP threads: " << omp_get_max_threads() << std::endl;
    }
}

} // namespace CommandLine

} // namespace TippingEstimation
