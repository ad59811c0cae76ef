#ifndef COMMAND_LINE_HH
#define COMMAND_LINE_HH

/**
 * @file CommandLine.hh
 * @brief Command-line options shared by the estimation applications
 */

#include "DataTypes.hh"
#include <ostream>
#include <string>
#include <vector>

namespace TippingEstimation {

namespace CommandLine {

/// Outcome of offering one argument to parseConfigOption()
enum class OptionStatus {
    Consumed,  ///< Recognized, value stored
    Unknown,   ///< Not an estimation option
    Invalid    ///< Recognized but missing or bad value (reported on std::cerr)
};

/**
 * @brief Parse a comma-separated list of numbers
 * @return false if any element is not a number
 */
bool parseList(const std::string& text, std::vector<double>& values);

/**
 * @brief Apply argv[i] (and its value) to the configuration
 *
 * Handles --t0, --delta, --threshold, --nsim, --nloop, --seed,
 * --pen-grid, --threads and --quiet. On Consumed, i points at the
 * last argument used.
 */
OptionStatus parseConfigOption(int argc, char** argv, int& i, EstimationConfig& config);

/// Usage lines of the options handled by parseConfigOption()
void printConfigOptions(std::ostream& os);

/// Set the OpenMP thread count from config.numThreads (0 keeps the default)
void applyThreads(const EstimationConfig& config);

} // namespace CommandLine

} // namespace TippingEstimation

#endif // COMMAND_LINE_HH
