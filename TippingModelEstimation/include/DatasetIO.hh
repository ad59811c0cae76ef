#ifndef DATASET_IO_HH
#define DATASET_IO_HH

/**
 * @file DatasetIO.hh
 * @brief Conversion between model files and estimation data types
 */

#include "BatchEstimator.hh"
#include "ResidualDiagnostics.hh"
#include "TraceDataReader.hh"
#include <string>

namespace TippingEstimation {

namespace DatasetIO {

/**
 * @brief Turn a loaded table into a dataset, one trace per column
 *
 * The trace step is the table's time step; tables with a single row
 * fall back to defaultDelta.
 */
Dataset fromTable(const TraceData::DataTable& table, const std::string& name, double defaultDelta);

/**
 * @brief Read a model file
 * @param path CSV model file
 * @param defaultDelta Step used when the file has a single row
 * @param dataset Filled on success; named after the file
 * @return false if the file could not be read (reason on std::cerr)
 */
bool loadDataset(const std::string& path, double defaultDelta, Dataset& dataset);

/// Write `<replicate>,<columnNames()...>` rows of an estimate table
bool writeEstimateTable(const std::string& path, const EstimateTable& table);

/**
 * @brief Write `<prefix>_residuals.csv` and `<prefix>_qq.csv`
 */
bool writeResidualReport(const std::string& prefix, const ResidualReport& report);

} // namespace DatasetIO

} // namespace TippingEstimation

#endif // DATASET_IO_HH
