/**
 * @file TraceDataReader.hh
 * @brief Reader and writer for replicate time-series tables in CSV form
 *
 * A model file holds one synthetic model: a header row, a first column
 * with the time axis on a uniform grid, and one column per replicate
 * trace. Missing cells are written as NA or left empty.
 *
 * Example:
 * @code
 *   time,rep1,rep2
 *   1870.0000,0.21,0.27
 *   1870.0833,0.19,NA
 * @endcode
 */

#ifndef TRACE_DATA_READER_HH
#define TRACE_DATA_READER_HH

#include <cstddef>
#include <string>
#include <vector>

namespace TraceData {

/**
 * @struct DataTable
 * @brief Column-major numeric table with a time axis
 */
struct DataTable {
    std::string timeName;                       ///< Header of the time column
    std::vector<std::string> columnNames;       ///< Headers of the data columns
    std::vector<double> time;                   ///< Time axis
    std::vector<std::vector<double>> columns;   ///< One vector per data column, NaN for missing

    std::size_t numRows() const { return time.size(); }
    std::size_t numColumns() const { return columns.size(); }

    /// Step of the time axis (0 if fewer than two rows)
    double timeStep() const {
        return (time.size() < 2) ? 0.0 : (time.back() - time.front()) / static_cast<double>(time.size() - 1);
    }

    /// Index of a data column by header, or -1
    int columnIndex(const std::string& name) const;
};

/**
 * @class TraceDataReader
 * @brief Loads model files into a DataTable
 *
 * Ragged rows, non-numeric cells and a non-uniform time axis are
 * rejected: loadFile() reports the offending line on std::cerr and
 * returns false.
 */
class TraceDataReader {
public:
    TraceDataReader();

    /**
     * @brief Load and validate a CSV model file
     * @param csvFile Path to the file
     * @return true on success
     */
    bool loadFile(const std::string& csvFile);

    /**
     * @brief Parse CSV text already in memory
     * @param content File content
     * @param source Name used in error messages
     */
    bool loadString(const std::string& content, const std::string& source = "<string>");

    const DataTable& getTable() const { return table_; }
    bool isLoaded() const { return dataLoaded_; }

    /// Message of the last failed load
    const std::string& getLastError() const { return lastError_; }

    /**
     * @brief Relative tolerance on the time step
     *
     * Every increment must be within tol * step of the mean step.
     */
    void setTimeTolerance(double tol) { timeTolerance_ = tol; }

    /**
     * @brief Files in a directory with the given extension, sorted by name
     * @param directory Directory to scan
     * @param extension Extension including the dot, e.g. ".csv"
     */
    static std::vector<std::string> listFiles(const std::string& directory,
                                              const std::string& extension);

    /// File name without directory and extension
    static std::string baseName(const std::string& path);

private:
    DataTable table_;
    bool dataLoaded_ = false;
    double timeTolerance_ = 1e-3;
    std::string lastError_;

    bool fail(const std::string& source, std::size_t lineNumber, const std::string& message);

    // Helper methods
    std::vector<std::string> splitLine(const std::string& line, char delimiter) const;
    bool parseCell(const std::string& str, double& value) const;
    std::string trim(const std::string& str) const;
};

/**
 * @class TraceDataWriter
 * @brief Writes numeric tables in the format read by TraceDataReader
 *
 * Numbers are written at full precision and NaN as NA.
 */
class TraceDataWriter {
public:
    /**
     * @brief Write row-major records with an optional leading label column
     * @param path Output file
     * @param header Column headers (including the label column, if any)
     * @param labels One label per row, or empty for no label column
     * @param rows Numeric cells per row
     */
    static bool writeRows(const std::string& path,
                          const std::vector<std::string>& header,
                          const std::vector<std::string>& labels,
                          const std::vector<std::vector<double>>& rows);

    /**
     * @brief Write equal-length columns
     */
    static bool writeColumns(const std::string& path,
                             const std::vector<std::string>& header,
                             const std::vector<std::vector<double>>& columns);

    /// Write a DataTable, time column first
    static bool writeTable(const std::string& path, const DataTable& table);

    /// Create a directory if it does not exist yet
    static bool makeDirectory(const std::string& path);

    /// Cell text of a number (NA for NaN)
    static std::string formatValue(double value);
};

} // namespace TraceData

#endif // TRACE_DATA_READER_HH
