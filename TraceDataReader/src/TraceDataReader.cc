/**
 * @file TraceDataReader.cc
 * @brief Implementation of the model-file reader and table writer
 */

#include "TraceDataReader.hh"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <limits>
#include <sstream>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace TraceData {

int DataTable::columnIndex(const std::string& name) const {
    for (size_t i = 0; i < columnNames.size(); ++i) {
        if (columnNames[i] == name) return static_cast<int>(i);
    }
    return -1;
}

TraceDataReader::TraceDataReader() {}

bool TraceDataReader::loadFile(const std::string& csvFile) {
    std::ifstream file(csvFile);
    if (!file.is_open()) {
        dataLoaded_ = false;
        lastError_ = "cannot open " + csvFile;
        std::cerr << "Error: " << lastError_ << std::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadString(buffer.str(), csvFile);
}

bool TraceDataReader::fail(const std::string& source, std::size_t lineNumber,
                           const std::string& message) {
    std::ostringstream os;
    os << source;
    if (lineNumber > 0) os << ":" << lineNumber;
    os << ": " << message;
    lastError_ = os.str();
    dataLoaded_ = false;
    table_ = DataTable();
    std::cerr << "Error: " << lastError_ << std::endl;
    return false;
}

bool TraceDataReader::loadString(const std::string& content, const std::string& source) {
    table_ = DataTable();
    dataLoaded_ = false;
    lastError_.clear();

    std::istringstream in(content);
    std::string line;
    std::size_t lineNumber = 0;

    // Header
    bool haveHeader = false;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (!trim(line).empty()) {
            haveHeader = true;
            break;
        }
    }
    if (!haveHeader) {
        return fail(source, 0, "file is empty");
    }

    std::vector<std::string> header = splitLine(line, ',');
    if (header.size() < 2) {
        return fail(source, lineNumber, "expected a time column and at least one data column");
    }
    table_.timeName = trim(header[0]);
    for (size_t c = 1; c < header.size(); ++c) {
        table_.columnNames.push_back(trim(header[c]));
    }
    const size_t numData = table_.columnNames.size();
    table_.columns.assign(numData, std::vector<double>());

    while (std::getline(in, line)) {
        ++lineNumber;
        if (trim(line).empty()) continue;

        std::vector<std::string> fields = splitLine(line, ',');
        if (fields.size() != header.size()) {
            std::ostringstream msg;
            msg << "ragged row: " << fields.size() << " fields, header has " << header.size();
            return fail(source, lineNumber, msg.str());
        }

        double t = 0.0;
        if (!parseCell(fields[0], t) || std::isnan(t)) {
            return fail(source, lineNumber, "time value '" + trim(fields[0]) + "' is not a number");
        }
        table_.time.push_back(t);

        for (size_t c = 0; c < numData; ++c) {
            double v = 0.0;
            if (!parseCell(fields[c + 1], v)) {
                return fail(source, lineNumber, "non-numeric cell '" + trim(fields[c + 1])
                                                + "' in column " + table_.columnNames[c]);
            }
            table_.columns[c].push_back(v);
        }
    }

    if (table_.time.empty()) {
        return fail(source, 0, "no data rows");
    }

    // Uniform time axis
    if (table_.time.size() >= 2) {
        const double step = table_.timeStep();
        if (!(step > 0.0)) {
            return fail(source, 0, "time axis is not increasing");
        }
        for (size_t i = 1; i < table_.time.size(); ++i) {
            double inc = table_.time[i] - table_.time[i - 1];
            if (std::fabs(inc - step) > timeTolerance_ * step) {
                std::ostringstream msg;
                msg << "non-uniform time axis: step " << inc << " between rows " << i
                    << " and " << i + 1 << ", expected " << step;
                return fail(source, 0, msg.str());
            }
        }
    }

    dataLoaded_ = true;
    return true;
}

std::vector<std::string> TraceDataReader::listFiles(const std::string& directory,
                                                    const std::string& extension) {
    std::vector<std::string> files;
    DIR* dir = opendir(directory.c_str());
    if (!dir) {
        std::cerr << "Error: cannot open directory " << directory << std::endl;
        return files;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name.size() <= extension.size()) continue;
        if (name.compare(name.size() - extension.size(), extension.size(), extension) != 0) continue;

        std::string path = directory + "/" + name;
        struct stat st;
        if (stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            files.push_back(path);
        }
    }
    closedir(dir);

    std::sort(files.begin(), files.end());
    return files;
}

std::string TraceDataReader::baseName(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name;
}

std::vector<std::string> TraceDataReader::splitLine(const std::string& line, char delimiter) const {
    std::vector<std::string> result;
    bool inQuotes = false;
    std::string currentField;

    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == delimiter && !inQuotes) {
            result.push_back(currentField);
            currentField.clear();
        } else {
            currentField += c;
        }
    }
    result.push_back(currentField);
    return result;
}

bool TraceDataReader::parseCell(const std::string& str, double& value) const {
    std::string trimmed = trim(str);
    if (trimmed.empty() || trimmed == "NA" || trimmed == "N/A" || trimmed == "nan" || trimmed == "NaN") {
        value = std::numeric_limits<double>::quiet_NaN();
        return true;
    }

    const char* begin = trimmed.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return false;
    }
    value = v;
    return true;
}

std::string TraceDataReader::trim(const std::string& str) const {
    size_t start = str.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n\"");
    return str.substr(start, end - start + 1);
}

// ============================================================================
// TraceDataWriter
// ============================================================================

std::string TraceDataWriter::formatValue(double value) {
    if (std::isnan(value)) return "NA";
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return os.str();
}

bool TraceDataWriter::writeRows(const std::string& path,
                                const std::vector<std::string>& header,
                                const std::vector<std::string>& labels,
                                const std::vector<std::vector<double>>& rows) {
    const bool labelled = !labels.empty();
    if (labelled && labels.size() != rows.size()) {
        std::cerr << "Error: " << path << ": " << labels.size() << " labels for "
                  << rows.size() << " rows" << std::endl;
        return false;
    }

    for (size_t r = 0; r < rows.size(); ++r) {
        size_t cells = rows[r].size() + (labelled ? 1 : 0);
        if (cells != header.size()) {
            std::cerr << "Error: " << path << ": row " << r + 1 << " has " << cells
                      << " cells, header has " << header.size() << std::endl;
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: cannot write " << path << std::endl;
        return false;
    }

    for (size_t c = 0; c < header.size(); ++c) {
        if (c > 0) file << ",";
        file << header[c];
    }
    file << "\n";

    for (size_t r = 0; r < rows.size(); ++r) {
        bool first = true;
        if (labelled) {
            file << labels[r];
            first = false;
        }
        for (double v : rows[r]) {
            if (!first) file << ",";
            file << formatValue(v);
            first = false;
        }
        file << "\n";
    }

    if (!file.good()) {
        std::cerr << "Error: failed while writing " << path << std::endl;
        return false;
    }
    return true;
}

bool TraceDataWriter::writeColumns(const std::string& path,
                                   const std::vector<std::string>& header,
                                   const std::vector<std::vector<double>>& columns) {
    if (header.size() != columns.size()) {
        std::cerr << "Error: " << path << ": " << header.size() << " headers for "
                  << columns.size() << " columns" << std::endl;
        return false;
    }
    size_t n = columns.empty() ? 0 : columns[0].size();
    for (const auto& col : columns) {
        if (col.size() != n) {
            std::cerr << "Error: " << path << ": columns have different lengths" << std::endl;
            return false;
        }
    }

    std::vector<std::vector<double>> rows(n, std::vector<double>(columns.size()));
    for (size_t c = 0; c < columns.size(); ++c) {
        for (size_t r = 0; r < n; ++r) {
            rows[r][c] = columns[c][r];
        }
    }
    return writeRows(path, header, std::vector<std::string>(), rows);
}

bool TraceDataWriter::writeTable(const std::string& path, const DataTable& table) {
    std::vector<std::string> header;
    header.push_back(table.timeName);
    header.insert(header.end(), table.columnNames.begin(), table.columnNames.end());

    std::vector<std::vector<double>> columns;
    columns.push_back(table.time);
    columns.insert(columns.end(), table.columns.begin(), table.columns.end());
    return writeColumns(path, header, columns);
}

bool TraceDataWriter::makeDirectory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return true;
        std::cerr << "Error: " << path << " exists and is not a directory" << std::endl;
        return false;
    }
    if (mkdir(path.c_str(), 0755) != 0) {
        std::cerr << "Error: cannot create directory " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace TraceData
