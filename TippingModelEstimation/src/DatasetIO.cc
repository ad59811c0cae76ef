/**
 * @file DatasetIO.cc
 * @brief Implementation of the model-file conversions
 */

#include "DatasetIO.hh"
#include <iostream>

namespace TippingEstimation {

namespace DatasetIO {

Dataset fromTable(const TraceData::DataTable& table, const std::string& name, double defaultDelta) {
    Dataset dataset;
    dataset.name = name;
    if (table.numRows() == 0) return dataset;

    const double delta = (table.numRows() >= 2) ? table.timeStep() : defaultDelta;
    const double start = table.time.front();
    for (size_t c = 0; c < table.numColumns(); ++c) {
        dataset.replicates.push_back(Trace(table.columnNames[c], start, delta, table.columns[c]));
    }
    return dataset;
}

bool loadDataset(const std::string& path, double defaultDelta, Dataset& dataset) {
    TraceData::TraceDataReader reader;
    if (!reader.loadFile(path)) {
        return false;
    }
    dataset = fromTable(reader.getTable(), TraceData::TraceDataReader::baseName(path), defaultDelta);
    return true;
}

bool writeEstimateTable(const std::string& path, const EstimateTable& table) {
    std::vector<std::string> header;
    header.push_back("replicate");
    std::vector<std::string> names = table.columnNames();
    header.insert(header.end(), names.begin(), names.end());

    std::vector<std::string> labels;
    std::vector<std::vector<double>> rows;
    for (size_t i = 0; i < table.rows.size(); ++i) {
        labels.push_back(table.rows[i].replicate);
        rows.push_back(table.rowValues(i));
    }
    return TraceData::TraceDataWriter::writeRows(path, header, labels, rows);
}

bool writeResidualReport(const std::string& prefix, const ResidualReport& report) {
    if (!TraceData::TraceDataWriter::writeColumns(prefix + "_residuals.csv", {"residual"},
                                                  {report.residuals})) {
        return false;
    }

    std::vector<double> theoretical, sample;
    for (const auto& p : report.qq) {
        theoretical.push_back(p.theoretical);
        sample.push_back(p.sample);
    }
    return TraceData::TraceDataWriter::writeColumns(prefix + "_qq.csv", {"theoretical", "sample"},
                                                    {theoretical, sample});
}

} // namespace DatasetIO

} // namespace TippingEstimation
