#include "csv_writer.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fs = std::filesystem;

namespace carboncalc {
namespace io {

void write_table_csv(std::ostream& os, const StatementTable& table) {
    os << "year";
    for (const Column& column : table.columns) {
        os << "," << column.name;
    }
    os << "\n";

    os << std::fixed;
    for (size_t i = 0; i < table.num_rows(); ++i) {
        os << table.years[i];
        for (const Column& column : table.columns) {
            // Avoid "-0.00" for values that round to zero
            double value = column.values[i];
            double scale = column.precision == RATE_PRECISION ? 1e6 : 1e2;
            if (std::fabs(value) * scale < 0.5) {
                value = 0.0;
            }
            os << "," << std::setprecision(column.precision) << value;
        }
        os << "\n";
    }
}

void write_metrics_csv(std::ostream& os, const Metrics& metrics) {
    os << "metric,value\n";
    os << std::fixed;
    for (const MetricEntry& entry : metric_entries(metrics)) {
        os << entry.name << ",";
        if (entry.value.has_value()) {
            os << std::setprecision(entry.precision) << *entry.value;
        }
        os << "\n";
    }
}

namespace {

std::ofstream open_output(const fs::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    return file;
}

} // anonymous namespace

std::vector<std::string> write_result_csv(const std::string& directory, const ModelResult& result) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory: " + directory + " - " + ec.message());
    }

    std::vector<std::string> written;

    for (const StatementTable& table : build_statement_tables(result)) {
        fs::path path = fs::path(directory) / (table.name + ".csv");
        std::ofstream file = open_output(path);
        write_table_csv(file, table);
        written.push_back(path.string());
    }

    fs::path metrics_path = fs::path(directory) / "metrics.csv";
    std::ofstream metrics_file = open_output(metrics_path);
    write_metrics_csv(metrics_file, result.metrics);
    written.push_back(metrics_path.string());

    return written;
}

} // namespace io
} // namespace carboncalc
