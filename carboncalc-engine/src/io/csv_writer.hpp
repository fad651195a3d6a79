#ifndef CARBONCALC_IO_CSV_WRITER_HPP
#define CARBONCALC_IO_CSV_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "result_tables.hpp"

namespace carboncalc {
namespace io {

// Write one statement table: header row, then one line per year (year column first)
void write_table_csv(std::ostream& os, const StatementTable& table);

// Write metrics as "metric,value" pairs; a metric without a result has an empty value
void write_metrics_csv(std::ostream& os, const Metrics& metrics);

// Write every statement table plus metrics.csv into `directory` (created if missing).
// Returns the paths written.
// Throws std::runtime_error if the directory or a file cannot be created.
std::vector<std::string> write_result_csv(const std::string& directory, const ModelResult& result);

} // namespace io
} // namespace carboncalc

#endif // CARBONCALC_IO_CSV_WRITER_HPP
