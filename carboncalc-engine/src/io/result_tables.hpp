#ifndef CARBONCALC_IO_RESULT_TABLES_HPP
#define CARBONCALC_IO_RESULT_TABLES_HPP

#include "../financial_model.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace carboncalc {
namespace io {

// Decimal places used when a column is written as text
constexpr int MONEY_PRECISION = 2;
constexpr int RATE_PRECISION = 6;

// One numeric column of a statement table
struct Column {
    std::string name;
    int precision;
    std::vector<double> values;
};

// Column view of one per-year statement, shared by the CSV and Parquet writers
struct StatementTable {
    std::string name;                   // file stem, e.g. "income_statements"
    std::vector<int> years;
    std::vector<Column> columns;        // excludes the year column

    size_t num_rows() const { return years.size(); }
};

// The six per-year tables, in output order:
// income_statements, balance_sheets, cash_flow_statements, debt_schedule,
// carbon_stream, free_cash_flow
std::vector<StatementTable> build_statement_tables(const ModelResult& result);

// Scalar metrics as (name, value, precision); empty value for "no result"
struct MetricEntry {
    std::string name;
    std::optional<double> value;
    int precision;
};

std::vector<MetricEntry> metric_entries(const Metrics& metrics);

} // namespace io
} // namespace carboncalc

#endif // CARBONCALC_IO_RESULT_TABLES_HPP
