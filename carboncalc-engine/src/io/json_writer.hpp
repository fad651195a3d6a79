#ifndef CARBONCALC_IO_JSON_WRITER_HPP
#define CARBONCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "../financial_model.hpp"

namespace carboncalc {
namespace io {

// Build the result document:
// { schema_version, inputs, incomeStatements, balanceSheets, cashFlowStatements,
//   debtSchedule, carbonStream, freeCashFlow, metrics }
// Rows keep their field names; metrics without a result (IRR, payback) are null.
nlohmann::ordered_json result_to_json(const ModelResult& result);

// Write ModelResult to JSON format
void write_result_json(std::ostream& os, const ModelResult& result, bool pretty_print = true);

// Write ModelResult to JSON file
void write_result_json(const std::string& filepath, const ModelResult& result,
                       bool pretty_print = true);

} // namespace io
} // namespace carboncalc

#endif // CARBONCALC_IO_JSON_WRITER_HPP
