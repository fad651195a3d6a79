#include "json_writer.hpp"
#include "result_tables.hpp"
#include <fstream>
#include <stdexcept>

namespace carboncalc {
namespace io {

namespace {

// Document key for each statement table, in table order
const char* const TABLE_KEYS[] = {
    "incomeStatements",
    "balanceSheets",
    "cashFlowStatements",
    "debtSchedule",
    "carbonStream",
    "freeCashFlow",
};

nlohmann::ordered_json table_to_json(const StatementTable& table) {
    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    for (size_t i = 0; i < table.num_rows(); ++i) {
        nlohmann::ordered_json row;
        row["year"] = table.years[i];
        for (const Column& column : table.columns) {
            row[column.name] = column.values[i];
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // anonymous namespace

nlohmann::ordered_json result_to_json(const ModelResult& result) {
    nlohmann::ordered_json doc;
    doc["schema_version"] = result.schema_version;
    doc["inputs"] = to_json(result.inputs);

    std::vector<StatementTable> tables = build_statement_tables(result);
    for (size_t i = 0; i < tables.size(); ++i) {
        doc[TABLE_KEYS[i]] = table_to_json(tables[i]);
    }

    nlohmann::ordered_json metrics;
    for (const MetricEntry& entry : metric_entries(result.metrics)) {
        if (entry.value.has_value()) {
            metrics[entry.name] = *entry.value;
        } else {
            metrics[entry.name] = nullptr;
        }
    }
    doc["metrics"] = std::move(metrics);

    return doc;
}

void write_result_json(std::ostream& os, const ModelResult& result, bool pretty_print) {
    nlohmann::ordered_json doc = result_to_json(result);
    os << doc.dump(pretty_print ? 2 : -1) << "\n";
    if (!os) {
        throw std::runtime_error("Failed to write JSON result");
    }
}

void write_result_json(const std::string& filepath, const ModelResult& result,
                       bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_result_json(file, result, pretty_print);
}

} // namespace io
} // namespace carboncalc
