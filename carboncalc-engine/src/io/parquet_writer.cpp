#include "parquet_writer.hpp"
#include <filesystem>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace fs = std::filesystem;

namespace carboncalc {
namespace io {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_table(const StatementTable& table, const std::string& filepath) {
    arrow::FieldVector fields;
    arrow::ArrayVector arrays;

    // Year column
    arrow::Int32Builder year_builder;
    check(year_builder.Reserve(table.num_rows()), "Failed to reserve memory for year column");
    for (int year : table.years) {
        check(year_builder.Append(year), "Failed to append year");
    }
    std::shared_ptr<arrow::Array> year_array;
    check(year_builder.Finish(&year_array), "Failed to finish year array");
    fields.push_back(arrow::field("year", arrow::int32()));
    arrays.push_back(year_array);

    // Statement fields
    for (const Column& column : table.columns) {
        arrow::DoubleBuilder builder;
        check(builder.Reserve(column.values.size()),
              "Failed to reserve memory for " + column.name + " column");
        check(builder.AppendValues(column.values), "Failed to append " + column.name);

        std::shared_ptr<arrow::Array> array;
        check(builder.Finish(&array), "Failed to finish " + column.name + " array");
        fields.push_back(arrow::field(column.name, arrow::float64()));
        arrays.push_back(array);
    }

    auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays);

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    // Write Parquet file
    check(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), outfile,
                                     1024 * 1024),
          "Failed to write Parquet table");
    check(outfile->Close(), "Failed to close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_table(const StatementTable& /* table */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

std::vector<std::string> ParquetWriter::write_result(const ModelResult& result,
                                                     const std::string& directory) {
    if (!available()) {
        throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory: " + directory + " - " + ec.message());
    }

    std::vector<std::string> written;
    for (const StatementTable& table : build_statement_tables(result)) {
        fs::path path = fs::path(directory) / (table.name + ".parquet");
        write_table(table, path.string());
        written.push_back(path.string());
    }
    return written;
}

} // namespace io
} // namespace carboncalc
