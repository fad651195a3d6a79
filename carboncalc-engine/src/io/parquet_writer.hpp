#ifndef CARBONCALC_IO_PARQUET_WRITER_HPP
#define CARBONCALC_IO_PARQUET_WRITER_HPP

#include "result_tables.hpp"
#include <string>
#include <vector>

namespace carboncalc {
namespace io {

class ParquetWriter {
public:
    /**
     * Write one statement table to a Parquet file.
     *
     * Output schema:
     *   - year: int32
     *   - one float64 column per statement field, in table order
     *
     * @throws std::runtime_error if the file cannot be written or Arrow is unavailable
     */
    static void write_table(const StatementTable& table, const std::string& filepath);

    /**
     * Write the six statement tables as <directory>/<table>.parquet.
     * The directory is created if missing. Returns the paths written.
     */
    static std::vector<std::string> write_result(const ModelResult& result,
                                                 const std::string& directory);

    // True when built with Apache Arrow support
    static bool available();
};

} // namespace io
} // namespace carboncalc

#endif // CARBONCALC_IO_PARQUET_WRITER_HPP
