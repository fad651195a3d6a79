#ifndef CARBONCALC_CONFIG_PARSER_HPP
#define CARBONCALC_CONFIG_PARSER_HPP

#include "logger.hpp"
#include <stdexcept>
#include <string>

namespace carboncalc {

/**
 * @brief Exception thrown when run-config parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Output targets for a CLI run
 *
 * Empty paths mean "not requested"; an empty json_path writes the result to stdout.
 */
struct OutputConfig {
    std::string json_path;
    std::string csv_dir;
    std::string parquet_dir;
    bool pretty_print;

    OutputConfig() : pretty_print(true) {}
};

/**
 * @brief A complete CLI run configuration
 *
 * Example:
 *   @code
 *   {
 *     "inputs": "scenario_simple.json",
 *     "output": { "json": "out/result.json", "csv_dir": "out/csv", "pretty_print": true },
 *     "logging": { "level": "DEBUG", "json": false, "file": "${LOG_DIR}/carboncalc.log" },
 *     "strict": true
 *   }
 *   @endcode
 */
struct RunConfig {
    std::string inputs_path;
    OutputConfig output;
    LoggerConfig logging;
    bool strict;                     ///< Treat failed invariant checks as an error

    RunConfig() : strict(false) {}
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative paths are resolved against the directory of the config file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed run configuration
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * Unknown top-level keys are rejected. Paths are env-expanded but not resolved.
 *
 * @throws ConfigParseError if the JSON is invalid or a value has the wrong type
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @throws ConfigParseError on an unterminated "${"
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace carboncalc

#endif // CARBONCALC_CONFIG_PARSER_HPP
