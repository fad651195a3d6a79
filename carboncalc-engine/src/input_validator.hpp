#ifndef CARBONCALC_INPUT_VALIDATOR_HPP
#define CARBONCALC_INPUT_VALIDATOR_HPP

#include "model_inputs.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace carboncalc {

/**
 * @brief Exception thrown when model inputs are rejected
 *
 * Raised before any computation; no partial results are produced.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Tolerance for the opening-balance advisory (one cent)
constexpr double OPENING_BALANCE_TOLERANCE = 0.01;

// Outcome of a successful validation: non-fatal advisories only
struct ValidationReport {
    double required_opening_cash;          // initial_equity_t0 - initial_ppe
    std::vector<std::string> advisories;   // human readable warnings

    ValidationReport() : required_opening_cash(0.0) {}

    bool has_advisories() const { return !advisories.empty(); }
};

// Parse a JSON input object into canonical ModelInputs.
// Fail-closed: unknown keys, missing required keys and wrongly typed values are
// rejected, then check_model_inputs() runs on the result (no advisory is logged).
// Throws ValidationError.
ModelInputs parse_model_inputs(const nlohmann::json& j);
ModelInputs parse_model_inputs_from_string(const std::string& json_string);

// Load and parse inputs from a JSON file.
// Throws std::runtime_error if the file cannot be read or is not valid JSON.
ModelInputs load_model_inputs(const std::string& filepath);

// Semantic validation of canonical inputs (lengths, ranges, sign conventions,
// single purchase / single draw). Throws ValidationError on the first violation.
// Advisories are returned in the report but not logged.
ValidationReport check_model_inputs(const ModelInputs& inputs);

// check_model_inputs() plus an opening_balance_advisory WARN event per advisory
ValidationReport validate_inputs(const ModelInputs& inputs, const LogContext& ctx = LogContext());

// Opening cash that balances the t0 position (initial_equity_t0 - initial_ppe)
double required_opening_cash(const ModelInputs& inputs);

} // namespace carboncalc

#endif // CARBONCALC_INPUT_VALIDATOR_HPP
