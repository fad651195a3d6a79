#include "input_validator.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace carboncalc {

namespace {

const std::set<std::string> REQUIRED_KEYS = {
    "years",
    "credits_generated", "price_per_credit", "issuance_flag",
    "cogs_rate",
    "feasibility_costs", "pdd_costs", "mrv_costs", "staff_costs", "depreciation",
    "income_tax_rate", "ar_rate", "ap_rate",
    "capex", "equity_injection",
    "interest_rate", "debt_duration_years", "debt_draw",
    "purchase_amount", "purchase_share",
    "discount_rate",
};

const std::set<std::string> OPTIONAL_KEYS = {
    "initial_equity_t0", "opening_cash_y1", "initial_ppe",
};

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

// ----------------------------------------------------------------------------
// JSON field readers
// ----------------------------------------------------------------------------

double read_number(const json& j, const std::string& key) {
    const json& v = j.at(key);
    if (!v.is_number()) {
        throw ValidationError("Field '" + key + "' must be a number");
    }
    return v.get<double>();
}

// Accepts integer literals and integral-valued floats (e.g. 2.0) that fit in an int
int read_integer(const json& v, const std::string& what) {
    constexpr std::int64_t INT_LOWEST = std::numeric_limits<int>::min();
    constexpr std::int64_t INT_HIGHEST = std::numeric_limits<int>::max();

    if (v.is_number_unsigned()) {
        std::uint64_t u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(INT_HIGHEST)) {
            throw ValidationError(what + " is out of range");
        }
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        std::int64_t i = v.get<std::int64_t>();
        if (i < INT_LOWEST || i > INT_HIGHEST) {
            throw ValidationError(what + " is out of range");
        }
        return static_cast<int>(i);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && std::floor(d) == d) {
            if (d < static_cast<double>(INT_LOWEST) || d > static_cast<double>(INT_HIGHEST)) {
                throw ValidationError(what + " is out of range");
            }
            return static_cast<int>(d);
        }
    }
    throw ValidationError(what + " must be an integer");
}

const json& read_array(const json& j, const std::string& key) {
    const json& v = j.at(key);
    if (!v.is_array()) {
        throw ValidationError("Field '" + key + "' must be an array");
    }
    return v;
}

std::vector<double> read_number_array(const json& j, const std::string& key) {
    const json& arr = read_array(j, key);
    std::vector<double> result;
    result.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_number()) {
            throw ValidationError("Field '" + key + "[" + std::to_string(i) + "]' must be a number");
        }
        result.push_back(arr[i].get<double>());
    }
    return result;
}

std::vector<int> read_integer_array(const json& j, const std::string& key) {
    const json& arr = read_array(j, key);
    std::vector<int> result;
    result.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        result.push_back(read_integer(arr[i], "Field '" + key + "[" + std::to_string(i) + "]'"));
    }
    return result;
}

std::vector<Outflow> read_outflow_array(const json& j, const std::string& key) {
    std::vector<double> values = read_number_array(j, key);
    std::vector<Outflow> result;
    result.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] > 0.0) {
            throw ValidationError("Field '" + key + "[" + std::to_string(i) +
                                  "]' must be <= 0 (negative convention), got " +
                                  format_amount(values[i]));
        }
        result.emplace_back(values[i]);
    }
    return result;
}

// ----------------------------------------------------------------------------
// Semantic checks
// ----------------------------------------------------------------------------

void check_length(size_t actual, size_t expected, const std::string& key) {
    if (actual != expected) {
        throw ValidationError("Length of '" + key + "' (" + std::to_string(actual) +
                              ") must equal years.length (" + std::to_string(expected) + ")");
    }
}

void check_rate(double value, const std::string& key) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ValidationError("Rate '" + key + "' must be between 0 and 1, got " +
                              std::to_string(value));
    }
}

void check_finite(const std::vector<double>& values, const std::string& key,
                  const std::vector<int>& years) {
    for (size_t t = 0; t < values.size(); ++t) {
        if (!std::isfinite(values[t])) {
            throw ValidationError("Field '" + key + "' is not finite in year " +
                                  std::to_string(years[t]));
        }
    }
}

void check_outflows(const std::vector<Outflow>& values, const std::string& key,
                    const std::vector<int>& years) {
    for (size_t t = 0; t < values.size(); ++t) {
        double v = values[t].value();
        if (!std::isfinite(v)) {
            throw ValidationError("Field '" + key + "' is not finite in year " +
                                  std::to_string(years[t]));
        }
        // Outflow already rejects positive values; default-constructed rows are zero
        if (v > 0.0) {
            throw ValidationError("Field '" + key + "' must be <= 0 in year " +
                                  std::to_string(years[t]));
        }
    }
}

void check_non_negative(const std::vector<double>& values, const std::string& key,
                        const std::vector<int>& years) {
    for (size_t t = 0; t < values.size(); ++t) {
        if (values[t] < 0.0) {
            throw ValidationError("Field '" + key + "' must be >= 0 in year " +
                                  std::to_string(years[t]) + ", got " + format_amount(values[t]));
        }
    }
}

void check_single_nonzero(const std::vector<double>& values, const std::string& key,
                          const std::string& what) {
    size_t count = std::count_if(values.begin(), values.end(),
                                 [](double v) { return v != 0.0; });
    if (count > 1) {
        throw ValidationError("Field '" + key + "' has " + std::to_string(count) +
                              " nonzero years; at most one " + what + " year is supported");
    }
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

ModelInputs parse_model_inputs(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Model inputs must be a JSON object");
    }

    // Fail closed on unknown keys
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (REQUIRED_KEYS.count(it.key()) == 0 && OPTIONAL_KEYS.count(it.key()) == 0) {
            throw ValidationError("Unrecognized input key: " + it.key());
        }
    }
    for (const std::string& key : REQUIRED_KEYS) {
        if (!j.contains(key)) {
            throw ValidationError("Missing required input key: " + key);
        }
    }

    ModelInputs inputs;

    inputs.years = read_integer_array(j, "years");

    inputs.credits_generated = read_number_array(j, "credits_generated");
    inputs.price_per_credit = read_number_array(j, "price_per_credit");

    // issuance_flag is read as numbers so that 0.5 is reported as a flag error
    std::vector<double> flags = read_number_array(j, "issuance_flag");
    inputs.issuance_flag.reserve(flags.size());
    for (size_t i = 0; i < flags.size(); ++i) {
        if (flags[i] != 0.0 && flags[i] != 1.0) {
            throw ValidationError("Field 'issuance_flag[" + std::to_string(i) +
                                  "]' must be 0 or 1, got " + std::to_string(flags[i]));
        }
        inputs.issuance_flag.push_back(flags[i] == 1.0 ? 1 : 0);
    }

    inputs.feasibility_costs = read_outflow_array(j, "feasibility_costs");
    inputs.pdd_costs = read_outflow_array(j, "pdd_costs");
    inputs.mrv_costs = read_outflow_array(j, "mrv_costs");
    inputs.staff_costs = read_outflow_array(j, "staff_costs");
    inputs.depreciation = read_outflow_array(j, "depreciation");
    inputs.capex = read_outflow_array(j, "capex");

    inputs.equity_injection = read_number_array(j, "equity_injection");
    inputs.debt_draw = read_number_array(j, "debt_draw");
    inputs.purchase_amount = read_number_array(j, "purchase_amount");

    inputs.cogs_rate = read_number(j, "cogs_rate");
    inputs.income_tax_rate = read_number(j, "income_tax_rate");
    inputs.ar_rate = read_number(j, "ar_rate");
    inputs.ap_rate = read_number(j, "ap_rate");
    inputs.interest_rate = read_number(j, "interest_rate");
    inputs.purchase_share = read_number(j, "purchase_share");
    inputs.discount_rate = read_number(j, "discount_rate");

    inputs.debt_duration_years = read_integer(j.at("debt_duration_years"), "Field 'debt_duration_years'");

    if (j.contains("initial_equity_t0")) inputs.initial_equity_t0 = read_number(j, "initial_equity_t0");
    if (j.contains("opening_cash_y1")) inputs.opening_cash_y1 = read_number(j, "opening_cash_y1");
    if (j.contains("initial_ppe")) inputs.initial_ppe = read_number(j, "initial_ppe");

    check_model_inputs(inputs);
    return inputs;
}

ModelInputs parse_model_inputs_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::exception& e) {
        throw ValidationError("Failed to parse model inputs JSON: " + std::string(e.what()));
    }
    return parse_model_inputs(j);
}

ModelInputs load_model_inputs(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open inputs file: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse JSON in " + filepath + ": " + std::string(e.what()));
    }
    return parse_model_inputs(j);
}

// ============================================================================
// Validation
// ============================================================================

double required_opening_cash(const ModelInputs& inputs) {
    return inputs.initial_equity_t0 - inputs.initial_ppe;
}

ValidationReport check_model_inputs(const ModelInputs& inputs) {
    const size_t L = inputs.num_years();
    if (L == 0) {
        throw ValidationError("'years' must contain at least one year");
    }
    for (size_t t = 1; t < L; ++t) {
        if (inputs.years[t] <= inputs.years[t - 1]) {
            throw ValidationError("'years' must be strictly increasing (" +
                                  std::to_string(inputs.years[t - 1]) + " followed by " +
                                  std::to_string(inputs.years[t]) + ")");
        }
    }

    check_length(inputs.credits_generated.size(), L, "credits_generated");
    check_length(inputs.price_per_credit.size(), L, "price_per_credit");
    check_length(inputs.issuance_flag.size(), L, "issuance_flag");
    check_length(inputs.feasibility_costs.size(), L, "feasibility_costs");
    check_length(inputs.pdd_costs.size(), L, "pdd_costs");
    check_length(inputs.mrv_costs.size(), L, "mrv_costs");
    check_length(inputs.staff_costs.size(), L, "staff_costs");
    check_length(inputs.depreciation.size(), L, "depreciation");
    check_length(inputs.capex.size(), L, "capex");
    check_length(inputs.equity_injection.size(), L, "equity_injection");
    check_length(inputs.debt_draw.size(), L, "debt_draw");
    check_length(inputs.purchase_amount.size(), L, "purchase_amount");

    check_rate(inputs.cogs_rate, "cogs_rate");
    check_rate(inputs.income_tax_rate, "income_tax_rate");
    check_rate(inputs.ar_rate, "ar_rate");
    check_rate(inputs.ap_rate, "ap_rate");
    check_rate(inputs.interest_rate, "interest_rate");
    check_rate(inputs.purchase_share, "purchase_share");
    check_rate(inputs.discount_rate, "discount_rate");

    if (inputs.debt_duration_years <= 0) {
        throw ValidationError("'debt_duration_years' must be a positive integer, got " +
                              std::to_string(inputs.debt_duration_years));
    }

    for (size_t t = 0; t < L; ++t) {
        if (inputs.issuance_flag[t] != 0 && inputs.issuance_flag[t] != 1) {
            throw ValidationError("'issuance_flag' must be 0 or 1 in year " +
                                  std::to_string(inputs.years[t]));
        }
    }

    check_finite(inputs.credits_generated, "credits_generated", inputs.years);
    check_finite(inputs.price_per_credit, "price_per_credit", inputs.years);
    check_finite(inputs.equity_injection, "equity_injection", inputs.years);
    check_finite(inputs.debt_draw, "debt_draw", inputs.years);
    check_finite(inputs.purchase_amount, "purchase_amount", inputs.years);

    check_outflows(inputs.feasibility_costs, "feasibility_costs", inputs.years);
    check_outflows(inputs.pdd_costs, "pdd_costs", inputs.years);
    check_outflows(inputs.mrv_costs, "mrv_costs", inputs.years);
    check_outflows(inputs.staff_costs, "staff_costs", inputs.years);
    check_outflows(inputs.depreciation, "depreciation", inputs.years);
    check_outflows(inputs.capex, "capex", inputs.years);

    check_non_negative(inputs.debt_draw, "debt_draw", inputs.years);
    check_non_negative(inputs.purchase_amount, "purchase_amount", inputs.years);

    check_single_nonzero(inputs.purchase_amount, "purchase_amount", "purchase");
    check_single_nonzero(inputs.debt_draw, "debt_draw", "debt-draw");

    if (inputs.purchase_year_index().has_value() && inputs.purchase_share <= 0.0) {
        throw ValidationError("'purchase_share' must be > 0 when 'purchase_amount' is nonzero");
    }

    if (!std::isfinite(inputs.initial_equity_t0) || !std::isfinite(inputs.opening_cash_y1) ||
        !std::isfinite(inputs.initial_ppe)) {
        throw ValidationError("Opening position (initial_equity_t0, opening_cash_y1, initial_ppe) must be finite");
    }

    // Advisory only: an unbalanced t0 position shows up later as a constant balance_check
    ValidationReport report;
    report.required_opening_cash = required_opening_cash(inputs);
    double gap = inputs.opening_cash_y1 - report.required_opening_cash;
    if (std::fabs(gap) > OPENING_BALANCE_TOLERANCE) {
        std::string message = "opening_cash_y1 (" + format_amount(inputs.opening_cash_y1) +
                              ") differs from the balancing opening cash (" +
                              format_amount(report.required_opening_cash) +
                              "); balance_check is expected to be off by " + format_amount(gap);
        report.advisories.push_back(message);
    }

    return report;
}

ValidationReport validate_inputs(const ModelInputs& inputs, const LogContext& ctx) {
    ValidationReport report = check_model_inputs(inputs);

    if (report.has_advisories()) {
        double gap = inputs.opening_cash_y1 - report.required_opening_cash;
        std::map<std::string, std::string> fields;
        fields["opening_cash_y1"] = format_amount(inputs.opening_cash_y1);
        fields["required_opening_cash"] = format_amount(report.required_opening_cash);
        fields["gap"] = format_amount(gap);
        for (const std::string& advisory : report.advisories) {
            Logger::get_instance().log_advisory(ctx, "opening_balance", advisory, fields);
        }
    }

    return report;
}

} // namespace carboncalc
