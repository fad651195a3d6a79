#ifndef CARBONCALC_MODEL_INPUTS_HPP
#define CARBONCALC_MODEL_INPUTS_HPP

#include <cstddef>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace carboncalc {

// Outflow: an amount held in "negative convention" (costs, depreciation, capex).
// Can only hold values <= 0, so consumers read value() for the signed figure and
// magnitude() for the absolute one instead of sprinkling abs() at each use site.
class Outflow {
public:
    Outflow() : value_(0.0) {}

    // Throws std::invalid_argument if value > 0
    explicit Outflow(double value);

    double value() const { return value_; }
    double magnitude() const { return -value_; }

    bool operator==(const Outflow& other) const { return value_ == other.value_; }

private:
    double value_;
};

// Convenience for building per-year outflow arrays from plain numbers
std::vector<Outflow> make_outflows(const std::vector<double>& values);

// ModelInputs: the canonical, validated input set for one model run.
// Every per-year vector has one entry per element of `years`.
struct ModelInputs {
    // Timeline
    std::vector<int> years;

    // Operational
    std::vector<double> credits_generated;
    std::vector<double> price_per_credit;
    std::vector<int> issuance_flag;            // strictly 0 or 1

    // Expenses (negative convention)
    std::vector<Outflow> feasibility_costs;
    std::vector<Outflow> pdd_costs;
    std::vector<Outflow> mrv_costs;
    std::vector<Outflow> staff_costs;
    std::vector<Outflow> depreciation;
    std::vector<Outflow> capex;

    // Financing
    std::vector<double> equity_injection;
    std::vector<double> debt_draw;             // at most one nonzero year
    std::vector<double> purchase_amount;       // at most one nonzero year

    // Rates, all in [0, 1]
    double cogs_rate;
    double income_tax_rate;
    double ar_rate;
    double ap_rate;
    double interest_rate;
    double purchase_share;
    double discount_rate;

    int debt_duration_years;

    // Opening position
    double initial_equity_t0;
    double opening_cash_y1;
    double initial_ppe;

    ModelInputs();

    size_t num_years() const { return years.size(); }

    // Sum of the four operating cost lines for year t (<= 0)
    double opex_total(size_t t) const;

    // Index of the single nonzero purchase / debt draw entry, if any
    std::optional<size_t> purchase_year_index() const;
    std::optional<size_t> debt_draw_index() const;

    bool operator==(const ModelInputs& other) const;
};

// Serialise back into the input JSON shape (echoed in the result document)
nlohmann::ordered_json to_json(const ModelInputs& inputs);

} // namespace carboncalc

#endif // CARBONCALC_MODEL_INPUTS_HPP
