#include "model_inputs.hpp"
#include <stdexcept>
#include <string>

namespace carboncalc {

// ============================================================================
// Outflow Implementation
// ============================================================================

Outflow::Outflow(double value) : value_(value) {
    if (value > 0.0) {
        throw std::invalid_argument("Outflow must be <= 0, got " + std::to_string(value));
    }
    // Normalise -0.0 so serialised output never shows "-0"
    if (value_ == 0.0) {
        value_ = 0.0;
    }
}

std::vector<Outflow> make_outflows(const std::vector<double>& values) {
    std::vector<Outflow> result;
    result.reserve(values.size());
    for (double v : values) {
        result.emplace_back(v);
    }
    return result;
}

// ============================================================================
// ModelInputs Implementation
// ============================================================================

ModelInputs::ModelInputs()
    : cogs_rate(0.0),
      income_tax_rate(0.0),
      ar_rate(0.0),
      ap_rate(0.0),
      interest_rate(0.0),
      purchase_share(0.0),
      discount_rate(0.0),
      debt_duration_years(1),
      initial_equity_t0(0.0),
      opening_cash_y1(0.0),
      initial_ppe(0.0) {}

double ModelInputs::opex_total(size_t t) const {
    return feasibility_costs[t].value() + pdd_costs[t].value() +
           mrv_costs[t].value() + staff_costs[t].value();
}

namespace {

std::optional<size_t> first_nonzero(const std::vector<double>& values) {
    for (size_t t = 0; t < values.size(); ++t) {
        if (values[t] != 0.0) {
            return t;
        }
    }
    return std::nullopt;
}

std::vector<double> signed_values(const std::vector<Outflow>& outflows) {
    std::vector<double> result;
    result.reserve(outflows.size());
    for (const Outflow& o : outflows) {
        result.push_back(o.value());
    }
    return result;
}

} // anonymous namespace

std::optional<size_t> ModelInputs::purchase_year_index() const {
    return first_nonzero(purchase_amount);
}

std::optional<size_t> ModelInputs::debt_draw_index() const {
    return first_nonzero(debt_draw);
}

bool ModelInputs::operator==(const ModelInputs& other) const {
    return years == other.years &&
           credits_generated == other.credits_generated &&
           price_per_credit == other.price_per_credit &&
           issuance_flag == other.issuance_flag &&
           feasibility_costs == other.feasibility_costs &&
           pdd_costs == other.pdd_costs &&
           mrv_costs == other.mrv_costs &&
           staff_costs == other.staff_costs &&
           depreciation == other.depreciation &&
           capex == other.capex &&
           equity_injection == other.equity_injection &&
           debt_draw == other.debt_draw &&
           purchase_amount == other.purchase_amount &&
           cogs_rate == other.cogs_rate &&
           income_tax_rate == other.income_tax_rate &&
           ar_rate == other.ar_rate &&
           ap_rate == other.ap_rate &&
           interest_rate == other.interest_rate &&
           purchase_share == other.purchase_share &&
           discount_rate == other.discount_rate &&
           debt_duration_years == other.debt_duration_years &&
           initial_equity_t0 == other.initial_equity_t0 &&
           opening_cash_y1 == other.opening_cash_y1 &&
           initial_ppe == other.initial_ppe;
}

nlohmann::ordered_json to_json(const ModelInputs& inputs) {
    nlohmann::ordered_json j;
    j["years"] = inputs.years;
    j["credits_generated"] = inputs.credits_generated;
    j["price_per_credit"] = inputs.price_per_credit;
    j["issuance_flag"] = inputs.issuance_flag;
    j["cogs_rate"] = inputs.cogs_rate;
    j["feasibility_costs"] = signed_values(inputs.feasibility_costs);
    j["pdd_costs"] = signed_values(inputs.pdd_costs);
    j["mrv_costs"] = signed_values(inputs.mrv_costs);
    j["staff_costs"] = signed_values(inputs.staff_costs);
    j["depreciation"] = signed_values(inputs.depreciation);
    j["income_tax_rate"] = inputs.income_tax_rate;
    j["ar_rate"] = inputs.ar_rate;
    j["ap_rate"] = inputs.ap_rate;
    j["capex"] = signed_values(inputs.capex);
    j["equity_injection"] = inputs.equity_injection;
    j["interest_rate"] = inputs.interest_rate;
    j["debt_duration_years"] = inputs.debt_duration_years;
    j["debt_draw"] = inputs.debt_draw;
    j["purchase_amount"] = inputs.purchase_amount;
    j["purchase_share"] = inputs.purchase_share;
    j["discount_rate"] = inputs.discount_rate;
    j["initial_equity_t0"] = inputs.initial_equity_t0;
    j["opening_cash_y1"] = inputs.opening_cash_y1;
    j["initial_ppe"] = inputs.initial_ppe;
    return j;
}

} // namespace carboncalc
