#ifndef CARBONCALC_TEST_FIXTURES_HPP
#define CARBONCALC_TEST_FIXTURES_HPP

#include "model_inputs.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace carboncalc {
namespace testing {

#ifndef CARBONCALC_TEST_DATA_DIR
#define CARBONCALC_TEST_DATA_DIR "data"
#endif

inline std::string data_path(const std::string& name) {
    return std::string(CARBONCALC_TEST_DATA_DIR) + "/" + name;
}

// Three-year acceptance scenario: 1000 credits generated in 2025 and issued in
// 2026 at 10/credit, one 10,000 loan at 10% over 2 years drawn in 2025, and one
// 2,000 pre-purchase in 2026 for 20% of issuance. Opening cash balances the t0
// position (initial_equity_t0 - initial_ppe).
inline ModelInputs simple_scenario() {
    ModelInputs in;
    in.years = {2025, 2026, 2027};
    in.credits_generated = {1000, 0, 0};
    in.price_per_credit = {10, 10, 10};
    in.issuance_flag = {0, 1, 0};
    in.cogs_rate = 0.10;
    in.income_tax_rate = 0.20;
    in.ar_rate = 0.05;
    in.ap_rate = 0.10;
    in.feasibility_costs = make_outflows({-5000, 0, 0});
    in.pdd_costs = make_outflows({-2000, 0, 0});
    in.mrv_costs = make_outflows({0, -1000, 0});
    in.staff_costs = make_outflows({-10000, -10000, -10000});
    in.depreciation = make_outflows({-3000, -3000, -3000});
    in.capex = make_outflows({-20000, 0, 0});
    in.interest_rate = 0.10;
    in.debt_duration_years = 2;
    in.debt_draw = {10000, 0, 0};
    in.equity_injection = {0, 0, 0};
    in.initial_equity_t0 = 5000;
    in.opening_cash_y1 = 5000;
    in.purchase_amount = {0, 2000, 0};
    in.purchase_share = 0.20;
    in.discount_rate = 0.12;
    return in;
}

// A horizon of `years` with nothing happening: no credits, costs, debt or purchase
inline ModelInputs empty_scenario(size_t years = 3) {
    ModelInputs in;
    for (size_t t = 0; t < years; ++t) {
        in.years.push_back(2030 + static_cast<int>(t));
    }
    in.credits_generated.assign(years, 0.0);
    in.price_per_credit.assign(years, 10.0);
    in.issuance_flag.assign(years, 0);
    in.feasibility_costs.assign(years, Outflow());
    in.pdd_costs.assign(years, Outflow());
    in.mrv_costs.assign(years, Outflow());
    in.staff_costs.assign(years, Outflow());
    in.depreciation.assign(years, Outflow());
    in.capex.assign(years, Outflow());
    in.equity_injection.assign(years, 0.0);
    in.debt_draw.assign(years, 0.0);
    in.purchase_amount.assign(years, 0.0);
    return in;
}

// The simple scenario as an input JSON object
inline nlohmann::json simple_scenario_json() {
    return nlohmann::json::parse(to_json(simple_scenario()).dump());
}

} // namespace testing
} // namespace carboncalc

#endif // CARBONCALC_TEST_FIXTURES_HPP
