#ifndef CARBONCALC_RETURNS_HPP
#define CARBONCALC_RETURNS_HPP

#include "model_inputs.hpp"
#include "debt_schedule.hpp"
#include "revenue_allocation.hpp"
#include "statements.hpp"
#include <optional>
#include <vector>

namespace carboncalc {

// IRR root-finder settings
constexpr double IRR_INITIAL_GUESS = 0.10;
constexpr double IRR_TOLERANCE = 1e-4;          // |NPV| at which a rate is accepted
constexpr int IRR_MAX_ITERATIONS = 100;
constexpr double IRR_LOWER_BOUND = -0.9999;     // bisection bracket
constexpr double IRR_UPPER_BOUND = 10.0;

// Free cash flow to equity for a single year
struct FreeCashFlowRow {
    int year;
    double net_income;
    double depreciation_addback;
    double change_working_capital;  // d(AR - AP)
    double capex;                   // negative
    double net_borrowing;           // draw + principal_payment
    double fcf_to_equity;

    FreeCashFlowRow();
};

// Scalar summary of a model run
struct Metrics {
    // Operational
    double total_credits_generated;
    double total_credits_issued;
    double total_revenue;
    double total_ebitda;
    double total_net_income;
    double ebitda_margin;           // percent of revenue, 0 without revenue
    double net_margin;              // percent of revenue, 0 without revenue

    // Investment
    double total_capex;             // magnitude
    double peak_funding_required;   // |lowest cash balance| when cash dips below 0
    double ending_cash;

    // Debt
    double dscr_minimum;            // over years with debt service, 0 if none

    // Returns (empty optional: no IRR / payback within the horizon)
    double npv;
    std::optional<double> equity_irr;
    std::optional<double> investor_irr;
    std::optional<double> payback_period;

    Metrics();
};

// fcfe[t] = net_income + |depreciation| - d(AR - AP) + capex + (draw + principal_payment)
std::vector<FreeCashFlowRow> build_free_cash_flow(
    const ModelInputs& inputs,
    const std::vector<IncomeStatementRow>& income_statements,
    const std::vector<BalanceSheetRow>& balance_sheets,
    const std::vector<DebtScheduleRow>& debt_schedule
);

// Equity cash-flow series: [-initial_equity_t0, fcfe[0], ..., fcfe[L-1]]
std::vector<double> equity_cash_flows(const ModelInputs& inputs,
                                      const std::vector<FreeCashFlowRow>& free_cash_flow);

// NPV = sum(cf[i] / (1 + rate)^i); index 0 is undiscounted
double calculate_npv(const std::vector<double>& cash_flows, double rate);

// Internal rate of return as a decimal (0.13 = 13%).
// Newton-Raphson from IRR_INITIAL_GUESS; if that fails, bisection over
// [IRR_LOWER_BOUND, IRR_UPPER_BOUND]. Returns std::nullopt when the series has no
// sign change or no root can be bracketed. Never throws.
std::optional<double> calculate_irr(const std::vector<double>& cash_flows);

// First index at which the cumulative sum becomes >= 0, interpolated linearly
// inside the crossing period. std::nullopt if it never does.
std::optional<double> calculate_payback_period(const std::vector<double>& cash_flows);

Metrics calculate_metrics(
    const ModelInputs& inputs,
    const std::vector<IncomeStatementRow>& income_statements,
    const std::vector<CashFlowRow>& cash_flow_statements,
    const std::vector<DebtScheduleRow>& debt_schedule,
    const std::vector<CarbonStreamRow>& carbon_stream,
    const std::vector<FreeCashFlowRow>& free_cash_flow
);

} // namespace carboncalc

#endif // CARBONCALC_RETURNS_HPP
