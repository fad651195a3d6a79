#ifndef CARBONCALC_STATEMENTS_HPP
#define CARBONCALC_STATEMENTS_HPP

#include "model_inputs.hpp"
#include "debt_schedule.hpp"
#include "revenue_allocation.hpp"
#include <vector>

namespace carboncalc {

// Income statement for a single year
struct IncomeStatementRow {
    int year;
    double credits_generated;
    double credits_issued;
    double spot_revenue;
    double pre_purchase_revenue;
    double total_revenue;           // spot + pre-purchase
    double cogs;                    // total_revenue * cogs_rate (positive)
    double gross_profit;
    double feasibility_costs;       // negative convention from here...
    double pdd_costs;
    double mrv_costs;
    double staff_costs;
    double opex_total;
    double ebitda;                  // gross_profit + opex_total
    double depreciation;
    double interest_expense;        // ...to here (negative of the schedule's interest)
    double earnings_before_tax;
    double income_tax;              // never negative: no benefit on losses
    double net_income;

    IncomeStatementRow();
};

// Balance sheet for a single year.
// Built with cash as a placeholder; the cash-flow pass resolves it exactly once.
struct BalanceSheetRow {
    int year;
    // Assets
    double cash;
    double accounts_receivable;
    double ppe_gross;
    double accumulated_depreciation;
    double ppe_net;
    double total_assets;
    // Liabilities
    double accounts_payable;
    double unearned_revenue;
    double debt_balance;
    double total_liabilities;
    // Equity
    double retained_earnings;
    double contributed_capital;     // initial_equity_t0 + cumulative equity injections
    double equity_injection;        // this year's injection
    double total_equity;
    double total_liabilities_equity;
    // total_assets - total_liabilities_equity, ~0 for a consistent model
    double balance_check;

    BalanceSheetRow();

    bool cash_resolved() const { return cash_resolved_; }

    // Recompute total_assets, total_liabilities_equity and balance_check from components
    void recompute_totals();

    // Write the cash figure from the cash-flow statement and freeze the row.
    // Throws std::logic_error if called twice.
    void resolve_cash(double cash_end);

private:
    bool cash_resolved_;
};

// Cash-flow statement for a single year
struct CashFlowRow {
    int year;
    // Operating activities
    double net_income;
    double depreciation_addback;
    double change_ar;
    double change_ap;
    double change_unearned_revenue;
    double interest_addback;        // settled in financing
    double operating_cash_flow;
    // Financing activities
    double debt_draw;
    double debt_repayment;          // negative
    double interest_paid;           // negative
    double equity_injection;
    double financing_cash_flow;
    // Investing activities
    double capex;                   // negative
    double investing_cash_flow;
    // Cash roll
    double cash_start;
    double net_change_cash;
    double cash_end;

    CashFlowRow();
};

// StatementBuilder: the three-statement generator.
//
// The passes must run in this order:
//   1. build_income_statements()     consumes the debt schedule's interest
//   2. backfill_dscr()               (debt_schedule.hpp) once EBITDA exists
//   3. build_balance_sheets()        consumes income statements + debt schedule
//   4. build_cash_flow_statements()  consumes balance sheets + debt schedule and
//                                    resolves each balance sheet's cash
//
// The builder only holds references to the shared, compute-once series; it never
// recomputes issuance or the revenue split.
class StatementBuilder {
public:
    StatementBuilder(const ModelInputs& inputs,
                     const std::vector<double>& issued_credits,
                     const RevenueAllocation& allocation);

    std::vector<IncomeStatementRow> build_income_statements(
        const std::vector<DebtScheduleRow>& debt_schedule) const;

    std::vector<BalanceSheetRow> build_balance_sheets(
        const std::vector<IncomeStatementRow>& income_statements,
        const std::vector<DebtScheduleRow>& debt_schedule) const;

    // Mutates balance_sheets: cash, total_assets, total_liabilities_equity, balance_check
    std::vector<CashFlowRow> build_cash_flow_statements(
        const std::vector<IncomeStatementRow>& income_statements,
        std::vector<BalanceSheetRow>& balance_sheets,
        const std::vector<DebtScheduleRow>& debt_schedule) const;

private:
    const ModelInputs& inputs_;
    const std::vector<double>& issued_credits_;
    const RevenueAllocation& allocation_;

    void check_horizon(size_t rows, const char* what) const;
};

} // namespace carboncalc

#endif // CARBONCALC_STATEMENTS_HPP
