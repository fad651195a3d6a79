#include "statements.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace carboncalc {

// ============================================================================
// Row Implementations
// ============================================================================

IncomeStatementRow::IncomeStatementRow()
    : year(0), credits_generated(0.0), credits_issued(0.0), spot_revenue(0.0),
      pre_purchase_revenue(0.0), total_revenue(0.0), cogs(0.0), gross_profit(0.0),
      feasibility_costs(0.0), pdd_costs(0.0), mrv_costs(0.0), staff_costs(0.0),
      opex_total(0.0), ebitda(0.0), depreciation(0.0), interest_expense(0.0),
      earnings_before_tax(0.0), income_tax(0.0), net_income(0.0) {}

BalanceSheetRow::BalanceSheetRow()
    : year(0), cash(0.0), accounts_receivable(0.0), ppe_gross(0.0),
      accumulated_depreciation(0.0), ppe_net(0.0), total_assets(0.0),
      accounts_payable(0.0), unearned_revenue(0.0), debt_balance(0.0),
      total_liabilities(0.0), retained_earnings(0.0), contributed_capital(0.0),
      equity_injection(0.0), total_equity(0.0), total_liabilities_equity(0.0),
      balance_check(0.0), cash_resolved_(false) {}

void BalanceSheetRow::recompute_totals() {
    total_liabilities = accounts_payable + unearned_revenue + debt_balance;
    total_equity = retained_earnings + contributed_capital;
    total_assets = cash + accounts_receivable + ppe_net;
    total_liabilities_equity = total_liabilities + total_equity;
    balance_check = total_assets - total_liabilities_equity;
}

void BalanceSheetRow::resolve_cash(double cash_end) {
    if (cash_resolved_) {
        throw std::logic_error("Balance sheet cash for year " + std::to_string(year) +
                               " has already been resolved");
    }
    cash = cash_end;
    recompute_totals();
    cash_resolved_ = true;
}

CashFlowRow::CashFlowRow()
    : year(0), net_income(0.0), depreciation_addback(0.0), change_ar(0.0),
      change_ap(0.0), change_unearned_revenue(0.0), interest_addback(0.0),
      operating_cash_flow(0.0), debt_draw(0.0), debt_repayment(0.0),
      interest_paid(0.0), equity_injection(0.0), financing_cash_flow(0.0),
      capex(0.0), investing_cash_flow(0.0), cash_start(0.0), net_change_cash(0.0),
      cash_end(0.0) {}

// ============================================================================
// StatementBuilder Implementation
// ============================================================================

StatementBuilder::StatementBuilder(const ModelInputs& inputs,
                                   const std::vector<double>& issued_credits,
                                   const RevenueAllocation& allocation)
    : inputs_(inputs), issued_credits_(issued_credits), allocation_(allocation) {
    check_horizon(issued_credits_.size(), "issued credit series");
    check_horizon(allocation_.delivered.size(), "revenue allocation");
}

void StatementBuilder::check_horizon(size_t rows, const char* what) const {
    if (rows != inputs_.num_years()) {
        throw std::invalid_argument(std::string("Length of ") + what +
                                    " does not match the model horizon");
    }
}

std::vector<IncomeStatementRow> StatementBuilder::build_income_statements(
    const std::vector<DebtScheduleRow>& debt_schedule) const
{
    check_horizon(debt_schedule.size(), "debt schedule");

    const size_t L = inputs_.num_years();
    std::vector<IncomeStatementRow> statements(L);

    for (size_t t = 0; t < L; ++t) {
        IncomeStatementRow& is = statements[t];
        is.year = inputs_.years[t];

        is.credits_generated = inputs_.credits_generated[t];
        is.credits_issued = issued_credits_[t];

        is.spot_revenue = allocation_.spot_revenue[t];
        is.pre_purchase_revenue = allocation_.pre_purchase_revenue[t];
        is.total_revenue = is.spot_revenue + is.pre_purchase_revenue;

        is.cogs = is.total_revenue * inputs_.cogs_rate;
        is.gross_profit = is.total_revenue - is.cogs;

        is.feasibility_costs = inputs_.feasibility_costs[t].value();
        is.pdd_costs = inputs_.pdd_costs[t].value();
        is.mrv_costs = inputs_.mrv_costs[t].value();
        is.staff_costs = inputs_.staff_costs[t].value();
        is.opex_total = inputs_.opex_total(t);

        is.ebitda = is.gross_profit + is.opex_total;

        is.depreciation = inputs_.depreciation[t].value();
        is.interest_expense = -debt_schedule[t].interest_expense;

        is.earnings_before_tax = is.ebitda
                               - inputs_.depreciation[t].magnitude()
                               - std::fabs(is.interest_expense);
        is.income_tax = std::max(0.0, is.earnings_before_tax * inputs_.income_tax_rate);
        is.net_income = is.earnings_before_tax - is.income_tax;
    }

    return statements;
}

std::vector<BalanceSheetRow> StatementBuilder::build_balance_sheets(
    const std::vector<IncomeStatementRow>& income_statements,
    const std::vector<DebtScheduleRow>& debt_schedule) const
{
    check_horizon(income_statements.size(), "income statements");
    check_horizon(debt_schedule.size(), "debt schedule");

    const size_t L = inputs_.num_years();
    std::vector<BalanceSheetRow> sheets(L);

    double ppe_net = inputs_.initial_ppe;
    double ppe_gross = inputs_.initial_ppe;
    double accumulated_depreciation = 0.0;
    double unearned_running = 0.0;
    double retained_earnings = 0.0;
    double contributed_capital = inputs_.initial_equity_t0;

    for (size_t t = 0; t < L; ++t) {
        const IncomeStatementRow& is = income_statements[t];
        BalanceSheetRow& bs = sheets[t];
        bs.year = inputs_.years[t];

        // Capex is negative (adds to PPE), depreciation is negative (reduces it)
        ppe_net = ppe_net - inputs_.capex[t].value() + inputs_.depreciation[t].value();
        ppe_gross += inputs_.capex[t].magnitude();
        accumulated_depreciation += inputs_.depreciation[t].magnitude();
        bs.ppe_net = ppe_net;
        bs.ppe_gross = ppe_gross;
        bs.accumulated_depreciation = accumulated_depreciation;

        bs.accounts_receivable = is.total_revenue * inputs_.ar_rate;
        bs.accounts_payable = inputs_.ap_rate * std::fabs(is.opex_total);

        unearned_running += inputs_.purchase_amount[t];
        unearned_running -= allocation_.delivered[t] * allocation_.implied_purchase_price;
        bs.unearned_revenue = std::max(0.0, unearned_running);

        bs.debt_balance = std::max(0.0, debt_schedule[t].ending_balance);

        retained_earnings += is.net_income;
        contributed_capital += inputs_.equity_injection[t];
        bs.retained_earnings = retained_earnings;
        bs.contributed_capital = contributed_capital;
        bs.equity_injection = inputs_.equity_injection[t];

        // Carried forward until the cash-flow pass resolves it
        bs.cash = (t == 0) ? inputs_.opening_cash_y1 : sheets[t - 1].cash;
        bs.recompute_totals();
    }

    return sheets;
}

std::vector<CashFlowRow> StatementBuilder::build_cash_flow_statements(
    const std::vector<IncomeStatementRow>& income_statements,
    std::vector<BalanceSheetRow>& balance_sheets,
    const std::vector<DebtScheduleRow>& debt_schedule) const
{
    check_horizon(income_statements.size(), "income statements");
    check_horizon(balance_sheets.size(), "balance sheets");
    check_horizon(debt_schedule.size(), "debt schedule");

    const size_t L = inputs_.num_years();
    std::vector<CashFlowRow> statements(L);

    // Opening working-capital position is all zero
    double prev_ar = 0.0;
    double prev_ap = 0.0;
    double prev_unearned = 0.0;

    for (size_t t = 0; t < L; ++t) {
        const IncomeStatementRow& is = income_statements[t];
        BalanceSheetRow& bs = balance_sheets[t];
        const DebtScheduleRow& debt = debt_schedule[t];
        CashFlowRow& cf = statements[t];
        cf.year = inputs_.years[t];

        // Operating
        cf.net_income = is.net_income;
        cf.depreciation_addback = inputs_.depreciation[t].magnitude();
        cf.change_ar = bs.accounts_receivable - prev_ar;
        cf.change_ap = bs.accounts_payable - prev_ap;
        cf.change_unearned_revenue = bs.unearned_revenue - prev_unearned;
        cf.interest_addback = debt.interest_expense;
        cf.operating_cash_flow = cf.net_income + cf.depreciation_addback + cf.change_ap
                               - cf.change_ar + cf.change_unearned_revenue + cf.interest_addback;

        // Financing
        cf.debt_draw = debt.draw;
        cf.debt_repayment = debt.principal_payment;
        cf.interest_paid = -debt.interest_expense;
        cf.equity_injection = inputs_.equity_injection[t];
        cf.financing_cash_flow = cf.debt_draw + cf.debt_repayment + cf.interest_paid
                               + cf.equity_injection;

        // Investing
        cf.capex = inputs_.capex[t].value();
        cf.investing_cash_flow = cf.capex;

        // Cash roll
        cf.cash_start = (t == 0) ? inputs_.opening_cash_y1 : statements[t - 1].cash_end;
        cf.net_change_cash = cf.operating_cash_flow + cf.financing_cash_flow
                           + cf.investing_cash_flow;
        cf.cash_end = cf.cash_start + cf.net_change_cash;

        // Cash is the plug: write it back and freeze the balance sheet row
        bs.resolve_cash(cf.cash_end);

        prev_ar = bs.accounts_receivable;
        prev_ap = bs.accounts_payable;
        prev_unearned = bs.unearned_revenue;
    }

    return statements;
}

} // namespace carboncalc
