#include "result_tables.hpp"

namespace carboncalc {
namespace io {

namespace {

// Build a table from rows by listing (column name, precision, member pointer)
template <typename Row>
struct ColumnSpec {
    const char* name;
    int precision;
    double Row::*member;
};

template <typename Row>
StatementTable make_table(const std::string& name, const std::vector<Row>& rows,
                          const std::vector<ColumnSpec<Row>>& specs) {
    StatementTable table;
    table.name = name;
    table.years.reserve(rows.size());
    for (const Row& row : rows) {
        table.years.push_back(row.year);
    }

    table.columns.reserve(specs.size());
    for (const ColumnSpec<Row>& spec : specs) {
        Column column{spec.name, spec.precision, {}};
        column.values.reserve(rows.size());
        for (const Row& row : rows) {
            column.values.push_back(row.*(spec.member));
        }
        table.columns.push_back(std::move(column));
    }
    return table;
}

constexpr int M = MONEY_PRECISION;
constexpr int R = RATE_PRECISION;

} // anonymous namespace

std::vector<StatementTable> build_statement_tables(const ModelResult& result) {
    using IS = IncomeStatementRow;
    using BS = BalanceSheetRow;
    using CF = CashFlowRow;
    using DS = DebtScheduleRow;
    using CS = CarbonStreamRow;
    using FCF = FreeCashFlowRow;

    std::vector<StatementTable> tables;

    tables.push_back(make_table<IS>("income_statements", result.income_statements, {
        {"credits_generated", M, &IS::credits_generated},
        {"credits_issued", M, &IS::credits_issued},
        {"spot_revenue", M, &IS::spot_revenue},
        {"pre_purchase_revenue", M, &IS::pre_purchase_revenue},
        {"total_revenue", M, &IS::total_revenue},
        {"cogs", M, &IS::cogs},
        {"gross_profit", M, &IS::gross_profit},
        {"feasibility_costs", M, &IS::feasibility_costs},
        {"pdd_costs", M, &IS::pdd_costs},
        {"mrv_costs", M, &IS::mrv_costs},
        {"staff_costs", M, &IS::staff_costs},
        {"opex_total", M, &IS::opex_total},
        {"ebitda", M, &IS::ebitda},
        {"depreciation", M, &IS::depreciation},
        {"interest_expense", M, &IS::interest_expense},
        {"earnings_before_tax", M, &IS::earnings_before_tax},
        {"income_tax", M, &IS::income_tax},
        {"net_income", M, &IS::net_income},
    }));

    tables.push_back(make_table<BS>("balance_sheets", result.balance_sheets, {
        {"cash", M, &BS::cash},
        {"accounts_receivable", M, &BS::accounts_receivable},
        {"ppe_gross", M, &BS::ppe_gross},
        {"accumulated_depreciation", M, &BS::accumulated_depreciation},
        {"ppe_net", M, &BS::ppe_net},
        {"total_assets", M, &BS::total_assets},
        {"accounts_payable", M, &BS::accounts_payable},
        {"unearned_revenue", M, &BS::unearned_revenue},
        {"debt_balance", M, &BS::debt_balance},
        {"total_liabilities", M, &BS::total_liabilities},
        {"retained_earnings", M, &BS::retained_earnings},
        {"contributed_capital", M, &BS::contributed_capital},
        {"equity_injection", M, &BS::equity_injection},
        {"total_equity", M, &BS::total_equity},
        {"total_liabilities_equity", M, &BS::total_liabilities_equity},
        {"balance_check", M, &BS::balance_check},
    }));

    tables.push_back(make_table<CF>("cash_flow_statements", result.cash_flow_statements, {
        {"net_income", M, &CF::net_income},
        {"depreciation_addback", M, &CF::depreciation_addback},
        {"change_ar", M, &CF::change_ar},
        {"change_ap", M, &CF::change_ap},
        {"change_unearned_revenue", M, &CF::change_unearned_revenue},
        {"interest_addback", M, &CF::interest_addback},
        {"operating_cash_flow", M, &CF::operating_cash_flow},
        {"debt_draw", M, &CF::debt_draw},
        {"debt_repayment", M, &CF::debt_repayment},
        {"interest_paid", M, &CF::interest_paid},
        {"equity_injection", M, &CF::equity_injection},
        {"financing_cash_flow", M, &CF::financing_cash_flow},
        {"capex", M, &CF::capex},
        {"investing_cash_flow", M, &CF::investing_cash_flow},
        {"cash_start", M, &CF::cash_start},
        {"net_change_cash", M, &CF::net_change_cash},
        {"cash_end", M, &CF::cash_end},
    }));

    tables.push_back(make_table<DS>("debt_schedule", result.debt_schedule, {
        {"beginning_balance", M, &DS::beginning_balance},
        {"draw", M, &DS::draw},
        {"principal_payment", M, &DS::principal_payment},
        {"ending_balance", M, &DS::ending_balance},
        {"interest_expense", M, &DS::interest_expense},
        {"dscr", R, &DS::dscr},
    }));

    tables.push_back(make_table<CS>("carbon_stream", result.carbon_stream, {
        {"purchase_amount", M, &CS::purchase_amount},
        {"purchased_credits", M, &CS::purchased_credits},
        {"implied_purchase_price", R, &CS::implied_purchase_price},
        {"investor_cash_flow", M, &CS::investor_cash_flow},
    }));

    tables.push_back(make_table<FCF>("free_cash_flow", result.free_cash_flow, {
        {"net_income", M, &FCF::net_income},
        {"depreciation_addback", M, &FCF::depreciation_addback},
        {"change_working_capital", M, &FCF::change_working_capital},
        {"capex", M, &FCF::capex},
        {"net_borrowing", M, &FCF::net_borrowing},
        {"fcf_to_equity", M, &FCF::fcf_to_equity},
    }));

    return tables;
}

std::vector<MetricEntry> metric_entries(const Metrics& m) {
    return {
        {"total_credits_generated", m.total_credits_generated, M},
        {"total_credits_issued", m.total_credits_issued, M},
        {"total_revenue", m.total_revenue, M},
        {"total_ebitda", m.total_ebitda, M},
        {"total_net_income", m.total_net_income, M},
        {"ebitda_margin", m.ebitda_margin, R},
        {"net_margin", m.net_margin, R},
        {"total_capex", m.total_capex, M},
        {"peak_funding_required", m.peak_funding_required, M},
        {"ending_cash", m.ending_cash, M},
        {"dscr_minimum", m.dscr_minimum, R},
        {"npv", m.npv, M},
        {"equity_irr", m.equity_irr, R},
        {"investor_irr", m.investor_irr, R},
        {"payback_period", m.payback_period, R},
    };
}

} // namespace io
} // namespace carboncalc
