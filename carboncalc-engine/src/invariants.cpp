#include "invariants.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace carboncalc {

namespace {

bool near(double a, double b) {
    return std::fabs(a - b) < INVARIANT_TOLERANCE;
}

// Record the first failure only; later years add nothing the caller can act on
void fail(InvariantResult& check, int year, double expected, double actual) {
    if (!check.pass) {
        return;
    }
    check.pass = false;
    std::ostringstream oss;
    oss << "year " << year << ": expected " << expected << ", got " << actual;
    check.details = oss.str();
}

void expect_near(InvariantResult& check, int year, double expected, double actual) {
    if (!near(expected, actual)) {
        fail(check, year, expected, actual);
    }
}

} // anonymous namespace

std::vector<InvariantResult> check_invariants(const ModelResult& result) {
    const ModelInputs& in = result.inputs;
    const size_t L = result.income_statements.size();

    InvariantResult revenue_sum("revenue_sum", "total_revenue = spot_revenue + pre_purchase_revenue");
    InvariantResult opex_sum("opex_sum", "opex_total = feasibility + pdd + mrv + staff");
    InvariantResult cogs("cogs", "cogs = total_revenue * cogs_rate");
    InvariantResult income_chain("income_chain", "ebitda, ebt and net income follow from their components");
    InvariantResult interest_sign("interest_sign", "income-statement interest is the negative of the schedule's interest");
    InvariantResult debt_roll("debt_roll", "ending = beginning + draw + principal, never negative");
    InvariantResult dscr_formula("dscr_formula", "dscr = ebitda / (|principal| + interest), 0 without debt service");
    InvariantResult balance_identity("balance_identity", "total_assets = total_liabilities + total_equity");
    InvariantResult equity_identity("equity_identity", "total_equity = retained_earnings + contributed_capital");
    InvariantResult cash_tie_out("cash_tie_out", "balance-sheet cash equals cash-flow cash_end");
    InvariantResult cash_roll("cash_roll", "cash_end = cash_start + operating + financing + investing");
    InvariantResult cash_continuity("cash_continuity", "cash_start follows opening cash and the prior cash_end");
    InvariantResult single_price("single_implied_price", "one implied purchase price on every carbon-stream row");
    InvariantResult issuance_bound("issuance_bound", "cumulative issuance never exceeds cumulative generation");

    const bool lengths_match = result.balance_sheets.size() == L &&
                               result.cash_flow_statements.size() == L &&
                               result.debt_schedule.size() == L;
    if (!lengths_match) {
        balance_identity.pass = false;
        balance_identity.details = "statement lengths differ";
    }

    double cumulative_generated = 0.0;
    double cumulative_issued = 0.0;

    for (size_t t = 0; lengths_match && t < L; ++t) {
        const IncomeStatementRow& is = result.income_statements[t];
        const BalanceSheetRow& bs = result.balance_sheets[t];
        const CashFlowRow& cf = result.cash_flow_statements[t];
        const DebtScheduleRow& debt = result.debt_schedule[t];
        const int year = is.year;

        expect_near(revenue_sum, year, is.spot_revenue + is.pre_purchase_revenue, is.total_revenue);

        if (t < in.num_years()) {
            expect_near(opex_sum, year, in.opex_total(t), is.opex_total);
        }
        expect_near(cogs, year, is.total_revenue * in.cogs_rate, is.cogs);

        expect_near(income_chain, year, is.gross_profit + is.opex_total, is.ebitda);
        expect_near(income_chain, year,
                    is.ebitda - std::fabs(is.depreciation) - std::fabs(is.interest_expense),
                    is.earnings_before_tax);
        expect_near(income_chain, year, is.earnings_before_tax - is.income_tax, is.net_income);
        if (is.income_tax < 0.0) {
            fail(income_chain, year, 0.0, is.income_tax);
        }

        expect_near(interest_sign, year, -debt.interest_expense, is.interest_expense);
        if (debt.interest_expense < 0.0) {
            fail(interest_sign, year, 0.0, debt.interest_expense);
        }

        expect_near(debt_roll, year, debt.beginning_balance + debt.draw + debt.principal_payment,
                    debt.ending_balance);
        if (debt.ending_balance < 0.0 || debt.principal_payment > 0.0) {
            fail(debt_roll, year, 0.0, debt.ending_balance);
        }
        if (t > 0) {
            expect_near(debt_roll, year, result.debt_schedule[t - 1].ending_balance,
                        debt.beginning_balance);
        }

        double service = debt.debt_service();
        expect_near(dscr_formula, year, service > 0.0 ? is.ebitda / service : 0.0, debt.dscr);

        expect_near(balance_identity, year, 0.0, bs.balance_check);
        expect_near(balance_identity, year, bs.total_liabilities + bs.total_equity,
                    bs.total_liabilities_equity);
        expect_near(equity_identity, year, bs.retained_earnings + bs.contributed_capital,
                    bs.total_equity);

        expect_near(cash_tie_out, year, cf.cash_end, bs.cash);
        if (!bs.cash_resolved()) {
            fail(cash_tie_out, year, cf.cash_end, bs.cash);
        }

        expect_near(cash_roll, year,
                    cf.operating_cash_flow + cf.financing_cash_flow + cf.investing_cash_flow,
                    cf.net_change_cash);
        expect_near(cash_roll, year, cf.cash_start + cf.net_change_cash, cf.cash_end);

        double expected_start = (t == 0) ? in.opening_cash_y1
                                         : result.cash_flow_statements[t - 1].cash_end;
        expect_near(cash_continuity, year, expected_start, cf.cash_start);

        cumulative_generated += is.credits_generated;
        cumulative_issued += is.credits_issued;
        if (cumulative_issued > cumulative_generated + 1e-9 || is.credits_issued < 0.0) {
            fail(issuance_bound, year, cumulative_generated, cumulative_issued);
        }
    }

    if (!result.carbon_stream.empty()) {
        double price = result.carbon_stream.front().implied_purchase_price;
        for (const CarbonStreamRow& row : result.carbon_stream) {
            if (row.implied_purchase_price != price) {
                fail(single_price, row.year, price, row.implied_purchase_price);
            }
        }
    }

    return {revenue_sum, opex_sum, cogs, income_chain, interest_sign, debt_roll,
            dscr_formula, balance_identity, equity_identity, cash_tie_out, cash_roll,
            cash_continuity, single_price, issuance_bound};
}

size_t count_failures(const std::vector<InvariantResult>& results) {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [](const InvariantResult& r) { return !r.pass; }));
}

} // namespace carboncalc
