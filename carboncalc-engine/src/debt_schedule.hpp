#ifndef CARBONCALC_DEBT_SCHEDULE_HPP
#define CARBONCALC_DEBT_SCHEDULE_HPP

#include "model_inputs.hpp"
#include <vector>

namespace carboncalc {

// One year of the single-facility amortization schedule
struct DebtScheduleRow {
    int year;
    double beginning_balance;       // Prior year's ending balance
    double draw;                    // Facility draw this year
    double principal_payment;       // Repayment, <= 0
    double ending_balance;          // beginning + draw + principal, >= 0
    double interest_expense;        // beginning_balance * rate, >= 0
    double dscr;                    // 0 until back-filled from EBITDA

    DebtScheduleRow();

    // |principal| + interest
    double debt_service() const;
};

// Constant (annuity) payment for a loan of `principal` over `periods` at `rate`.
// Falls back to straight-line principal / periods when rate == 0.
double annuity_payment(double rate, int periods, double principal);

// Build the amortization schedule for the single debt draw.
//
// The facility amortizes over debt_duration_years periods starting in the draw year
// (truncated at the horizon). Each period pays the constant annuity amount, split as
//
//   principal_payment[t] = -(payment - (beginning_balance[t] + draw[t]) * rate)
//
// Interest expense accrues on the beginning balance only. The principal is clamped to
// the outstanding balance and the final period retires whatever remains, so the
// ending balance never goes negative. DSCR is left at 0; see backfill_dscr().
std::vector<DebtScheduleRow> build_debt_schedule(const ModelInputs& inputs);

// Second pass once EBITDA is known:
//   dscr[t] = ebitda[t] / (|principal_payment[t]| + interest_expense[t]), 0 if no debt service
void backfill_dscr(std::vector<DebtScheduleRow>& schedule, const std::vector<double>& ebitda);

} // namespace carboncalc

#endif // CARBONCALC_DEBT_SCHEDULE_HPP
