#include "debt_schedule.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace carboncalc {

DebtScheduleRow::DebtScheduleRow()
    : year(0),
      beginning_balance(0.0),
      draw(0.0),
      principal_payment(0.0),
      ending_balance(0.0),
      interest_expense(0.0),
      dscr(0.0) {}

double DebtScheduleRow::debt_service() const {
    return std::fabs(principal_payment) + interest_expense;
}

double annuity_payment(double rate, int periods, double principal) {
    if (periods <= 0) {
        throw std::invalid_argument("Annuity periods must be positive");
    }
    if (rate == 0.0) {
        return principal / static_cast<double>(periods);
    }
    // Discount form stays finite for long terms, where (1 + r)^n overflows
    double discount = std::pow(1.0 + rate, -static_cast<double>(periods));
    return principal * rate / (1.0 - discount);
}

std::vector<DebtScheduleRow> build_debt_schedule(const ModelInputs& inputs) {
    const size_t L = inputs.num_years();
    const double rate = inputs.interest_rate;
    const int term = inputs.debt_duration_years;

    std::vector<DebtScheduleRow> schedule(L);

    std::optional<size_t> draw_year = inputs.debt_draw_index();
    double payment = 0.0;
    if (draw_year.has_value()) {
        payment = annuity_payment(rate, term, inputs.debt_draw[*draw_year]);
    }

    for (size_t t = 0; t < L; ++t) {
        DebtScheduleRow& row = schedule[t];
        row.year = inputs.years[t];
        row.beginning_balance = (t == 0) ? 0.0 : schedule[t - 1].ending_balance;
        row.draw = inputs.debt_draw[t];
        row.interest_expense = row.beginning_balance * rate;

        double outstanding = row.beginning_balance + row.draw;

        if (draw_year.has_value() && t >= *draw_year &&
            t < *draw_year + static_cast<size_t>(term)) {
            size_t period = t - *draw_year + 1;
            double principal;
            if (period == static_cast<size_t>(term)) {
                // Final period retires the balance exactly
                principal = outstanding;
            } else {
                principal = payment - outstanding * rate;
            }
            principal = std::clamp(principal, 0.0, outstanding);
            row.principal_payment = (principal == 0.0) ? 0.0 : -principal;
        }

        row.ending_balance = std::max(0.0, outstanding + row.principal_payment);
    }

    return schedule;
}

void backfill_dscr(std::vector<DebtScheduleRow>& schedule, const std::vector<double>& ebitda) {
    if (schedule.size() != ebitda.size()) {
        throw std::invalid_argument("EBITDA series does not match the debt schedule");
    }
    for (size_t t = 0; t < schedule.size(); ++t) {
        double service = schedule[t].debt_service();
        schedule[t].dscr = (service > 0.0) ? ebitda[t] / service : 0.0;
    }
}

} // namespace carboncalc
