#include "returns.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace carboncalc {

// ============================================================================
// Row Implementations
// ============================================================================

FreeCashFlowRow::FreeCashFlowRow()
    : year(0), net_income(0.0), depreciation_addback(0.0), change_working_capital(0.0),
      capex(0.0), net_borrowing(0.0), fcf_to_equity(0.0) {}

Metrics::Metrics()
    : total_credits_generated(0.0), total_credits_issued(0.0), total_revenue(0.0),
      total_ebitda(0.0), total_net_income(0.0), ebitda_margin(0.0), net_margin(0.0),
      total_capex(0.0), peak_funding_required(0.0), ending_cash(0.0),
      dscr_minimum(0.0), npv(0.0) {}

// ============================================================================
// Free Cash Flow
// ============================================================================

std::vector<FreeCashFlowRow> build_free_cash_flow(
    const ModelInputs& inputs,
    const std::vector<IncomeStatementRow>& income_statements,
    const std::vector<BalanceSheetRow>& balance_sheets,
    const std::vector<DebtScheduleRow>& debt_schedule)
{
    const size_t L = inputs.num_years();
    if (income_statements.size() != L || balance_sheets.size() != L || debt_schedule.size() != L) {
        throw std::invalid_argument("Statement lengths do not match the model horizon");
    }

    std::vector<FreeCashFlowRow> fcf(L);
    double prev_working_capital = 0.0;

    for (size_t t = 0; t < L; ++t) {
        FreeCashFlowRow& row = fcf[t];
        row.year = inputs.years[t];
        row.net_income = income_statements[t].net_income;
        row.depreciation_addback = inputs.depreciation[t].magnitude();

        double working_capital = balance_sheets[t].accounts_receivable
                               - balance_sheets[t].accounts_payable;
        row.change_working_capital = working_capital - prev_working_capital;
        prev_working_capital = working_capital;

        row.capex = inputs.capex[t].value();
        row.net_borrowing = debt_schedule[t].draw + debt_schedule[t].principal_payment;

        row.fcf_to_equity = row.net_income + row.depreciation_addback
                          - row.change_working_capital + row.capex + row.net_borrowing;
    }

    return fcf;
}

std::vector<double> equity_cash_flows(const ModelInputs& inputs,
                                      const std::vector<FreeCashFlowRow>& free_cash_flow) {
    std::vector<double> series;
    series.reserve(free_cash_flow.size() + 1);
    series.push_back(-inputs.initial_equity_t0);
    for (const FreeCashFlowRow& row : free_cash_flow) {
        series.push_back(row.fcf_to_equity);
    }
    return series;
}

// ============================================================================
// NPV / IRR / Payback
// ============================================================================

double calculate_npv(const std::vector<double>& cash_flows, double rate) {
    double npv = 0.0;
    double discount_factor = 1.0;
    for (double cf : cash_flows) {
        npv += cf * discount_factor;
        discount_factor /= (1.0 + rate);
    }
    return npv;
}

namespace {

// d(NPV)/d(rate)
double npv_derivative(const std::vector<double>& cash_flows, double rate) {
    double derivative = 0.0;
    for (size_t i = 1; i < cash_flows.size(); ++i) {
        double power = static_cast<double>(i);
        derivative -= power * cash_flows[i] / std::pow(1.0 + rate, power + 1.0);
    }
    return derivative;
}

bool has_sign_change(const std::vector<double>& cash_flows) {
    bool has_positive = std::any_of(cash_flows.begin(), cash_flows.end(),
                                    [](double v) { return v > 0.0; });
    bool has_negative = std::any_of(cash_flows.begin(), cash_flows.end(),
                                    [](double v) { return v < 0.0; });
    return has_positive && has_negative;
}

std::optional<double> newton_irr(const std::vector<double>& cash_flows) {
    double rate = IRR_INITIAL_GUESS;

    for (int i = 0; i < IRR_MAX_ITERATIONS; ++i) {
        double npv = calculate_npv(cash_flows, rate);
        if (!std::isfinite(npv)) {
            return std::nullopt;
        }
        if (std::fabs(npv) < IRR_TOLERANCE) {
            return rate;
        }

        double derivative = npv_derivative(cash_flows, rate);
        if (!std::isfinite(derivative) || std::fabs(derivative) < 1e-12) {
            return std::nullopt;
        }

        double next = rate - npv / derivative;
        if (!std::isfinite(next) || next <= -1.0) {
            return std::nullopt;
        }
        rate = next;
    }

    return std::nullopt;
}

std::optional<double> bisection_irr(const std::vector<double>& cash_flows) {
    double lo = IRR_LOWER_BOUND;
    double hi = IRR_UPPER_BOUND;
    double npv_lo = calculate_npv(cash_flows, lo);
    double npv_hi = calculate_npv(cash_flows, hi);

    if (!std::isfinite(npv_lo) || !std::isfinite(npv_hi)) {
        return std::nullopt;
    }
    if (npv_lo == 0.0) return lo;
    if (npv_hi == 0.0) return hi;
    if ((npv_lo > 0.0) == (npv_hi > 0.0)) {
        return std::nullopt;
    }

    for (int i = 0; i < 200; ++i) {
        double mid = 0.5 * (lo + hi);
        double npv_mid = calculate_npv(cash_flows, mid);
        if (std::fabs(npv_mid) < IRR_TOLERANCE || (hi - lo) < 1e-12) {
            return mid;
        }
        if ((npv_mid > 0.0) == (npv_lo > 0.0)) {
            lo = mid;
            npv_lo = npv_mid;
        } else {
            hi = mid;
        }
    }

    return 0.5 * (lo + hi);
}

} // anonymous namespace

std::optional<double> calculate_irr(const std::vector<double>& cash_flows) {
    if (cash_flows.size() < 2 || !has_sign_change(cash_flows)) {
        return std::nullopt;
    }

    std::optional<double> rate = newton_irr(cash_flows);
    if (rate.has_value()) {
        return rate;
    }
    return bisection_irr(cash_flows);
}

std::optional<double> calculate_payback_period(const std::vector<double>& cash_flows) {
    double cumulative = 0.0;
    for (size_t i = 0; i < cash_flows.size(); ++i) {
        double previous = cumulative;
        cumulative += cash_flows[i];
        if (cumulative >= 0.0) {
            if (i == 0 || cash_flows[i] <= 0.0) {
                return static_cast<double>(i);
            }
            // Fraction of period i needed to recover the deficit carried in
            double fraction = -previous / cash_flows[i];
            return static_cast<double>(i - 1) + fraction;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Metrics
// ============================================================================

Metrics calculate_metrics(
    const ModelInputs& inputs,
    const std::vector<IncomeStatementRow>& income_statements,
    const std::vector<CashFlowRow>& cash_flow_statements,
    const std::vector<DebtScheduleRow>& debt_schedule,
    const std::vector<CarbonStreamRow>& carbon_stream,
    const std::vector<FreeCashFlowRow>& free_cash_flow)
{
    Metrics m;

    for (const IncomeStatementRow& is : income_statements) {
        m.total_credits_generated += is.credits_generated;
        m.total_credits_issued += is.credits_issued;
        m.total_revenue += is.total_revenue;
        m.total_ebitda += is.ebitda;
        m.total_net_income += is.net_income;
    }
    if (m.total_revenue > 0.0) {
        m.ebitda_margin = m.total_ebitda / m.total_revenue * 100.0;
        m.net_margin = m.total_net_income / m.total_revenue * 100.0;
    }

    for (const Outflow& capex : inputs.capex) {
        m.total_capex += capex.magnitude();
    }

    if (!cash_flow_statements.empty()) {
        double lowest_cash = std::numeric_limits<double>::max();
        for (const CashFlowRow& cf : cash_flow_statements) {
            lowest_cash = std::min(lowest_cash, cf.cash_end);
        }
        m.peak_funding_required = std::fabs(std::min(0.0, lowest_cash));
        m.ending_cash = cash_flow_statements.back().cash_end;
    }

    bool any_debt_service = false;
    for (const DebtScheduleRow& row : debt_schedule) {
        if (row.debt_service() > 0.0) {
            m.dscr_minimum = any_debt_service ? std::min(m.dscr_minimum, row.dscr) : row.dscr;
            any_debt_service = true;
        }
    }

    std::vector<double> equity_series = equity_cash_flows(inputs, free_cash_flow);
    m.npv = calculate_npv(equity_series, inputs.discount_rate);
    m.equity_irr = calculate_irr(equity_series);
    m.payback_period = calculate_payback_period(equity_series);

    std::vector<double> investor_series;
    investor_series.reserve(carbon_stream.size());
    for (const CarbonStreamRow& row : carbon_stream) {
        investor_series.push_back(row.investor_cash_flow);
    }
    m.investor_irr = calculate_irr(investor_series);

    return m;
}

} // namespace carboncalc
