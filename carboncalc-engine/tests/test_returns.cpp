#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "returns.hpp"
#include "financial_model.hpp"
#include "test_fixtures.hpp"
#include <cmath>

using namespace carboncalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// NPV Tests
// ============================================================================

TEST_CASE("NPV leaves the first cash flow undiscounted", "[returns][npv]") {
    REQUIRE_THAT(calculate_npv({-100, 60, 60}, 0.10), WithinAbs(4.132231, 1e-6));
    REQUIRE(calculate_npv({-100}, 0.25) == -100.0);
    REQUIRE(calculate_npv({}, 0.10) == 0.0);
}

TEST_CASE("NPV at a zero rate is the plain sum", "[returns][npv]") {
    REQUIRE_THAT(calculate_npv({-500, 200, 200, 200}, 0.0), WithinAbs(100.0, 1e-12));
}

// ============================================================================
// IRR Tests
// ============================================================================

TEST_CASE("IRR of a conventional series", "[returns][irr]") {
    std::optional<double> irr = calculate_irr({-100, 60, 60});
    REQUIRE(irr.has_value());
    REQUIRE_THAT(*irr, WithinAbs(0.130662, 1e-5));
    REQUIRE_THAT(calculate_npv({-100, 60, 60}, *irr), WithinAbs(0.0, 1e-4));
}

TEST_CASE("IRR of an uneven series", "[returns][irr]") {
    std::optional<double> irr = calculate_irr({-1000, 300, 400, 500});
    REQUIRE(irr.has_value());
    REQUIRE_THAT(*irr, WithinAbs(0.088963, 1e-5));
}

TEST_CASE("IRR can be negative", "[returns][irr]") {
    std::optional<double> irr = calculate_irr({-100, 50, 40});
    REQUIRE(irr.has_value());
    REQUIRE(*irr < 0.0);
    REQUIRE_THAT(calculate_npv({-100, 50, 40}, *irr), WithinAbs(0.0, 1e-4));
}

TEST_CASE("IRR without a sign change has no result", "[returns][irr]") {
    REQUIRE_FALSE(calculate_irr({-5000, -30061.90, -8861.90, -9600}).has_value());
    REQUIRE_FALSE(calculate_irr({100, 200, 300}).has_value());
    REQUIRE_FALSE(calculate_irr({0, 0, 0}).has_value());
    REQUIRE_FALSE(calculate_irr({-100}).has_value());
    REQUIRE_FALSE(calculate_irr({}).has_value());
}

TEST_CASE("IRR falls back to bisection when Newton cannot converge", "[returns][irr]") {
    // Deep loss recovered over 29 periods: Newton from 10% steps below -100%
    std::vector<double> series(30, 0.0);
    series[0] = -1000.0;
    series[29] = 1.0;

    std::optional<double> irr = calculate_irr(series);
    REQUIRE(irr.has_value());
    REQUIRE_THAT(*irr, WithinAbs(std::pow(0.001, 1.0 / 29.0) - 1.0, 1e-8));
}

TEST_CASE("Newton finds roots above the bisection bracket", "[returns][irr]") {
    std::optional<double> irr = calculate_irr({-1, 21});
    REQUIRE(irr.has_value());
    REQUIRE_THAT(*irr, WithinAbs(20.0, 1e-2));
}

// ============================================================================
// Payback Tests
// ============================================================================

TEST_CASE("Payback interpolates inside the crossing period", "[returns][payback]") {
    std::optional<double> payback = calculate_payback_period({-100, 60, 60});
    REQUIRE(payback.has_value());
    REQUIRE_THAT(*payback, WithinAbs(1.0 + 40.0 / 60.0, 1e-12));
}

TEST_CASE("Payback on an exact recovery is a whole period", "[returns][payback]") {
    REQUIRE(calculate_payback_period({-100, 50, 50, 50}) == std::optional<double>(2.0));
    REQUIRE(calculate_payback_period({0, 10}) == std::optional<double>(0.0));
}

TEST_CASE("Payback that is never reached has no result", "[returns][payback]") {
    REQUIRE_FALSE(calculate_payback_period({-100, 20, 20, 20}).has_value());
    REQUIRE_FALSE(calculate_payback_period({}).has_value());
}

// ============================================================================
// Free Cash Flow and Metrics Tests
// ============================================================================

TEST_CASE("Free cash flow to equity for the reference scenario", "[returns][fcf]") {
    ModelResult r = run_model(testing::simple_scenario());
    const auto& fcf = r.free_cash_flow;

    REQUIRE(fcf.size() == 3);
    REQUIRE_THAT(fcf[0].fcf_to_equity, WithinAbs(-30061.90, 0.005));
    REQUIRE_THAT(fcf[1].fcf_to_equity, WithinAbs(-8861.90, 0.005));
    REQUIRE_THAT(fcf[2].fcf_to_equity, WithinAbs(-9600.00, 0.005));

    REQUIRE(fcf[0].depreciation_addback == 3000.0);
    REQUIRE_THAT(fcf[0].change_working_capital, WithinAbs(-1700.0, 1e-9));
    REQUIRE_THAT(fcf[1].change_working_capital, WithinAbs(1100.0, 1e-9));
    REQUIRE_THAT(fcf[0].net_borrowing, WithinAbs(5238.10, 0.005));

    std::vector<double> series = equity_cash_flows(r.inputs, fcf);
    REQUIRE(series.size() == 4);
    REQUIRE(series[0] == -5000.0);
}

TEST_CASE("Metrics for the reference scenario", "[returns][metrics]") {
    Metrics m = run_model(testing::simple_scenario()).metrics;

    REQUIRE(m.total_credits_generated == 1000.0);
    REQUIRE(m.total_credits_issued == 1000.0);
    REQUIRE_THAT(m.total_revenue, WithinAbs(10000.0, 1e-9));
    REQUIRE_THAT(m.total_ebitda, WithinAbs(-29000.0, 1e-9));
    REQUIRE_THAT(m.total_net_income, WithinAbs(-38523.81, 0.005));
    REQUIRE_THAT(m.ebitda_margin, WithinAbs(-290.0, 1e-9));
    REQUIRE_THAT(m.net_margin, WithinAbs(-385.2381, 1e-4));
    REQUIRE(m.total_capex == 20000.0);
    REQUIRE_THAT(m.peak_funding_required, WithinAbs(43523.81, 0.005));
    REQUIRE_THAT(m.ending_cash, WithinAbs(-43523.81, 0.005));
    REQUIRE_THAT(m.dscr_minimum, WithinRel(-17000.0 / 4761.904762, 1e-6));
    REQUIRE_THAT(m.npv, WithinAbs(-45738.73, 0.005));

    // Every equity cash flow is negative, and the investor breaks exactly even
    REQUIRE_FALSE(m.equity_irr.has_value());
    REQUIRE_FALSE(m.payback_period.has_value());
    REQUIRE_FALSE(m.investor_irr.has_value());
}

TEST_CASE("Metrics for a profitable project", "[returns][metrics]") {
    Metrics m = run_model(load_model_inputs(testing::data_path("scenario_growth.json"))).metrics;

    REQUIRE_THAT(m.npv, WithinAbs(47957.18, 0.01));
    REQUIRE(m.equity_irr.has_value());
    REQUIRE_THAT(*m.equity_irr, WithinAbs(0.123944, 1e-5));
    REQUIRE(m.payback_period.has_value());
    REQUIRE_THAT(*m.payback_period, WithinAbs(4.716842, 1e-5));
    REQUIRE(m.investor_irr.has_value());
    REQUIRE(*m.investor_irr > 0.0);
    REQUIRE(m.peak_funding_required == 0.0);
    // The draw year's negative EBITDA sets the minimum
    REQUIRE_THAT(m.dscr_minimum, WithinRel(-105000.0 / 44384.160891, 1e-6));
}

TEST_CASE("Metrics without revenue or debt", "[returns][metrics]") {
    Metrics m = run_model(testing::empty_scenario()).metrics;

    REQUIRE(m.total_revenue == 0.0);
    REQUIRE(m.ebitda_margin == 0.0);
    REQUIRE(m.net_margin == 0.0);
    REQUIRE(m.dscr_minimum == 0.0);
    REQUIRE(m.npv == 0.0);
    REQUIRE_FALSE(m.equity_irr.has_value());
    // Nothing invested means payback at t0
    REQUIRE(m.payback_period == std::optional<double>(0.0));
}
