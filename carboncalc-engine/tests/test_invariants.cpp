#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "invariants.hpp"
#include "test_fixtures.hpp"

using namespace carboncalc;
using Catch::Matchers::ContainsSubstring;

namespace {

struct QuietLogger {
    QuietLogger() {
        LoggerConfig config;
        config.enable_console = false;
        Logger::get_instance().configure(config);
    }
    ~QuietLogger() {
        Logger::get_instance().configure(LoggerConfig());
    }
};

const InvariantResult& find_check(const std::vector<InvariantResult>& results,
                                  const std::string& name) {
    for (const InvariantResult& r : results) {
        if (r.name == name) {
            return r;
        }
    }
    FAIL("No invariant named " << name);
    return results.front();
}

} // anonymous namespace

// ============================================================================
// Passing Results
// ============================================================================

TEST_CASE("Every identity holds on the reference scenario", "[invariants]") {
    std::vector<InvariantResult> results = check_invariants(run_model(testing::simple_scenario()));

    REQUIRE(results.size() == 14);
    for (const InvariantResult& r : results) {
        INFO(r.name << ": " << r.details);
        REQUIRE(r.pass);
        REQUIRE(r.details.empty());
    }
    REQUIRE(count_failures(results) == 0);
}

TEST_CASE("Every identity holds on the growth scenario", "[invariants]") {
    ModelResult result = run_model(load_model_inputs(testing::data_path("scenario_growth.json")));
    REQUIRE(count_failures(check_invariants(result)) == 0);
}

TEST_CASE("Every identity holds on an idle horizon", "[invariants]") {
    REQUIRE(count_failures(check_invariants(run_model(testing::empty_scenario(4)))) == 0);
}

// ============================================================================
// Failing Results
// ============================================================================

TEST_CASE("Unbalanced opening position fails only the balance identity", "[invariants]") {
    QuietLogger quiet;
    ModelInputs in = testing::simple_scenario();
    in.opening_cash_y1 = 0.0;

    std::vector<InvariantResult> results = check_invariants(run_model(in));

    const InvariantResult& balance = find_check(results, "balance_identity");
    REQUIRE_FALSE(balance.pass);
    REQUIRE_THAT(balance.details, ContainsSubstring("year 2025"));
    REQUIRE(count_failures(results) == 1);
}

TEST_CASE("Tampered rows are caught by the matching identity", "[invariants]") {
    const ModelResult clean = run_model(testing::simple_scenario());

    SECTION("revenue") {
        ModelResult r = clean;
        r.income_statements[1].total_revenue += 1.0;
        std::vector<InvariantResult> results = check_invariants(r);
        REQUIRE_FALSE(find_check(results, "revenue_sum").pass);
        REQUIRE_FALSE(find_check(results, "cogs").pass);
    }

    SECTION("interest sign") {
        ModelResult r = clean;
        r.income_statements[1].interest_expense = -r.income_statements[1].interest_expense;
        REQUIRE_FALSE(find_check(check_invariants(r), "interest_sign").pass);
    }

    SECTION("debt roll") {
        ModelResult r = clean;
        r.debt_schedule[0].ending_balance += 100.0;
        REQUIRE_FALSE(find_check(check_invariants(r), "debt_roll").pass);
    }

    SECTION("dscr") {
        ModelResult r = clean;
        r.debt_schedule[0].dscr = 0.0;
        REQUIRE_FALSE(find_check(check_invariants(r), "dscr_formula").pass);
    }

    SECTION("cash tie-out") {
        ModelResult r = clean;
        r.cash_flow_statements[2].cash_end += 5.0;
        std::vector<InvariantResult> results = check_invariants(r);
        REQUIRE_FALSE(find_check(results, "cash_tie_out").pass);
        REQUIRE_FALSE(find_check(results, "cash_roll").pass);
    }

    SECTION("cash continuity") {
        ModelResult r = clean;
        r.cash_flow_statements[0].cash_start = 0.0;
        REQUIRE_FALSE(find_check(check_invariants(r), "cash_continuity").pass);
    }

    SECTION("implied price") {
        ModelResult r = clean;
        r.carbon_stream[2].implied_purchase_price = 11.0;
        const InvariantResult& price = find_check(check_invariants(r), "single_implied_price");
        REQUIRE_FALSE(price.pass);
        REQUIRE_THAT(price.details, ContainsSubstring("year 2027"));
    }

    SECTION("issuance") {
        ModelResult r = clean;
        r.income_statements[1].credits_issued = 1500.0;
        REQUIRE_FALSE(find_check(check_invariants(r), "issuance_bound").pass);
    }
}

TEST_CASE("Only the first offending year is reported", "[invariants]") {
    ModelResult r = run_model(testing::simple_scenario());
    r.carbon_stream[1].implied_purchase_price = 12.0;
    r.carbon_stream[2].implied_purchase_price = 13.0;

    const InvariantResult& price = find_check(check_invariants(r), "single_implied_price");
    REQUIRE_THAT(price.details, ContainsSubstring("year 2026"));
    REQUIRE_THAT(price.details, !ContainsSubstring("2027"));
}

TEST_CASE("Mismatched statement lengths fail the balance identity", "[invariants]") {
    ModelResult r = run_model(testing::simple_scenario());
    r.balance_sheets.pop_back();

    std::vector<InvariantResult> results = check_invariants(r);
    const InvariantResult& balance = find_check(results, "balance_identity");
    REQUIRE_FALSE(balance.pass);
    REQUIRE(balance.details == "statement lengths differ");
}
