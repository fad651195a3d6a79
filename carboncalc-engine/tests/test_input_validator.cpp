#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "input_validator.hpp"
#include "test_fixtures.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace carboncalc;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

// Quiet logger so advisories do not clutter test output
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

} // anonymous namespace

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_CASE("parse_model_inputs accepts the reference scenario", "[validator][parse]") {
    ModelInputs in = parse_model_inputs(testing::simple_scenario_json());
    REQUIRE(in == testing::simple_scenario());
}

TEST_CASE("parse_model_inputs defaults the optional opening position", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();
    j.erase("initial_equity_t0");
    j.erase("opening_cash_y1");
    j.erase("initial_ppe");

    ModelInputs in = parse_model_inputs(j);
    REQUIRE(in.initial_equity_t0 == 0.0);
    REQUIRE(in.opening_cash_y1 == 0.0);
    REQUIRE(in.initial_ppe == 0.0);
}

TEST_CASE("parse_model_inputs rejects unrecognized keys", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();
    j["tax_holiday_years"] = 2;
    REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("tax_holiday_years"));
    REQUIRE_THROWS_AS(parse_model_inputs(j), ValidationError);
}

TEST_CASE("parse_model_inputs rejects missing required keys", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();
    j.erase("discount_rate");
    REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("discount_rate"));
}

TEST_CASE("parse_model_inputs rejects wrongly typed values", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();

    SECTION("string rate") {
        j["cogs_rate"] = "0.1";
        REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("cogs_rate"));
    }

    SECTION("scalar where an array is expected") {
        j["capex"] = -20000;
        REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("capex"));
    }

    SECTION("non-numeric array element") {
        j["price_per_credit"][1] = nullptr;
        REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("price_per_credit[1]"));
    }

    SECTION("non-object document") {
        REQUIRE_THROWS_AS(parse_model_inputs(nlohmann::json::array()), ValidationError);
    }
}

TEST_CASE("parse_model_inputs accepts integral floats for integer fields", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();
    j["debt_duration_years"] = 2.0;
    REQUIRE(parse_model_inputs(j).debt_duration_years == 2);

    j["debt_duration_years"] = 1.5;
    REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("debt_duration_years"));
}

TEST_CASE("parse_model_inputs rejects integers outside the int range", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();

    SECTION("unsigned literal that would wrap to a small term") {
        j["debt_duration_years"] = std::uint64_t{4294967298};
        REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("out of range"));
    }

    SECTION("negative literal that would wrap to a small term") {
        j["debt_duration_years"] = std::int64_t{-4294967294};
        REQUIRE_THROWS_AS(parse_model_inputs(j), ValidationError);
    }

    SECTION("integral float beyond int") {
        j["debt_duration_years"] = 1e10;
        REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("debt_duration_years"));
    }

    SECTION("year array element") {
        j["years"][0] = 1e10;
        REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("years[0]"));
    }

    SECTION("from JSON text") {
        std::string text = j.dump();
        std::string key = "\"debt_duration_years\":2";
        text.replace(text.find(key), key.size(), "\"debt_duration_years\":4294967298");
        REQUIRE_THROWS_AS(parse_model_inputs_from_string(text), ValidationError);
    }
}

TEST_CASE("parse_model_inputs enforces strict issuance flags", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();
    j["issuance_flag"][1] = 0.5;
    REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("issuance_flag[1]"));

    j["issuance_flag"][1] = 2;
    REQUIRE_THROWS_AS(parse_model_inputs(j), ValidationError);
}

TEST_CASE("parse_model_inputs rejects positive negative-convention lines", "[validator][parse]") {
    nlohmann::json j = testing::simple_scenario_json();
    j["depreciation"][2] = 3000;
    REQUIRE_THROWS_WITH(parse_model_inputs(j), ContainsSubstring("depreciation[2]"));
}

TEST_CASE("parse_model_inputs_from_string reports malformed JSON", "[validator][parse]") {
    REQUIRE_THROWS_AS(parse_model_inputs_from_string("{\"years\": [2025,"), ValidationError);

    std::string text = testing::simple_scenario_json().dump();
    REQUIRE(parse_model_inputs_from_string(text) == testing::simple_scenario());
}

TEST_CASE("load_model_inputs reads the bundled scenario", "[validator][io]") {
    ModelInputs in = load_model_inputs(testing::data_path("scenario_simple.json"));
    REQUIRE(in == testing::simple_scenario());
}

TEST_CASE("load_model_inputs fails on a missing file", "[validator][io]") {
    REQUIRE_THROWS_AS(load_model_inputs("/nonexistent/carboncalc/model.json"), std::runtime_error);
}

// ============================================================================
// Semantic Validation Tests
// ============================================================================

TEST_CASE("validate_inputs accepts a balanced model without advisories", "[validator]") {
    ValidationReport report = check_model_inputs(testing::simple_scenario());
    REQUIRE_FALSE(report.has_advisories());
    REQUIRE(report.required_opening_cash == 5000.0);
}

TEST_CASE("validate_inputs requires a non-empty, increasing timeline", "[validator]") {
    ModelInputs in = testing::simple_scenario();

    SECTION("empty") {
        ModelInputs empty;
        REQUIRE_THROWS_AS(check_model_inputs(empty), ValidationError);
    }

    SECTION("repeated year") {
        in.years = {2025, 2025, 2026};
        REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("strictly increasing"));
    }
}

TEST_CASE("validate_inputs checks every array against the horizon", "[validator]") {
    ModelInputs in = testing::simple_scenario();
    in.price_per_credit.push_back(10);
    REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("price_per_credit"));
}

TEST_CASE("validate_inputs bounds every rate to [0, 1]", "[validator]") {
    ModelInputs in = testing::simple_scenario();

    SECTION("above one") {
        in.income_tax_rate = 1.2;
        REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("income_tax_rate"));
    }

    SECTION("negative") {
        in.discount_rate = -0.01;
        REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("discount_rate"));
    }

    SECTION("boundaries are accepted") {
        in.cogs_rate = 0.0;
        in.ap_rate = 1.0;
        REQUIRE_NOTHROW(check_model_inputs(in));
    }
}

TEST_CASE("validate_inputs requires a positive debt duration", "[validator]") {
    ModelInputs in = testing::simple_scenario();
    in.debt_duration_years = 0;
    REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("debt_duration_years"));
}

TEST_CASE("validate_inputs allows at most one purchase year", "[validator]") {
    ModelInputs in = testing::simple_scenario();
    in.purchase_amount = {1000, 2000, 0};
    REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("purchase_amount"));
}

TEST_CASE("validate_inputs allows at most one debt draw", "[validator]") {
    ModelInputs in = testing::simple_scenario();
    in.debt_draw = {10000, 0, 5000};
    REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("debt_draw"));
}

TEST_CASE("validate_inputs rejects negative draws and purchases", "[validator]") {
    ModelInputs in = testing::simple_scenario();
    in.debt_draw = {-10000, 0, 0};
    REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("2025"));
}

TEST_CASE("validate_inputs requires a purchase share with a purchase", "[validator]") {
    ModelInputs in = testing::simple_scenario();
    in.purchase_share = 0.0;
    REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("purchase_share"));

    // No purchase, no share needed
    in.purchase_amount = {0, 0, 0};
    REQUIRE_NOTHROW(check_model_inputs(in));
}

TEST_CASE("validate_inputs rejects non-finite values", "[validator]") {
    ModelInputs in = testing::simple_scenario();
    in.price_per_credit[2] = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_WITH(check_model_inputs(in), ContainsSubstring("price_per_credit"));
}

TEST_CASE("validate_inputs flags an unbalanced opening position", "[validator][advisory]") {
    QuietLogger quiet;
    ModelInputs in = testing::simple_scenario();
    in.opening_cash_y1 = 0.0;

    ValidationReport report = validate_inputs(in, LogContext("advisory_test", "validate"));

    REQUIRE(report.has_advisories());
    REQUIRE(report.advisories.size() == 1);
    REQUIRE(report.required_opening_cash == 5000.0);
    REQUIRE_THAT(report.advisories[0], ContainsSubstring("5000.00"));
}

TEST_CASE("validate_inputs tolerates a one-cent opening gap", "[validator][advisory]") {
    ModelInputs in = testing::simple_scenario();
    in.initial_ppe = 1000.0;
    in.opening_cash_y1 = 4000.005;
    REQUIRE_FALSE(check_model_inputs(in).has_advisories());
    REQUIRE(required_opening_cash(in) == 4000.0);
}
