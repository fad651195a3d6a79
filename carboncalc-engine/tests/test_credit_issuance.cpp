#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "credit_issuance.hpp"
#include <numeric>
#include <stdexcept>

using namespace carboncalc;
using Catch::Approx;

TEST_CASE("Issuance follows flagged years only", "[issuance]") {
    std::vector<double> issued = calculate_issued_credits({1000, 0, 0}, {0, 1, 0});
    REQUIRE(issued == std::vector<double>{0, 1000, 0});
}

TEST_CASE("Unissued inventory carries to the next flagged year", "[issuance]") {
    std::vector<double> issued = calculate_issued_credits({500, 300, 200, 100}, {0, 0, 1, 1});
    REQUIRE(issued[0] == 0.0);
    REQUIRE(issued[1] == 0.0);
    REQUIRE(issued[2] == Approx(1000.0));
    REQUIRE(issued[3] == Approx(100.0));
}

TEST_CASE("Issuing every year issues each year's generation", "[issuance]") {
    std::vector<double> generated = {120.5, 80.25, 0.0, 42.0};
    std::vector<double> issued = calculate_issued_credits(generated, {1, 1, 1, 1});
    for (size_t t = 0; t < generated.size(); ++t) {
        REQUIRE(issued[t] == Approx(generated[t]));
    }
}

TEST_CASE("No flags means no issuance", "[issuance]") {
    std::vector<double> issued = calculate_issued_credits({100, 200, 300}, {0, 0, 0});
    REQUIRE(std::accumulate(issued.begin(), issued.end(), 0.0) == 0.0);
}

TEST_CASE("Cumulative issuance never exceeds cumulative generation", "[issuance]") {
    std::vector<double> generated = {400, 0, 300, 0, 50};
    std::vector<int> flags = {1, 1, 0, 1, 1};
    std::vector<double> issued = calculate_issued_credits(generated, flags);

    double cumulative_generated = 0.0;
    double cumulative_issued = 0.0;
    for (size_t t = 0; t < generated.size(); ++t) {
        cumulative_generated += generated[t];
        cumulative_issued += issued[t];
        REQUIRE(issued[t] >= 0.0);
        REQUIRE(cumulative_issued <= cumulative_generated + 1e-9);
        if (flags[t] == 0) {
            REQUIRE(issued[t] == 0.0);
        }
    }
    REQUIRE(issued[1] == 0.0);
    REQUIRE(issued[3] == Approx(300.0));
    REQUIRE(issued[4] == Approx(50.0));
}

TEST_CASE("Issuance rejects mismatched series", "[issuance]") {
    REQUIRE_THROWS_AS(calculate_issued_credits({1, 2, 3}, {1, 0}), std::invalid_argument);
}
