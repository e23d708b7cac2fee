#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config.hpp"
#include <cmath>
#include <limits>
#include <string>

using namespace overpay;
using Catch::Approx;

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("SimulationConfig defaults describe the example household", "[config]") {
    SimulationConfig config;

    REQUIRE(config.initial_principal == 100000.0);
    REQUIRE(config.term_months == 300);
    REQUIRE(config.fixed_terms.size() == 2);
    REQUIRE(config.fixed_terms[0] == FixedRateTerm(24, 0.041));
    REQUIRE(config.fixed_terms[1] == FixedRateTerm(60, 0.034));
    REQUIRE(config.variable_rate == Approx(0.05));
    REQUIRE(config.monthly_income == 3130.0);
    REQUIRE(config.monthly_expenses == 2000.0);
    REQUIRE(config.initial_savings == 16000.0);
    REQUIRE(config.emergency_floor == Approx(12520.0));
    REQUIRE(config.min_overpayment_threshold == 1000.0);
    REQUIRE(config.overpayments_enabled);
    REQUIRE(config.horizon_months == 360);

    REQUIRE_NOTHROW(validate_config(config));
}

TEST_CASE("emergency_floor_from_months multiplies income", "[config]") {
    REQUIRE(emergency_floor_from_months(3130.0, 4.0) == Approx(12520.0));
    REQUIRE(emergency_floor_from_months(2500.0, 0.0) == 0.0);
    REQUIRE(emergency_floor_from_months(2000.0, 1.5) == Approx(3000.0));
    REQUIRE_THROWS_AS(emergency_floor_from_months(3000.0, -1.0), InvalidConfiguration);
}

// ============================================================================
// Validation
// ============================================================================

namespace {

std::string rejected_field(const SimulationConfig& config) {
    try {
        validate_config(config);
    } catch (const InvalidConfiguration& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

TEST_CASE("validate_config rejects out-of-range values", "[config]") {
    SimulationConfig config;

    SECTION("Non-positive principal") {
        config.initial_principal = 0.0;
        REQUIRE(rejected_field(config) == "initial_principal");
    }

    SECTION("Non-finite principal") {
        config.initial_principal = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(rejected_field(config) == "initial_principal");
    }

    SECTION("Non-positive term") {
        config.term_months = 0;
        REQUIRE(rejected_field(config) == "term_months");
    }

    SECTION("Non-positive horizon") {
        config.horizon_months = -12;
        REQUIRE(rejected_field(config) == "horizon_months");
    }

    SECTION("Zero-length fixed period") {
        config.fixed_terms[1].months = 0;
        REQUIRE(rejected_field(config) == "fixed_terms[1]");
    }

    SECTION("Fixed rate of 100%") {
        config.fixed_terms[0].annual_rate = 1.0;
        REQUIRE(rejected_field(config) == "fixed_terms[0]");
    }

    SECTION("Negative variable rate") {
        config.variable_rate = -0.01;
        REQUIRE(rejected_field(config) == "variable_rate");
    }

    SECTION("Savings tax rate out of range") {
        config.savings_tax_rate = 1.2;
        REQUIRE(rejected_field(config) == "savings_tax_rate");
    }

    SECTION("Negative savings") {
        config.initial_savings = -1.0;
        REQUIRE(rejected_field(config) == "initial_savings");
    }

    SECTION("Negative emergency floor") {
        config.emergency_floor = -100.0;
        REQUIRE(rejected_field(config) == "emergency_floor");
    }

    SECTION("Negative threshold") {
        config.min_overpayment_threshold = -5.0;
        REQUIRE(rejected_field(config) == "min_overpayment_threshold");
    }
}

TEST_CASE("validate_config accepts boundary values", "[config]") {
    SimulationConfig config;

    SECTION("No fixed periods") {
        config.fixed_terms.clear();
        REQUIRE_NOTHROW(validate_config(config));
    }

    SECTION("Zero rates everywhere") {
        for (FixedRateTerm& term : config.fixed_terms) {
            term.annual_rate = 0.0;
        }
        config.variable_rate = 0.0;
        config.savings_rate = 0.0;
        config.savings_tax_rate = 0.0;
        REQUIRE_NOTHROW(validate_config(config));
    }

    SECTION("Zero floor and threshold") {
        config.emergency_floor = 0.0;
        config.min_overpayment_threshold = 0.0;
        config.initial_savings = 0.0;
        REQUIRE_NOTHROW(validate_config(config));
    }
}

TEST_CASE("InvalidConfiguration message names the field", "[config]") {
    InvalidConfiguration error("variable_rate", "rate must be in [0, 1)");
    REQUIRE(error.field() == "variable_rate");
    REQUIRE(std::string(error.what()) == "variable_rate: rate must be in [0, 1)");
}
