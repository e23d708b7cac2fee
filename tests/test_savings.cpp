#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "savings.hpp"

using namespace overpay;
using Catch::Approx;
using Catch::Matchers::WithinRel;

TEST_CASE("SavingsTerms net monthly rate", "[savings]") {
    SavingsTerms terms(0.036, 0.20);
    REQUIRE_THAT(terms.net_monthly_rate(), WithinRel(0.0024, 1e-12));

    SavingsTerms untaxed(0.06, 0.0);
    REQUIRE_THAT(untaxed.net_monthly_rate(), WithinRel(0.005, 1e-12));

    SavingsTerms none;
    REQUIRE(none.net_monthly_rate() == 0.0);
}

TEST_CASE("Savings accrual with positive cash", "[savings]") {
    SavingsTerms terms(0.036, 0.20);
    SavingsAccrual accrual = apply_savings_accrual(12520.0, 596.63, terms);

    // Interest is earned on the balance before the deposit
    REQUIRE(accrual.interest_earned == Approx(12520.0 * 0.0024));
    REQUIRE(accrual.deposited == Approx(596.63));
    REQUIRE(accrual.balance == Approx(12520.0 + 12520.0 * 0.0024 + 596.63));
}

TEST_CASE("Savings accrual with zero or negative cash", "[savings]") {
    SavingsTerms terms(0.036, 0.20);

    SECTION("Zero cash leaves the balance unchanged") {
        SavingsAccrual accrual = apply_savings_accrual(15000.0, 0.0, terms);
        REQUIRE(accrual.balance == 15000.0);
        REQUIRE(accrual.interest_earned == 0.0);
        REQUIRE(accrual.deposited == 0.0);
    }

    SECTION("Deficit is not drawn from savings") {
        SavingsAccrual accrual = apply_savings_accrual(15000.0, -250.0, terms);
        REQUIRE(accrual.balance == 15000.0);
        REQUIRE(accrual.interest_earned == 0.0);
    }
}

TEST_CASE("Savings accrual from an empty balance", "[savings]") {
    SavingsAccrual accrual = apply_savings_accrual(0.0, 400.0, SavingsTerms(0.05, 0.4));
    REQUIRE(accrual.interest_earned == 0.0);
    REQUIRE(accrual.balance == 400.0);
}
