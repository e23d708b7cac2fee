#include "amortization.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace overpay {

double monthly_payment(double monthly_rate, int remaining_months, double principal) {
    if (remaining_months <= 0) {
        throw std::invalid_argument("Remaining term must be positive, got " +
                                    std::to_string(remaining_months));
    }
    if (monthly_rate < 0.0) {
        throw std::invalid_argument("Monthly rate must be non-negative");
    }
    if (principal < 0.0) {
        throw std::invalid_argument("Principal must be non-negative");
    }

    const double n = static_cast<double>(remaining_months);

    // Zero rate degenerates to straight-line repayment
    if (monthly_rate == 0.0) {
        return principal / n;
    }

    // -expm1(-n*log1p(r)) == 1 - (1+r)^-n without cancellation for small r
    const double discount = -std::expm1(-n * std::log1p(monthly_rate));
    return principal * monthly_rate / discount;
}

double full_term_interest(double annual_rate, int term_months, double principal) {
    double payment = monthly_payment(annual_rate / 12.0, term_months, principal);
    return payment * static_cast<double>(term_months) - principal;
}

} // namespace overpay
