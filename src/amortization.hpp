#ifndef OVERPAY_AMORTIZATION_HPP
#define OVERPAY_AMORTIZATION_HPP

namespace overpay {

// Level monthly payment that amortizes principal to zero after
// remaining_months payments at monthly_rate per period:
//
//   payment = P * r / (1 - (1 + r)^-n)     for r > 0
//   payment = P / n                        for r == 0
//
// Throws std::invalid_argument if remaining_months <= 0, monthly_rate < 0 or
// principal < 0.
double monthly_payment(double monthly_rate, int remaining_months, double principal);

// Total interest over the full term of a loan repaid by level payments with no
// overpayments: payment * term_months - principal.
double full_term_interest(double annual_rate, int term_months, double principal);

} // namespace overpay

#endif // OVERPAY_AMORTIZATION_HPP
