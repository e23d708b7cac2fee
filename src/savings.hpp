#ifndef OVERPAY_SAVINGS_HPP
#define OVERPAY_SAVINGS_HPP

namespace overpay {

// Savings account terms
struct SavingsTerms {
    double annual_rate;     // Gross annual interest rate
    double tax_rate;        // Fraction of interest withheld as tax

    SavingsTerms();
    SavingsTerms(double rate, double tax);

    // (annual_rate / 12) * (1 - tax_rate)
    double net_monthly_rate() const;
};

// Outcome of one month of savings accrual
struct SavingsAccrual {
    double interest_earned;     // After-tax interest credited
    double deposited;           // Net cash deposited
    double balance;             // Balance after accrual
};

// Credit one month to the savings balance.
// When net available cash is positive the balance grows by the after-tax
// interest on the pre-deposit balance plus the cash itself. A zero or negative
// month leaves the balance untouched: deficits are not drawn from savings and
// no interest is credited.
SavingsAccrual apply_savings_accrual(double balance, double net_available_cash,
                                     const SavingsTerms& terms);

} // namespace overpay

#endif // OVERPAY_SAVINGS_HPP
