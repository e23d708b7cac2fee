#include "savings.hpp"

namespace overpay {

SavingsTerms::SavingsTerms() : annual_rate(0.0), tax_rate(0.0) {}

SavingsTerms::SavingsTerms(double rate, double tax) : annual_rate(rate), tax_rate(tax) {}

double SavingsTerms::net_monthly_rate() const {
    return (annual_rate / 12.0) * (1.0 - tax_rate);
}

SavingsAccrual apply_savings_accrual(double balance, double net_available_cash,
                                     const SavingsTerms& terms) {
    SavingsAccrual accrual;
    accrual.interest_earned = 0.0;
    accrual.deposited = 0.0;
    accrual.balance = balance;

    if (net_available_cash > 0.0) {
        accrual.interest_earned = balance * terms.net_monthly_rate();
        accrual.deposited = net_available_cash;
        accrual.balance = balance + accrual.interest_earned + accrual.deposited;
    }

    return accrual;
}

} // namespace overpay
