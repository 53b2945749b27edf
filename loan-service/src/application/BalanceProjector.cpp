#include "application/BalanceProjector.hpp"
#include <algorithm>

namespace loans::application {

domain::BalanceProjection BalanceProjector::project(const domain::Loan& loan,
                                                    const std::vector<domain::LoanPayment>& payments) const
{
    domain::BalanceProjection projection;
    projection.principal = loan.principal;

    domain::Money balance = loan.principal;

    for (const auto& payment : orderPayments(payments)) {
        balance = std::max(domain::Money::zero(), balance - payment.principalAmount);
        projection.totalPrincipalPaid += payment.principalAmount;
        projection.totalInterestPaid += payment.interestAmount;
        projection.payments.push_back(domain::PaymentWithBalance{payment, balance});
    }

    projection.remainingBalance = balance;
    return projection;
}

std::vector<domain::LoanPayment> BalanceProjector::orderPayments(std::vector<domain::LoanPayment> payments)
{
    std::stable_sort(payments.begin(), payments.end(),
        [](const domain::LoanPayment& a, const domain::LoanPayment& b) {
            if (a.paymentDate != b.paymentDate) {
                return a.paymentDate < b.paymentDate;
            }
            return a.id < b.id;
        });
    return payments;
}

} // namespace loans::application
