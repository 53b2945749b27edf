#include "application/NextPaymentAdvisor.hpp"

namespace loans::application {

domain::PaymentSplit NextPaymentAdvisor::suggestNextPayment(const domain::Loan& loan,
                                                            const std::vector<domain::LoanPayment>& payments) const
{
    const auto projection = projector_.project(loan, payments);
    const domain::Money remaining = projection.remainingBalance;

    if (!remaining.isPositive()) {
        return domain::PaymentSplit{};
    }

    if (!loan.paymentFrequency) {
        return domain::PaymentSplit{remaining, domain::Money::zero()};
    }

    return allocation_.scheduledSplit(remaining, loan.annualInterestRate,
                                      *loan.paymentFrequency, regularPayment(loan));
}

domain::PaymentSplit NextPaymentAdvisor::previewAllocation(const domain::Loan& loan,
                                                           const std::vector<domain::LoanPayment>& payments,
                                                           const domain::Money& proposedTotal,
                                                           int periodsPerYearForInterest) const
{
    const auto projection = projector_.project(loan, payments);
    return allocation_.allocate(projection.remainingBalance, loan.annualInterestRate,
                                proposedTotal, periodsPerYearForInterest);
}

domain::Money NextPaymentAdvisor::regularPayment(const domain::Loan& loan) const
{
    if (loan.suggestedPaymentAmount && loan.suggestedPaymentAmount->isPositive()) {
        return *loan.suggestedPaymentAmount;
    }
    if (!loan.paymentFrequency) {
        return domain::Money::zero();
    }
    return calculator_.compute(loan.principal, loan.annualInterestRate,
                               loan.termMonths, *loan.paymentFrequency);
}

} // namespace loans::application
