#include "application/PaymentAllocationEngine.hpp"
#include "application/LoanValidation.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace loans::application {

domain::PaymentSplit PaymentAllocationEngine::allocate(const domain::Money& outstandingBalance,
                                                       double annualRate,
                                                       const domain::Money& proposedTotal,
                                                       int periodsPerYearForInterest) const
{
    validation::validatePaymentAmount(proposedTotal);
    validation::validateRate(annualRate);
    if (periodsPerYearForInterest < 1) {
        throw std::invalid_argument("periodsPerYearForInterest must be positive, got "
                                    + std::to_string(periodsPerYearForInterest));
    }

    const double periodicRate = annualRate / periodsPerYearForInterest;
    const domain::Money accrued = std::max(domain::Money::zero(), outstandingBalance.applyRate(periodicRate));

    domain::PaymentSplit split;
    split.interest = std::min(accrued, proposedTotal);
    split.principal = proposedTotal - split.interest;
    return split;
}

domain::PaymentSplit PaymentAllocationEngine::customSplit(const domain::Money& principal,
                                                          const domain::Money& interest) const
{
    return domain::PaymentSplit{principal, interest};
}

domain::PaymentSplit PaymentAllocationEngine::scheduledSplit(const domain::Money& outstandingBalance,
                                                             double annualRate,
                                                             domain::PaymentFrequency frequency,
                                                             const domain::Money& regularPayment) const
{
    validation::validateRate(annualRate);

    domain::PaymentSplit split;
    if (!outstandingBalance.isPositive()) {
        return split;
    }

    const double periodicRate = annualRate / domain::periodsPerYear(frequency);
    split.interest = outstandingBalance.applyRate(periodicRate);

    domain::Money principal = std::max(domain::Money::zero(), regularPayment - split.interest);
    split.principal = std::min(principal, outstandingBalance);
    return split;
}

} // namespace loans::application
