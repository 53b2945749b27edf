#include "application/PaymentAmountCalculator.hpp"
#include "application/LoanValidation.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace loans::application {

domain::Money PaymentAmountCalculator::compute(const domain::Money& principal,
                                               double annualRate,
                                               int termMonths,
                                               domain::PaymentFrequency frequency) const
{
    validation::validateLoanTerms(principal, annualRate, termMonths);

    const int periods = totalPeriods(termMonths, frequency);
    const double rate = periodicRate(annualRate, frequency);
    const double principalCents = static_cast<double>(principal.cents);

    if (rate == 0.0) {
        return domain::Money::fromCents(std::llround(principalCents / periods));
    }

    const double payment = principalCents * rate / (1.0 - std::pow(1.0 + rate, -periods));
    return domain::Money::fromCents(std::llround(payment));
}

int PaymentAmountCalculator::totalPeriods(int termMonths, domain::PaymentFrequency frequency)
{
    // termMonths / 12 * periodsPerYear, произведение в int64_t, делим последним
    const int64_t product = static_cast<int64_t>(termMonths) * domain::periodsPerYear(frequency);
    const int64_t periods = std::llround(static_cast<double>(product) / 12.0);
    return static_cast<int>(std::clamp<int64_t>(periods, 1, std::numeric_limits<int>::max()));
}

double PaymentAmountCalculator::periodicRate(double annualRate, domain::PaymentFrequency frequency)
{
    return annualRate / domain::periodsPerYear(frequency);
}

} // namespace loans::application
