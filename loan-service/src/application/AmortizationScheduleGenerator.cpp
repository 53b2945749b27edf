#include "application/AmortizationScheduleGenerator.hpp"
#include <algorithm>

namespace loans::application {

std::vector<domain::AmortizationScheduleEntry> AmortizationScheduleGenerator::generate(
    const domain::Money& principal,
    double annualRate,
    int termMonths,
    const domain::CalendarDate& startDate,
    domain::PaymentFrequency frequency) const
{
    // compute() валидирует входные данные до начала расчёта
    const domain::Money payment = calculator_.compute(principal, annualRate, termMonths, frequency);
    const int periods = PaymentAmountCalculator::totalPeriods(termMonths, frequency);
    const double rate = PaymentAmountCalculator::periodicRate(annualRate, frequency);

    std::vector<domain::AmortizationScheduleEntry> schedule;
    schedule.reserve(static_cast<size_t>(periods));

    domain::Money balance = principal;

    for (int i = 1; i <= periods; ++i) {
        domain::AmortizationScheduleEntry entry;
        entry.paymentNumber = i;
        entry.paymentDate = paymentDate(startDate, frequency, i);
        entry.interestAmount = balance.applyRate(rate);

        if (i == periods) {
            // Последний платёж забирает остаток от округлений
            entry.principalAmount = balance;
        } else {
            domain::Money portion = payment - entry.interestAmount;
            portion = std::max(portion, domain::Money::zero());
            entry.principalAmount = std::min(portion, balance);
        }

        entry.paymentAmount = entry.principalAmount + entry.interestAmount;
        balance = std::max(domain::Money::zero(), balance - entry.principalAmount);
        entry.remainingBalanceAfter = balance;

        schedule.push_back(entry);
    }

    return schedule;
}

domain::CalendarDate AmortizationScheduleGenerator::paymentDate(const domain::CalendarDate& startDate,
                                                                domain::PaymentFrequency frequency,
                                                                int paymentNumber)
{
    switch (frequency) {
        case domain::PaymentFrequency::WEEKLY:    return domain::addDays(startDate, 7 * paymentNumber);
        case domain::PaymentFrequency::BIWEEKLY:  return domain::addDays(startDate, 14 * paymentNumber);
        case domain::PaymentFrequency::MONTHLY:   return domain::addMonths(startDate, paymentNumber);
        case domain::PaymentFrequency::QUARTERLY: return domain::addMonths(startDate, 3 * paymentNumber);
        case domain::PaymentFrequency::ANNUALLY:  return domain::addMonths(startDate, 12 * paymentNumber);
    }
    return startDate;
}

} // namespace loans::application
