#pragma once

#include "application/PaymentAmountCalculator.hpp"
#include "domain/AmortizationScheduleEntry.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/Money.hpp"
#include "domain/enums/PaymentFrequency.hpp"
#include <vector>

namespace loans::application {

/**
 * @brief Генератор графика платежей (амортизации)
 *
 * Для каждого периода i = 1..n:
 * - interest = round(balance * r, 2)
 * - principal = payment - interest (не больше остатка)
 * - в последнем периоде principal = весь остаток, payment = principal + interest,
 *   поэтому график всегда закрывается ровно в ноль и сумма тела равна займу
 *
 * Дата i-го платежа = startDate + i периодов. Месячные/квартальные/годовые
 * периоды считаются по календарю (тот же день месяца).
 *
 * @example
 * ```cpp
 * AmortizationScheduleGenerator gen;
 * auto schedule = gen.generate(Money::fromDouble(10000), 0.06, 24,
 *                              parseDate("2024-01-15"), PaymentFrequency::MONTHLY);
 * // schedule.size() == 24, schedule.back().remainingBalanceAfter == 0
 * ```
 */
class AmortizationScheduleGenerator {
public:
    AmortizationScheduleGenerator() = default;

    explicit AmortizationScheduleGenerator(PaymentAmountCalculator calculator)
        : calculator_(calculator) {}

    /**
     * @throws domain::LoanException INVALID_PRINCIPAL / INVALID_RATE / INVALID_TERM
     */
    std::vector<domain::AmortizationScheduleEntry> generate(const domain::Money& principal,
                                                            double annualRate,
                                                            int termMonths,
                                                            const domain::CalendarDate& startDate,
                                                            domain::PaymentFrequency frequency) const;

    /**
     * @brief Дата платежа с номером paymentNumber (startDate + paymentNumber периодов)
     */
    static domain::CalendarDate paymentDate(const domain::CalendarDate& startDate,
                                            domain::PaymentFrequency frequency,
                                            int paymentNumber);

private:
    PaymentAmountCalculator calculator_;
};

} // namespace loans::application
