#pragma once

#include "domain/Money.hpp"
#include "domain/enums/PaymentFrequency.hpp"

namespace loans::application {

/**
 * @brief Расчёт регулярного платежа по аннуитетной формуле
 *
 * payment = P * r / (1 - (1 + r)^(-n)), где r = annualRate / periodsPerYear,
 * n = round(termMonths / 12 * periodsPerYear), не меньше 1.
 * При нулевой ставке — P / n. Результат округляется до цента.
 *
 * Чистая функция, без состояния.
 */
class PaymentAmountCalculator {
public:
    /**
     * @throws domain::LoanException INVALID_PRINCIPAL / INVALID_RATE / INVALID_TERM
     */
    domain::Money compute(const domain::Money& principal,
                          double annualRate,
                          int termMonths,
                          domain::PaymentFrequency frequency) const;

    /**
     * @brief Количество платежей за весь срок
     */
    static int totalPeriods(int termMonths, domain::PaymentFrequency frequency);

    static double periodicRate(double annualRate, domain::PaymentFrequency frequency);
};

} // namespace loans::application
