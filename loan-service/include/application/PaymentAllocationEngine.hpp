#pragma once

#include "domain/Money.hpp"
#include "domain/PaymentSplit.hpp"
#include "domain/enums/PaymentFrequency.hpp"

namespace loans::application {

/**
 * @brief Разбивка фактического платежа на тело и проценты
 *
 * Для произвольного (внепланового) платежа:
 * - interest = min(round(outstanding * annualRate / periodsPerYearForInterest, 2), total)
 * - principal = total - interest
 *
 * Проценты никогда не превышают сам платёж. Вызывающий может задать
 * свою разбивку (customSplit), она принимается без проверки по формуле.
 */
class PaymentAllocationEngine {
public:
    /**
     * @throws domain::LoanException INVALID_PAYMENT если proposedTotal <= 0,
     *         INVALID_RATE если ставка вне [0, 1]
     * @throws std::invalid_argument если periodsPerYearForInterest < 1
     */
    domain::PaymentSplit allocate(const domain::Money& outstandingBalance,
                                  double annualRate,
                                  const domain::Money& proposedTotal,
                                  int periodsPerYearForInterest) const;

    /**
     * @brief Разбивка, заданная пользователем
     */
    domain::PaymentSplit customSplit(const domain::Money& principal, const domain::Money& interest) const;

    /**
     * @brief Следующий плановый платёж при известном регулярном платеже
     *
     * Проценты за период считаются по периодичности займа, тело = regular - interest,
     * но не больше остатка (последний платёж).
     */
    domain::PaymentSplit scheduledSplit(const domain::Money& outstandingBalance,
                                        double annualRate,
                                        domain::PaymentFrequency frequency,
                                        const domain::Money& regularPayment) const;
};

} // namespace loans::application
