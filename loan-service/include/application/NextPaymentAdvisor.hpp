#pragma once

#include "application/BalanceProjector.hpp"
#include "application/PaymentAllocationEngine.hpp"
#include "application/PaymentAmountCalculator.hpp"
#include "domain/Loan.hpp"
#include "domain/LoanPayment.hpp"
#include "domain/PaymentSplit.hpp"
#include <vector>

namespace loans::application {

/**
 * @brief Подсказка следующего платежа по займу
 *
 * Сначала пересчитывает остаток (BalanceProjector), затем:
 * - заём погашен → нулевой платёж;
 * - периодичность не задана → весь остаток телом, без процентов;
 * - иначе плановый платёж (suggestedPaymentAmount или расчёт по условиям),
 *   разбитый на проценты за период и тело, не больше остатка.
 */
class NextPaymentAdvisor {
public:
    domain::PaymentSplit suggestNextPayment(const domain::Loan& loan,
                                            const std::vector<domain::LoanPayment>& payments) const;

    /**
     * @brief Автоматическая разбивка произвольной суммы против текущего остатка
     *
     * @throws domain::LoanException INVALID_PAYMENT если proposedTotal <= 0
     */
    domain::PaymentSplit previewAllocation(const domain::Loan& loan,
                                           const std::vector<domain::LoanPayment>& payments,
                                           const domain::Money& proposedTotal,
                                           int periodsPerYearForInterest) const;

    /**
     * @brief Регулярный платёж займа: кэш, если есть, иначе расчёт
     */
    domain::Money regularPayment(const domain::Loan& loan) const;

private:
    BalanceProjector projector_;
    PaymentAllocationEngine allocation_;
    PaymentAmountCalculator calculator_;
};

} // namespace loans::application
