#pragma once

#include "Money.hpp"
#include "LoanPayment.hpp"
#include "enums/LoanStatus.hpp"
#include <vector>

namespace loans::domain {

/**
 * @brief Платёж с остатком долга после него
 */
struct PaymentWithBalance {
    LoanPayment payment;
    Money balanceAfter;
};

/**
 * @brief Результат пересчёта займа по истории платежей
 */
struct BalanceProjection {
    Money principal;
    Money remainingBalance;
    Money totalPrincipalPaid;
    Money totalInterestPaid;
    std::vector<PaymentWithBalance> payments;  ///< По возрастанию даты

    LoanStatus status() const {
        return remainingBalance.isPositive() ? LoanStatus::ACTIVE : LoanStatus::PAID_OFF;
    }

    /**
     * @brief Доля погашенного тела в процентах (0..100)
     */
    double progressPercent() const {
        if (!principal.isPositive()) {
            return 0.0;
        }
        return static_cast<double>((principal - remainingBalance).cents) * 100.0
               / static_cast<double>(principal.cents);
    }
};

} // namespace loans::domain
