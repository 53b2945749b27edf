#pragma once

#include "domain/Loan.hpp"
#include "domain/LoanPayment.hpp"
#include "domain/BalanceProjection.hpp"
#include <vector>

namespace loans::application {

/**
 * @brief Пересчёт остатка займа по истории платежей
 *
 * Единственный источник правды по остатку. Сохранённым остаткам не доверяет:
 * 1. платежи сортируются по (дата, id), результат не зависит от порядка на входе;
 * 2. balance = principal;
 * 3. для каждого платежа balance = max(0, balance - principal платежа),
 *    суммы тела и процентов накапливаются как есть.
 *
 * Переплата обнуляет остаток на каждом шаге (а не только в конце),
 * поэтому правка старого платежа не "воскрешает" отрицательный остаток.
 * Побочных эффектов нет, вызывать можно сколько угодно раз.
 */
class BalanceProjector {
public:
    domain::BalanceProjection project(const domain::Loan& loan,
                                      const std::vector<domain::LoanPayment>& payments) const;

    /**
     * @brief Порядок применения платежей: дата, затем id
     */
    static std::vector<domain::LoanPayment> orderPayments(std::vector<domain::LoanPayment> payments);
};

} // namespace loans::application
