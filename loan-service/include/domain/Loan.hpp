#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"
#include "enums/LoanKind.hpp"
#include "enums/PaymentFrequency.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Заём (выданный или полученный)
 *
 * Остаток долга здесь не хранится: он всегда пересчитывается
 * по истории платежей (см. BalanceProjector).
 */
struct Loan {
    std::string id;
    std::string tenantId;                             ///< Владелец (ключ партиционирования)
    std::string name;                                 ///< "Car Loan", "Bank Loan"
    std::optional<std::string> contactId;             ///< Контрагент
    LoanKind kind = LoanKind::PAYABLE;
    Money principal;                                  ///< Тело займа
    double annualInterestRate = 0.0;                  ///< Годовая ставка долей: 0.12 = 12%
    int termMonths = 12;
    std::optional<PaymentFrequency> paymentFrequency; ///< Нет — учитывается только общий остаток
    CalendarDate startDate;
    std::optional<Money> suggestedPaymentAmount;      ///< Кэш расчёта, только подсказка
    std::optional<std::string> notes;

    Loan() = default;

    Loan(const std::string& id_,
         const std::string& tenantId_,
         const std::string& name_,
         LoanKind kind_,
         const Money& principal_,
         double rate,
         int term,
         std::optional<PaymentFrequency> frequency,
         const CalendarDate& start)
        : id(id_)
        , tenantId(tenantId_)
        , name(name_)
        , kind(kind_)
        , principal(principal_)
        , annualInterestRate(rate)
        , termMonths(term)
        , paymentFrequency(frequency)
        , startDate(start)
    {}
};

} // namespace loans::domain
