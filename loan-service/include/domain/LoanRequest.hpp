#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"
#include "enums/LoanKind.hpp"
#include "enums/PaymentFrequency.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Запрос на создание/изменение займа
 */
class LoanRequest {
public:
    std::string tenantId;
    std::string name;
    std::optional<std::string> contactId;
    LoanKind kind = LoanKind::PAYABLE;
    Money principal;
    double annualInterestRate = 0.0;
    int termMonths = 12;
    std::optional<PaymentFrequency> paymentFrequency;
    CalendarDate startDate;
    std::optional<std::string> notes;
    std::optional<std::string> disbursementAccountId;  ///< Счёт для проводки выдачи (только при создании)

    LoanRequest() = default;
};

} // namespace loans::domain
