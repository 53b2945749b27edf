#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Изменяемые поля платежа
 */
struct LoanPaymentUpdate {
    std::string accountId;
    CalendarDate paymentDate;
    Money totalAmount;
    Money principalAmount;
    Money interestAmount;
    std::optional<std::string> notes;
};

} // namespace loans::domain
