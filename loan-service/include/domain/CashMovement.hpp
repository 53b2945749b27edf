#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Проводка по денежному счёту
 *
 * amount > 0 — поступление, amount < 0 — списание.
 */
struct CashMovement {
    std::string accountId;
    std::string tenantId;
    Money amount;
    CalendarDate date;
    std::string description;
    std::optional<std::string> loanId;
    std::optional<std::string> loanPaymentId;
};

} // namespace loans::domain
