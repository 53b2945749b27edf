#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"
#include "PaymentSplit.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Запрос на запись (или изменение) платежа по займу
 *
 * Без customSplit разбивка на тело/проценты считается автоматически.
 */
class PaymentRequest {
public:
    std::string loanId;
    std::string accountId;
    CalendarDate paymentDate;
    Money totalAmount;
    std::optional<PaymentSplit> customSplit;
    std::optional<std::string> notes;

    PaymentRequest() = default;
};

} // namespace loans::domain
