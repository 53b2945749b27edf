#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"

namespace loans::domain {

/**
 * @brief Строка графика платежей (вычисляется, не хранится)
 */
struct AmortizationScheduleEntry {
    int paymentNumber = 0;           ///< С единицы
    CalendarDate paymentDate;
    Money paymentAmount;
    Money principalAmount;
    Money interestAmount;
    Money remainingBalanceAfter;
};

} // namespace loans::domain
