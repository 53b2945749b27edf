#pragma once

#include "Money.hpp"

namespace loans::domain {

/**
 * @brief Разбивка платежа на тело и проценты
 */
struct PaymentSplit {
    Money principal;
    Money interest;

    Money total() const {
        return principal + interest;
    }
};

} // namespace loans::domain
