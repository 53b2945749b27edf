#pragma once

#include "Money.hpp"
#include "enums/AccountType.hpp"
#include <string>

namespace loans::domain {

/**
 * @brief Результат проверки средств на счёте
 */
struct FundsCheck {
    bool hasFunds = false;
    Money available;
};

/**
 * @brief Денежный счёт (банк, наличные, кредитка)
 */
struct CashAccount {
    std::string id;
    std::string tenantId;
    std::string name;
    AccountType type = AccountType::BANK;
    Money balance;       ///< Для кредитки отрицательный, когда есть долг
    Money creditLimit;   ///< Только для CREDIT

    /**
     * @brief Сколько можно списать
     *
     * CREDIT: creditLimit + balance, остальные: balance (в минус не уходим).
     */
    Money available() const {
        if (type == AccountType::CREDIT) {
            return creditLimit + balance;
        }
        return balance;
    }

    FundsCheck checkFunds(const Money& amount) const {
        Money avail = available();
        return FundsCheck{avail >= amount, avail};
    }
};

} // namespace loans::domain
