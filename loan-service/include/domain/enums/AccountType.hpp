#pragma once

#include <string>
#include <stdexcept>

namespace loans::domain {

/**
 * @brief Тип денежного счёта
 */
enum class AccountType {
    BANK,
    CASH,
    CREDIT  ///< Кредитная карта/линия: баланс может быть отрицательным в пределах лимита
};

inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::BANK:   return "bank";
        case AccountType::CASH:   return "cash";
        case AccountType::CREDIT: return "credit";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType parseAccountType(const std::string& str) {
    if (str == "bank" || str == "BANK")     return AccountType::BANK;
    if (str == "cash" || str == "CASH")     return AccountType::CASH;
    if (str == "credit" || str == "CREDIT") return AccountType::CREDIT;
    throw std::invalid_argument("Unknown account type: " + str);
}

} // namespace loans::domain
