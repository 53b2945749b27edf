#pragma once

#include <string>
#include <stdexcept>

namespace loans::domain {

/**
 * @brief Направление займа
 *
 * Влияет только на знак движения денег по счёту, но не на расчёт графика.
 */
enum class LoanKind {
    PAYABLE,    ///< Мы заняли: выдача увеличивает остаток на счёте, платёж уменьшает
    RECEIVABLE  ///< Мы дали в долг: выдача уменьшает остаток, платёж увеличивает
};

inline std::string toString(LoanKind kind) {
    switch (kind) {
        case LoanKind::PAYABLE:    return "payable";
        case LoanKind::RECEIVABLE: return "receivable";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline LoanKind parseLoanKind(const std::string& str) {
    if (str == "payable" || str == "PAYABLE")       return LoanKind::PAYABLE;
    if (str == "receivable" || str == "RECEIVABLE") return LoanKind::RECEIVABLE;
    throw std::invalid_argument("Unknown loan kind: " + str);
}

} // namespace loans::domain
