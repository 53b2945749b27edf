#pragma once

#include <stdexcept>
#include <string>

namespace loans::domain {

/**
 * @brief Коды ошибок расчётного ядра и границы с коллабораторами
 */
enum class LoanErrorCode {
    NONE,
    INVALID_PRINCIPAL,   ///< Сумма займа <= 0
    INVALID_RATE,        ///< Ставка вне [0, 1]
    INVALID_TERM,        ///< Срок < 1 месяца
    INVALID_PAYMENT,     ///< Платёж <= 0, не число или разбивка не сходится с суммой
    INVALID_ACCOUNT,     ///< Счёт не указан или не найден
    NOT_FOUND,           ///< Заём или платёж не найден
    INSUFFICIENT_FUNDS,  ///< Недостаточно средств на счёте
    PERSISTENCE_FAILURE  ///< Ошибка хранилища или проводки
};

inline std::string toString(LoanErrorCode code) {
    switch (code) {
        case LoanErrorCode::NONE:                return "NONE";
        case LoanErrorCode::INVALID_PRINCIPAL:   return "INVALID_PRINCIPAL";
        case LoanErrorCode::INVALID_RATE:        return "INVALID_RATE";
        case LoanErrorCode::INVALID_TERM:        return "INVALID_TERM";
        case LoanErrorCode::INVALID_PAYMENT:     return "INVALID_PAYMENT";
        case LoanErrorCode::INVALID_ACCOUNT:     return "INVALID_ACCOUNT";
        case LoanErrorCode::NOT_FOUND:           return "NOT_FOUND";
        case LoanErrorCode::INSUFFICIENT_FUNDS:  return "INSUFFICIENT_FUNDS";
        case LoanErrorCode::PERSISTENCE_FAILURE: return "PERSISTENCE_FAILURE";
    }
    return "UNKNOWN";
}

/**
 * @brief Исключение валидации/расчёта по займу
 *
 * Бросается чистыми функциями до начала вычислений, частичных результатов не бывает.
 */
class LoanException : public std::runtime_error {
public:
    LoanException(LoanErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    LoanErrorCode code() const { return code_; }

private:
    LoanErrorCode code_;
};

} // namespace loans::domain
