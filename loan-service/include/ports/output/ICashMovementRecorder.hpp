#pragma once

#include "domain/CashAccount.hpp"
#include "domain/CashMovement.hpp"
#include "domain/Money.hpp"
#include <string>
#include <optional>

namespace loans::ports::output {

/**
 * @brief Проводки по денежным счетам (общая книга транзакций)
 *
 * Выдача займа и платежи по нему отражаются встречными проводками
 * на денежном счёте. Остаток счёта ведёт сама книга.
 */
class ICashMovementRecorder {
public:
    virtual ~ICashMovementRecorder() = default;

    virtual std::optional<domain::CashAccount> getAccount(const std::string& accountId) = 0;

    /**
     * @brief Хватит ли средств на счёте для списания amount
     */
    virtual domain::FundsCheck checkFunds(const domain::CashAccount& account, const domain::Money& amount) = 0;

    /**
     * @brief Провести движение денег
     * @return ID транзакции
     * @throws std::runtime_error при ошибке записи
     */
    virtual std::string postTransaction(const domain::CashMovement& movement) = 0;

    /**
     * @brief Удалить проводки, привязанные к платежу по займу
     * @return Количество удалённых проводок
     */
    virtual int removeTransactionsForPayment(const std::string& loanPaymentId) = 0;
};

} // namespace loans::ports::output
