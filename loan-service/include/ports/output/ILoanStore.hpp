#pragma once

#include "domain/Loan.hpp"
#include "domain/LoanPayment.hpp"
#include "domain/LoanPaymentUpdate.hpp"
#include <string>
#include <vector>
#include <optional>

namespace loans::ports::output {

/**
 * @brief Хранилище займов и платежей
 *
 * Output Port. Реализация отвечает за транзакционность и права доступа
 * (tenant scoping). Ошибки хранилища пробрасываются исключениями.
 */
class ILoanStore {
public:
    virtual ~ILoanStore() = default;

    /**
     * @brief Найти заём по ID
     * @return Loan или nullopt (NotFound)
     */
    virtual std::optional<domain::Loan> getLoan(const std::string& loanId) = 0;

    /**
     * @brief Все займы арендатора
     */
    virtual std::vector<domain::Loan> listLoans(const std::string& tenantId) = 0;

    /**
     * @brief Сохранить новый заём
     * @return Заём с присвоенным ID
     */
    virtual domain::Loan createLoan(const domain::Loan& loan) = 0;

    /**
     * @brief Обновить заём
     * @return Обновлённый заём или nullopt, если не найден
     */
    virtual std::optional<domain::Loan> updateLoan(const domain::Loan& loan) = 0;

    /**
     * @brief Удалить заём и все его платежи
     * @return false если займа нет
     */
    virtual bool deleteLoan(const std::string& loanId) = 0;

    /**
     * @brief Платежи займа (в любом порядке)
     */
    virtual std::vector<domain::LoanPayment> listPayments(const std::string& loanId) = 0;

    /**
     * @brief Найти платёж по ID
     */
    virtual std::optional<domain::LoanPayment> getPayment(const std::string& paymentId) = 0;

    /**
     * @brief Сохранить новый платёж
     * @return Платёж с присвоенным ID
     */
    virtual domain::LoanPayment createPayment(const domain::LoanPayment& record) = 0;

    /**
     * @brief Обновить поля платежа
     * @return Обновлённый платёж или nullopt, если не найден
     */
    virtual std::optional<domain::LoanPayment> updatePayment(
        const std::string& paymentId,
        const domain::LoanPaymentUpdate& fields) = 0;

    /**
     * @brief Удалить платёж
     * @return true если удалён
     */
    virtual bool deletePayment(const std::string& paymentId) = 0;
};

} // namespace loans::ports::output
