#pragma once

#include "domain/AmortizationScheduleEntry.hpp"
#include "domain/LoanOverview.hpp"
#include "domain/LoanRequest.hpp"
#include "domain/LoanResult.hpp"
#include "domain/PaymentRequest.hpp"
#include "domain/PaymentResult.hpp"
#include "domain/PaymentSplit.hpp"
#include <string>
#include <vector>
#include <optional>

namespace loans::ports::input {

/**
 * @brief Интерфейс сервиса займов
 */
class ILoanService {
public:
    virtual ~ILoanService() = default;

    /**
     * @brief Создать заём (и, если указан счёт, провести выдачу)
     */
    virtual domain::LoanResult createLoan(const domain::LoanRequest& request) = 0;

    /**
     * @brief Изменить условия займа
     */
    virtual domain::LoanResult updateLoan(const std::string& loanId, const domain::LoanRequest& request) = 0;

    /**
     * @brief Удалить заём вместе с его платежами
     *
     * Проводки по счетам остаются в книге: деньги уже прошли.
     */
    virtual domain::LoanResult deleteLoan(const std::string& loanId) = 0;

    /**
     * @brief Заём с пересчитанным остатком
     */
    virtual std::optional<domain::LoanOverview> getLoan(const std::string& loanId) = 0;

    /**
     * @brief Все займы арендатора с пересчитанными остатками
     */
    virtual std::vector<domain::LoanOverview> listLoans(const std::string& tenantId) = 0;

    /**
     * @brief Плановый график платежей (пустой, если периодичность не задана)
     */
    virtual std::optional<std::vector<domain::AmortizationScheduleEntry>> getSchedule(const std::string& loanId) = 0;

    /**
     * @brief Подсказка следующего платежа
     */
    virtual std::optional<domain::PaymentSplit> suggestNextPayment(const std::string& loanId) = 0;

    /**
     * @brief Автоматическая разбивка произвольной суммы
     * @throws domain::LoanException INVALID_PAYMENT если total <= 0
     */
    virtual std::optional<domain::PaymentSplit> previewAllocation(
        const std::string& loanId,
        const domain::Money& total) = 0;

    /**
     * @brief Записать платёж и провести движение денег
     */
    virtual domain::PaymentResult recordPayment(const domain::PaymentRequest& request) = 0;

    /**
     * @brief Изменить платёж (проводка перевыставляется)
     */
    virtual domain::PaymentResult updatePayment(const std::string& paymentId,
                                                const domain::PaymentRequest& request) = 0;

    /**
     * @brief Удалить платёж вместе с его проводками
     */
    virtual domain::PaymentResult deletePayment(const std::string& paymentId) = 0;
};

} // namespace loans::ports::input
