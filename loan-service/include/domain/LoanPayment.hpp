#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Фактический платёж по займу
 *
 * principalAmount + interestAmount == totalAmount (с точностью до цента).
 */
struct LoanPayment {
    std::string id;
    std::string loanId;
    std::string tenantId;
    std::string accountId;   ///< Денежный счёт, через который прошёл платёж
    CalendarDate paymentDate;
    Money totalAmount;
    Money principalAmount;
    Money interestAmount;
    std::optional<std::string> notes;

    LoanPayment() = default;

    LoanPayment(const std::string& id_,
                const std::string& loanId_,
                const std::string& accountId_,
                const CalendarDate& date,
                const Money& principal,
                const Money& interest)
        : id(id_)
        , loanId(loanId_)
        , accountId(accountId_)
        , paymentDate(date)
        , totalAmount(principal + interest)
        , principalAmount(principal)
        , interestAmount(interest)
    {}
};

} // namespace loans::domain
