#pragma once

#include "LoanPayment.hpp"
#include "LoanError.hpp"
#include "enums/OperationStatus.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Результат записи/изменения/удаления платежа
 */
class PaymentResult {
public:
    OperationStatus status = OperationStatus::REJECTED;
    LoanErrorCode errorCode = LoanErrorCode::NONE;
    std::string message;
    std::optional<LoanPayment> payment;
    std::optional<Money> available;  ///< Заполняется при INSUFFICIENT_FUNDS

    PaymentResult() = default;

    static PaymentResult completed(const LoanPayment& p, const std::string& msg) {
        PaymentResult r;
        r.status = OperationStatus::COMPLETED;
        r.payment = p;
        r.message = msg;
        return r;
    }

    static PaymentResult rejected(LoanErrorCode code, const std::string& msg) {
        PaymentResult r;
        r.status = OperationStatus::REJECTED;
        r.errorCode = code;
        r.message = msg;
        return r;
    }

    bool ok() const { return status == OperationStatus::COMPLETED; }
};

} // namespace loans::domain
