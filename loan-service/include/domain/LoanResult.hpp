#pragma once

#include "Loan.hpp"
#include "LoanError.hpp"
#include "enums/OperationStatus.hpp"
#include <string>
#include <optional>

namespace loans::domain {

/**
 * @brief Результат создания/изменения займа
 */
class LoanResult {
public:
    OperationStatus status = OperationStatus::REJECTED;
    LoanErrorCode errorCode = LoanErrorCode::NONE;
    std::string message;
    std::optional<Loan> loan;

    LoanResult() = default;

    static LoanResult completed(const Loan& l, const std::string& msg) {
        LoanResult r;
        r.status = OperationStatus::COMPLETED;
        r.loan = l;
        r.message = msg;
        return r;
    }

    static LoanResult rejected(LoanErrorCode code, const std::string& msg) {
        LoanResult r;
        r.status = OperationStatus::REJECTED;
        r.errorCode = code;
        r.message = msg;
        return r;
    }

    bool ok() const { return status == OperationStatus::COMPLETED; }
};

} // namespace loans::domain
