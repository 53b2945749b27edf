#pragma once

#include "domain/Money.hpp"
#include "domain/LoanError.hpp"
#include <cmath>
#include <string>

namespace loans::application::validation {

/**
 * @throws domain::LoanException INVALID_PRINCIPAL если сумма <= 0
 */
inline void validatePrincipal(const domain::Money& principal) {
    if (!principal.isPositive()) {
        throw domain::LoanException(domain::LoanErrorCode::INVALID_PRINCIPAL,
            "Principal must be greater than 0, got " + principal.toString());
    }
}

/**
 * @throws domain::LoanException INVALID_RATE если ставка вне [0, 1] или не число
 */
inline void validateRate(double annualRate) {
    if (!std::isfinite(annualRate) || annualRate < 0.0 || annualRate > 1.0) {
        throw domain::LoanException(domain::LoanErrorCode::INVALID_RATE,
            "Annual interest rate must be within [0, 1], got " + std::to_string(annualRate));
    }
}

/// Самый длинный допустимый срок: 100 лет (5200 недельных платежей)
constexpr int kMaxTermMonths = 1200;

/**
 * @throws domain::LoanException INVALID_TERM если срок вне [1, kMaxTermMonths]
 */
inline void validateTerm(int termMonths) {
    if (termMonths < 1 || termMonths > kMaxTermMonths) {
        throw domain::LoanException(domain::LoanErrorCode::INVALID_TERM,
            "Term must be within [1, " + std::to_string(kMaxTermMonths) + "] months, got "
            + std::to_string(termMonths));
    }
}

/**
 * @throws domain::LoanException INVALID_PAYMENT если платёж <= 0
 */
inline void validatePaymentAmount(const domain::Money& amount) {
    if (!amount.isPositive()) {
        throw domain::LoanException(domain::LoanErrorCode::INVALID_PAYMENT,
            "Payment amount must be greater than 0, got " + amount.toString());
    }
}

inline void validateLoanTerms(const domain::Money& principal, double annualRate, int termMonths) {
    validatePrincipal(principal);
    validateRate(annualRate);
    validateTerm(termMonths);
}

} // namespace loans::application::validation
