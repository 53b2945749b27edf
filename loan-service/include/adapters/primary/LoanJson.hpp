#pragma once

#include "domain/AmortizationScheduleEntry.hpp"
#include "domain/LoanOverview.hpp"
#include "domain/LoanRequest.hpp"
#include "domain/LoanResult.hpp"
#include "domain/PaymentRequest.hpp"
#include "domain/PaymentResult.hpp"
#include "domain/PaymentSplit.hpp"
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <sstream>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace loans::adapters::primary::json {

/**
 * @brief Сериализация доменных объектов и общие утилиты HTTP-слоя
 *
 * Суммы передаются числами в валютных единицах, даты строками YYYY-MM-DD,
 * перечисления строками в нижнем регистре.
 */

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

inline void sendError(IResponse& res, int status, domain::LoanErrorCode code, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    error["code"] = domain::toString(code);
    res.setResult(status, "application/json", error.dump());
}

inline int httpStatus(domain::LoanErrorCode code) {
    switch (code) {
        case domain::LoanErrorCode::NONE:                return 200;
        case domain::LoanErrorCode::INVALID_PRINCIPAL:
        case domain::LoanErrorCode::INVALID_RATE:
        case domain::LoanErrorCode::INVALID_TERM:
        case domain::LoanErrorCode::INVALID_PAYMENT:
        case domain::LoanErrorCode::INVALID_ACCOUNT:     return 400;
        case domain::LoanErrorCode::NOT_FOUND:           return 404;
        case domain::LoanErrorCode::INSUFFICIENT_FUNDS:  return 409;
        case domain::LoanErrorCode::PERSISTENCE_FAILURE: return 500;
    }
    return 500;
}

/**
 * @brief HTTP-статус результата операции записи
 * @param successStatus 201 для создания, 200 для изменения
 */
inline int httpStatus(domain::OperationStatus status, domain::LoanErrorCode code, int successStatus) {
    switch (status) {
        case domain::OperationStatus::COMPLETED: return successStatus;
        case domain::OperationStatus::PARTIAL:   return 207;
        case domain::OperationStatus::REJECTED:  return httpStatus(code);
    }
    return 500;
}

// ============================================
// ПУТЬ ЗАПРОСА
// ============================================

inline std::string stripQuery(const std::string& fullPath) {
    size_t pos = fullPath.find('?');
    return pos == std::string::npos ? fullPath : fullPath.substr(0, pos);
}

/**
 * @brief "/api/v1/loans/42/schedule" → ["api", "v1", "loans", "42", "schedule"]
 */
inline std::vector<std::string> splitPath(const std::string& fullPath) {
    std::vector<std::string> segments;
    std::istringstream iss(stripQuery(fullPath));
    std::string segment;
    while (std::getline(iss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

// ============================================
// В JSON
// ============================================

inline nlohmann::json money(const domain::Money& value) {
    return value.toDouble();
}

inline nlohmann::json splitToJson(const domain::PaymentSplit& split) {
    nlohmann::json j;
    j["principal_amount"] = money(split.principal);
    j["interest_amount"] = money(split.interest);
    j["total_amount"] = money(split.total());
    return j;
}

inline nlohmann::json loanToJson(const domain::Loan& loan) {
    nlohmann::json j;
    j["id"] = loan.id;
    j["tenant_id"] = loan.tenantId;
    j["name"] = loan.name;
    j["contact_id"] = loan.contactId ? nlohmann::json(*loan.contactId) : nlohmann::json(nullptr);
    j["kind"] = domain::toString(loan.kind);
    j["principal"] = money(loan.principal);
    j["annual_rate"] = loan.annualInterestRate;
    j["term_months"] = loan.termMonths;
    j["payment_frequency"] = loan.paymentFrequency
        ? nlohmann::json(domain::toString(*loan.paymentFrequency)) : nlohmann::json(nullptr);
    j["start_date"] = domain::toIsoString(loan.startDate);
    j["suggested_payment_amount"] = loan.suggestedPaymentAmount
        ? money(*loan.suggestedPaymentAmount) : nlohmann::json(nullptr);
    j["notes"] = loan.notes ? nlohmann::json(*loan.notes) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json paymentToJson(const domain::LoanPayment& payment) {
    nlohmann::json j;
    j["id"] = payment.id;
    j["loan_id"] = payment.loanId;
    j["account_id"] = payment.accountId;
    j["payment_date"] = domain::toIsoString(payment.paymentDate);
    j["total_amount"] = money(payment.totalAmount);
    j["principal_amount"] = money(payment.principalAmount);
    j["interest_amount"] = money(payment.interestAmount);
    j["notes"] = payment.notes ? nlohmann::json(*payment.notes) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json overviewToJson(const domain::LoanOverview& overview) {
    const auto& projection = overview.projection;

    nlohmann::json j = loanToJson(overview.loan);
    j["status"] = domain::toString(projection.status());
    j["remaining_balance"] = money(projection.remainingBalance);
    j["total_principal_paid"] = money(projection.totalPrincipalPaid);
    j["total_interest_paid"] = money(projection.totalInterestPaid);
    j["progress_percent"] = projection.progressPercent();

    j["payments"] = nlohmann::json::array();
    for (const auto& entry : projection.payments) {
        nlohmann::json p = paymentToJson(entry.payment);
        p["balance_after"] = money(entry.balanceAfter);
        j["payments"].push_back(p);
    }
    return j;
}

inline nlohmann::json scheduleToJson(const std::vector<domain::AmortizationScheduleEntry>& schedule) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : schedule) {
        nlohmann::json j;
        j["payment_number"] = entry.paymentNumber;
        j["payment_date"] = domain::toIsoString(entry.paymentDate);
        j["payment_amount"] = money(entry.paymentAmount);
        j["principal_amount"] = money(entry.principalAmount);
        j["interest_amount"] = money(entry.interestAmount);
        j["remaining_balance"] = money(entry.remainingBalanceAfter);
        entries.push_back(j);
    }
    return entries;
}

inline nlohmann::json paymentResultToJson(const domain::PaymentResult& result) {
    nlohmann::json j;
    j["status"] = domain::toString(result.status);
    j["message"] = result.message;
    if (result.errorCode != domain::LoanErrorCode::NONE) {
        j["code"] = domain::toString(result.errorCode);
    }
    if (result.payment) {
        j["payment"] = paymentToJson(*result.payment);
    }
    if (result.available) {
        j["available"] = money(*result.available);
    }
    return j;
}

inline nlohmann::json loanResultToJson(const domain::LoanResult& result) {
    nlohmann::json j;
    j["status"] = domain::toString(result.status);
    j["message"] = result.message;
    if (result.errorCode != domain::LoanErrorCode::NONE) {
        j["code"] = domain::toString(result.errorCode);
    }
    if (result.loan) {
        j["loan"] = loanToJson(*result.loan);
    }
    return j;
}

// ============================================
// ИЗ JSON
// ============================================

/**
 * @brief Необязательная строка: отсутствует, null или пустая → nullopt
 */
inline std::optional<std::string> optionalString(const nlohmann::json& body, const std::string& key) {
    if (!body.contains(key) || body[key].is_null()) {
        return std::nullopt;
    }
    auto value = body[key].get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Обязательная сумма
 * @throws std::invalid_argument если поле отсутствует, не число или вне допустимого диапазона
 */
inline domain::Money requireMoney(const nlohmann::json& body, const std::string& key) {
    if (!body.contains(key) || !body[key].is_number()) {
        throw std::invalid_argument(key + " must be a number");
    }
    double value = body[key].get<double>();
    if (std::fabs(value) > domain::Money::kMaxAbsAmount) {
        throw std::invalid_argument(key + " is out of range");
    }
    return domain::Money::fromDouble(value);
}

/**
 * @brief Сумма из query-параметра ("150.25")
 */
inline domain::Money parseAmount(const std::string& value) {
    double amount = 0.0;
    size_t consumed = 0;
    try {
        amount = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid amount: " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid amount: " + value);
    }
    return domain::Money::fromDouble(amount);
}

inline domain::LoanRequest parseLoanRequest(const nlohmann::json& body) {
    domain::LoanRequest request;
    request.tenantId = body.value("tenant_id", "");
    request.name = body.value("name", "");
    request.contactId = optionalString(body, "contact_id");
    request.kind = domain::parseLoanKind(body.value("kind", "payable"));
    request.principal = requireMoney(body, "principal");
    request.annualInterestRate = body.value("annual_rate", 0.0);
    request.termMonths = body.value("term_months", 12);

    if (auto frequency = optionalString(body, "payment_frequency")) {
        request.paymentFrequency = domain::parsePaymentFrequency(*frequency);
    }

    auto startDate = optionalString(body, "start_date");
    if (!startDate) {
        throw std::invalid_argument("start_date is required");
    }
    request.startDate = domain::parseDate(*startDate);

    request.notes = optionalString(body, "notes");
    request.disbursementAccountId = optionalString(body, "disbursement_account_id");
    return request;
}

/**
 * @brief Тело платежа; ручная разбивка задаётся парой principal_amount + interest_amount
 */
inline domain::PaymentRequest parsePaymentRequest(const nlohmann::json& body) {
    domain::PaymentRequest request;
    request.accountId = body.value("account_id", "");
    request.totalAmount = requireMoney(body, "total_amount");

    auto paymentDate = optionalString(body, "payment_date");
    if (!paymentDate) {
        throw std::invalid_argument("payment_date is required");
    }
    request.paymentDate = domain::parseDate(*paymentDate);

    bool hasPrincipal = body.contains("principal_amount") && !body["principal_amount"].is_null();
    bool hasInterest = body.contains("interest_amount") && !body["interest_amount"].is_null();
    if (hasPrincipal != hasInterest) {
        throw std::invalid_argument("principal_amount and interest_amount must be given together");
    }
    if (hasPrincipal) {
        request.customSplit = domain::PaymentSplit{
            requireMoney(body, "principal_amount"),
            requireMoney(body, "interest_amount")};
    }

    request.notes = optionalString(body, "notes");
    return request;
}

} // namespace loans::adapters::primary::json
