#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LoanJson.hpp"
#include "ports/input/ILoanService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace loans::adapters::primary {

/**
 * @brief HTTP Handler для платежей по займам
 *
 * Endpoints:
 * - GET    /api/v1/loans/{id}/payments/suggestion        → плановая разбивка следующего платежа
 * - GET    /api/v1/loans/{id}/payments/allocation?total= → разбивка произвольной суммы
 * - POST   /api/v1/loans/{id}/payments                   → записать платёж и проводку
 * - PUT    /api/v1/payments/{id}                         → изменить платёж
 * - DELETE /api/v1/payments/{id}                         → удалить платёж и его проводки
 */
class LoanPaymentHandler : public IHttpHandler {
public:
    explicit LoanPaymentHandler(std::shared_ptr<ports::input::ILoanService> loanService)
        : loanService_(std::move(loanService))
    {
        std::cout << "[LoanPaymentHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string method = req.getMethod();
        auto segments = json::splitPath(req.getPath());

        try {
            if (isLoanPayments(segments)) {
                const std::string& loanId = segments[3];
                if (segments.size() == 5 && method == "POST") {
                    handleRecordPayment(req, res, loanId);
                } else if (segments.size() == 6 && segments[5] == "suggestion" && method == "GET") {
                    handleSuggestion(res, loanId);
                } else if (segments.size() == 6 && segments[5] == "allocation" && method == "GET") {
                    handleAllocation(req, res, loanId);
                } else {
                    json::sendError(res, 405, "Method not allowed");
                }
            } else if (segments.size() == 4 && segments[2] == "payments") {
                const std::string& paymentId = segments[3];
                if (method == "PUT") {
                    handleUpdatePayment(req, res, paymentId);
                } else if (method == "DELETE") {
                    handleDeletePayment(res, paymentId);
                } else {
                    json::sendError(res, 405, "Method not allowed");
                }
            } else {
                json::sendError(res, 404, "Not found");
            }
        }
        catch (const nlohmann::json::exception& e) {
            json::sendError(res, 400, "Invalid JSON");
        }
        catch (const domain::LoanException& e) {
            json::sendError(res, json::httpStatus(e.code()), e.code(), e.what());
        }
        catch (const std::invalid_argument& e) {
            json::sendError(res, 400, e.what());
        }
        catch (const std::exception& e) {
            std::cerr << "[LoanPaymentHandler] Error: " << e.what() << std::endl;
            json::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ILoanService> loanService_;

    /**
     * @brief api/v1/loans/{id}/payments[/...]
     */
    static bool isLoanPayments(const std::vector<std::string>& segments) {
        return segments.size() >= 5 && segments.size() <= 6
            && segments[2] == "loans" && segments[4] == "payments";
    }

    void handleSuggestion(IResponse& res, const std::string& loanId) {
        auto split = loanService_->suggestNextPayment(loanId);
        if (!split) {
            json::sendError(res, 404, "Loan not found");
            return;
        }
        res.setResult(200, "application/json", json::splitToJson(*split).dump());
    }

    void handleAllocation(IRequest& req, IResponse& res, const std::string& loanId) {
        auto total = req.getQueryParam("total");
        if (!total || total->empty()) {
            json::sendError(res, 400, "total is required");
            return;
        }

        auto split = loanService_->previewAllocation(loanId, json::parseAmount(*total));
        if (!split) {
            json::sendError(res, 404, "Loan not found");
            return;
        }
        res.setResult(200, "application/json", json::splitToJson(*split).dump());
    }

    void handleRecordPayment(IRequest& req, IResponse& res, const std::string& loanId) {
        auto body = nlohmann::json::parse(req.getBody());
        auto request = json::parsePaymentRequest(body);
        request.loanId = loanId;

        auto result = loanService_->recordPayment(request);
        res.setResult(json::httpStatus(result.status, result.errorCode, 201),
                      "application/json", json::paymentResultToJson(result).dump());
    }

    void handleUpdatePayment(IRequest& req, IResponse& res, const std::string& paymentId) {
        auto body = nlohmann::json::parse(req.getBody());
        auto request = json::parsePaymentRequest(body);

        auto result = loanService_->updatePayment(paymentId, request);
        res.setResult(json::httpStatus(result.status, result.errorCode, 200),
                      "application/json", json::paymentResultToJson(result).dump());
    }

    void handleDeletePayment(IResponse& res, const std::string& paymentId) {
        auto result = loanService_->deletePayment(paymentId);
        res.setResult(json::httpStatus(result.status, result.errorCode, 200),
                      "application/json", json::paymentResultToJson(result).dump());
    }
};

} // namespace loans::adapters::primary
