#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LoanJson.hpp"
#include "ports/input/ILoanService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace loans::adapters::primary {

/**
 * @brief HTTP Handler для займов
 *
 * Endpoints:
 * - GET  /api/v1/loans?tenant_id=...   → займы с пересчитанным остатком
 * - POST /api/v1/loans                 → создать заём (опционально с проводкой выдачи)
 * - GET  /api/v1/loans/{id}            → заём, остаток, история платежей
 * - PUT  /api/v1/loans/{id}            → изменить условия займа
 * - DELETE /api/v1/loans/{id}          → удалить заём и его платежи
 * - GET  /api/v1/loans/{id}/schedule   → график погашения
 */
class LoanHandler : public IHttpHandler {
public:
    explicit LoanHandler(std::shared_ptr<ports::input::ILoanService> loanService)
        : loanService_(std::move(loanService))
    {
        std::cout << "[LoanHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string method = req.getMethod();
        auto segments = json::splitPath(req.getPath());

        // segments: api, v1, loans[, {id}[, schedule]]
        if (segments.size() < 3 || segments[2] != "loans") {
            json::sendError(res, 404, "Not found");
            return;
        }

        try {
            if (segments.size() == 3 && method == "GET") {
                handleListLoans(req, res);
            } else if (segments.size() == 3 && method == "POST") {
                handleCreateLoan(req, res);
            } else if (segments.size() == 4 && method == "GET") {
                handleGetLoan(res, segments[3]);
            } else if (segments.size() == 4 && method == "PUT") {
                handleUpdateLoan(req, res, segments[3]);
            } else if (segments.size() == 4 && method == "DELETE") {
                handleDeleteLoan(res, segments[3]);
            } else if (segments.size() == 5 && segments[4] == "schedule" && method == "GET") {
                handleGetSchedule(res, segments[3]);
            } else if (segments.size() <= 4 || (segments.size() == 5 && segments[4] == "schedule")) {
                json::sendError(res, 405, "Method not allowed");
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
            std::cerr << "[LoanHandler] Error: " << e.what() << std::endl;
            json::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ILoanService> loanService_;

    void handleListLoans(IRequest& req, IResponse& res) {
        auto tenantId = req.getQueryParam("tenant_id").value_or("");
        if (tenantId.empty()) {
            json::sendError(res, 400, "tenant_id is required");
            return;
        }

        nlohmann::json response;
        response["loans"] = nlohmann::json::array();
        for (const auto& overview : loanService_->listLoans(tenantId)) {
            response["loans"].push_back(json::overviewToJson(overview));
        }
        res.setResult(200, "application/json", response.dump());
    }

    void handleCreateLoan(IRequest& req, IResponse& res) {
        auto body = nlohmann::json::parse(req.getBody());
        auto request = json::parseLoanRequest(body);

        if (request.tenantId.empty()) {
            json::sendError(res, 400, "tenant_id is required");
            return;
        }
        if (request.name.empty()) {
            json::sendError(res, 400, "Loan name is required");
            return;
        }

        auto result = loanService_->createLoan(request);
        res.setResult(json::httpStatus(result.status, result.errorCode, 201),
                      "application/json", json::loanResultToJson(result).dump());
    }

    void handleGetLoan(IResponse& res, const std::string& loanId) {
        auto overview = loanService_->getLoan(loanId);
        if (!overview) {
            json::sendError(res, 404, "Loan not found");
            return;
        }
        res.setResult(200, "application/json", json::overviewToJson(*overview).dump());
    }

    void handleUpdateLoan(IRequest& req, IResponse& res, const std::string& loanId) {
        auto body = nlohmann::json::parse(req.getBody());
        auto request = json::parseLoanRequest(body);

        if (request.name.empty()) {
            json::sendError(res, 400, "Loan name is required");
            return;
        }

        auto result = loanService_->updateLoan(loanId, request);
        res.setResult(json::httpStatus(result.status, result.errorCode, 200),
                      "application/json", json::loanResultToJson(result).dump());
    }

    void handleDeleteLoan(IResponse& res, const std::string& loanId) {
        auto result = loanService_->deleteLoan(loanId);
        res.setResult(json::httpStatus(result.status, result.errorCode, 200),
                      "application/json", json::loanResultToJson(result).dump());
    }

    void handleGetSchedule(IResponse& res, const std::string& loanId) {
        auto schedule = loanService_->getSchedule(loanId);
        if (!schedule) {
            json::sendError(res, 404, "Loan not found");
            return;
        }

        nlohmann::json response;
        response["loan_id"] = loanId;
        response["schedule"] = json::scheduleToJson(*schedule);
        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace loans::adapters::primary
