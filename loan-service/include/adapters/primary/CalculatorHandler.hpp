#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LoanJson.hpp"
#include "application/AmortizationScheduleGenerator.hpp"
#include "application/PaymentAmountCalculator.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace loans::adapters::primary {

/**
 * @brief Калькулятор займа без сохранения
 *
 * Endpoints:
 * - POST /api/v1/calculator/payment  → плановый платёж
 * - POST /api/v1/calculator/schedule → график погашения
 *
 * Тело: {principal, annual_rate, term_months, frequency[, start_date]}
 */
class CalculatorHandler : public IHttpHandler {
public:
    CalculatorHandler() {
        std::cout << "[CalculatorHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            json::sendError(res, 405, "Method not allowed");
            return;
        }

        auto segments = json::splitPath(req.getPath());
        std::string action = segments.empty() ? "" : segments.back();

        try {
            auto body = nlohmann::json::parse(req.getBody());

            auto principal = json::requireMoney(body, "principal");
            double annualRate = body.value("annual_rate", 0.0);
            int termMonths = body.value("term_months", 12);
            auto frequency = domain::parsePaymentFrequency(body.value("frequency", "monthly"));

            if (action == "payment") {
                auto payment = calculator_.compute(principal, annualRate, termMonths, frequency);

                nlohmann::json response;
                response["payment"] = json::money(payment);
                response["periods"] = application::PaymentAmountCalculator::totalPeriods(termMonths, frequency);
                res.setResult(200, "application/json", response.dump());
            } else if (action == "schedule") {
                auto startDate = json::optionalString(body, "start_date");
                if (!startDate) {
                    json::sendError(res, 400, "start_date is required");
                    return;
                }
                auto schedule = generator_.generate(principal, annualRate, termMonths,
                                                    domain::parseDate(*startDate), frequency);

                nlohmann::json response;
                response["schedule"] = json::scheduleToJson(schedule);
                res.setResult(200, "application/json", response.dump());
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
            std::cerr << "[CalculatorHandler] Error: " << e.what() << std::endl;
            json::sendError(res, 500, "Internal server error");
        }
    }

private:
    application::PaymentAmountCalculator calculator_;
    application::AmortizationScheduleGenerator generator_;
};

} // namespace loans::adapters::primary
