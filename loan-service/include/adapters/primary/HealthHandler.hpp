#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/LoanJson.hpp"
#include "settings/LoanSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace loans::adapters::primary {

/**
 * @brief GET /health: живость сервиса и действующие параметры расчёта
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::LoanSettings> settings)
        : settings_(std::move(settings))
    {}

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            json::sendError(res, 405, "Method not allowed");
            return;
        }

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "loan-service";
        response["version"] = "1.0.0";
        response["interest_periods_per_year"] = settings_->getInterestPeriodsPerYear();
        response["funds_check_enforced"] = settings_->isFundsCheckEnforced();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::LoanSettings> settings_;
};

} // namespace loans::adapters::primary
