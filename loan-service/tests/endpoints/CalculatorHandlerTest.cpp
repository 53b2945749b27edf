/**
 * @file CalculatorHandlerTest.cpp
 * @brief Unit-тесты для CalculatorHandler
 *
 * POST /api/v1/calculator/payment, POST /api/v1/calculator/schedule
 */

#include <gtest/gtest.h>

#include "adapters/primary/CalculatorHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace loans;
using namespace loans::adapters::primary;

class CalculatorHandlerTest : public ::testing::Test
{
protected:
    SimpleRequest createRequest(const std::string &method,
                                const std::string &path,
                                const std::string &body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    CalculatorHandler handler_;
};

// ============================================================================
// ТЕСТЫ: POST /api/v1/calculator/payment
// ============================================================================

TEST_F(CalculatorHandlerTest, Payment_Returns200)
{
    auto req = createRequest("POST", "/api/v1/calculator/payment",
        R"({"principal": 1200, "annual_rate": 0.12, "term_months": 12, "frequency": "monthly"})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_DOUBLE_EQ(json["payment"].get<double>(), 106.62);
    EXPECT_EQ(json["periods"], 12);
}

TEST_F(CalculatorHandlerTest, Payment_InvalidRate_Returns400)
{
    auto req = createRequest("POST", "/api/v1/calculator/payment",
        R"({"principal": 1200, "annual_rate": 2.0, "term_months": 12, "frequency": "monthly"})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["code"], "INVALID_RATE");
}

TEST_F(CalculatorHandlerTest, Schedule_HugeTerm_Returns400)
{
    auto req = createRequest("POST", "/api/v1/calculator/schedule",
        R"({"principal": 1200, "annual_rate": 0.12, "term_months": 10000000,
            "frequency": "monthly", "start_date": "2024-01-15"})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["code"], "INVALID_TERM");
}

TEST_F(CalculatorHandlerTest, Payment_HugePrincipal_Returns400)
{
    auto req = createRequest("POST", "/api/v1/calculator/payment",
        R"({"principal": 1e17, "annual_rate": 0.12, "term_months": 12, "frequency": "monthly"})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "principal is out of range");
}

TEST_F(CalculatorHandlerTest, Payment_UnknownFrequency_Returns400)
{
    auto req = createRequest("POST", "/api/v1/calculator/payment",
        R"({"principal": 1200, "annual_rate": 0.1, "term_months": 12, "frequency": "daily"})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(CalculatorHandlerTest, Payment_MissingPrincipal_Returns400)
{
    auto req = createRequest("POST", "/api/v1/calculator/payment", R"({"annual_rate": 0.1})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "principal must be a number");
}

TEST_F(CalculatorHandlerTest, InvalidJson_Returns400)
{
    auto req = createRequest("POST", "/api/v1/calculator/payment", "{not json");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Invalid JSON");
}

TEST_F(CalculatorHandlerTest, WrongMethod_Returns405)
{
    auto req = createRequest("GET", "/api/v1/calculator/payment");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

// ============================================================================
// ТЕСТЫ: POST /api/v1/calculator/schedule
// ============================================================================

TEST_F(CalculatorHandlerTest, Schedule_Returns200)
{
    auto req = createRequest("POST", "/api/v1/calculator/schedule",
        R"({"principal": 1200, "annual_rate": 0.12, "term_months": 12,
            "frequency": "monthly", "start_date": "2024-01-31"})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["schedule"].size(), 12u);
    EXPECT_EQ(json["schedule"][0]["payment_number"], 1);
    EXPECT_EQ(json["schedule"][0]["payment_date"], "2024-02-29");
    EXPECT_DOUBLE_EQ(json["schedule"][0]["interest_amount"].get<double>(), 12.0);
    EXPECT_DOUBLE_EQ(json["schedule"][11]["remaining_balance"].get<double>(), 0.0);
}

TEST_F(CalculatorHandlerTest, Schedule_MissingStartDate_Returns400)
{
    auto req = createRequest("POST", "/api/v1/calculator/schedule",
        R"({"principal": 1200, "annual_rate": 0.12, "term_months": 12, "frequency": "monthly"})");
    SimpleResponse res;

    handler_.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}
