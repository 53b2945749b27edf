/**
 * @file LoanHandlerTest.cpp
 * @brief Unit-тесты для LoanHandler
 *
 * GET/POST /api/v1/loans, GET/PUT /api/v1/loans/{id}, GET /api/v1/loans/{id}/schedule
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/LoanHandler.hpp"
#include "../mocks/MockLoanService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace loans;
using namespace loans::adapters::primary;
using namespace loans::tests::mocks;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Truly;

// ============================================================================
// Test Fixture
// ============================================================================

class LoanHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockService_ = std::make_shared<MockLoanService>();
        handler_ = std::make_unique<LoanHandler>(mockService_);
    }

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

    domain::Loan createTestLoan(const std::string &id)
    {
        domain::Loan loan(id, "tenant-1", "Car Loan", domain::LoanKind::PAYABLE,
                          domain::Money::fromDouble(1200.0), 0.12, 12,
                          domain::PaymentFrequency::MONTHLY, domain::parseDate("2024-01-15"));
        loan.suggestedPaymentAmount = domain::Money::fromDouble(106.62);
        return loan;
    }

    domain::LoanOverview createOverview(const std::string &id)
    {
        domain::LoanOverview overview;
        overview.loan = createTestLoan(id);
        overview.projection.principal = overview.loan.principal;
        overview.projection.remainingBalance = domain::Money::fromDouble(1105.38);
        overview.projection.totalPrincipalPaid = domain::Money::fromDouble(94.62);
        overview.projection.totalInterestPaid = domain::Money::fromDouble(12.0);

        domain::LoanPayment payment("pay-1", id, "acc-1", domain::parseDate("2024-02-15"),
                                    domain::Money::fromDouble(94.62), domain::Money::fromDouble(12.0));
        overview.projection.payments.push_back({payment, domain::Money::fromDouble(1105.38)});
        return overview;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    const std::string loanBody_ = R"({
        "tenant_id": "tenant-1",
        "name": "Car Loan",
        "kind": "payable",
        "principal": 1200,
        "annual_rate": 0.12,
        "term_months": 12,
        "payment_frequency": "monthly",
        "start_date": "2024-01-15",
        "disbursement_account_id": "acc-1"
    })";

    std::shared_ptr<MockLoanService> mockService_;
    std::unique_ptr<LoanHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: GET /api/v1/loans
// ============================================================================

TEST_F(LoanHandlerTest, ListLoans_Returns200)
{
    EXPECT_CALL(*mockService_, listLoans("tenant-1"))
        .WillOnce(Return(std::vector<domain::LoanOverview>{createOverview("loan-1")}));

    auto req = createRequest("GET", "/api/v1/loans");
    req.setQueryParam("tenant_id", "tenant-1");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["loans"].size(), 1u);
    EXPECT_EQ(json["loans"][0]["id"], "loan-1");
    EXPECT_EQ(json["loans"][0]["status"], "active");
    EXPECT_DOUBLE_EQ(json["loans"][0]["remaining_balance"].get<double>(), 1105.38);
}

TEST_F(LoanHandlerTest, ListLoans_MissingTenant_Returns400)
{
    EXPECT_CALL(*mockService_, listLoans(_)).Times(0);

    auto req = createRequest("GET", "/api/v1/loans");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// ТЕСТЫ: POST /api/v1/loans
// ============================================================================

TEST_F(LoanHandlerTest, CreateLoan_Returns201)
{
    EXPECT_CALL(*mockService_, createLoan(Truly([](const domain::LoanRequest &r) {
        return r.tenantId == "tenant-1"
            && r.principal == domain::Money::fromDouble(1200.0)
            && r.paymentFrequency == domain::PaymentFrequency::MONTHLY
            && r.disbursementAccountId == std::optional<std::string>("acc-1");
    }))).WillOnce(Return(domain::LoanResult::completed(createTestLoan("loan-1"), "Loan added successfully")));

    auto req = createRequest("POST", "/api/v1/loans", loanBody_);
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "completed");
    EXPECT_EQ(json["loan"]["id"], "loan-1");
    EXPECT_EQ(json["loan"]["kind"], "payable");
    EXPECT_DOUBLE_EQ(json["loan"]["suggested_payment_amount"].get<double>(), 106.62);
}

TEST_F(LoanHandlerTest, CreateLoan_Rejected_MapsErrorCode)
{
    EXPECT_CALL(*mockService_, createLoan(_))
        .WillOnce(Return(domain::LoanResult::rejected(domain::LoanErrorCode::INSUFFICIENT_FUNDS,
                                                      "Insufficient funds in Checking. Available: 10.00")));

    auto req = createRequest("POST", "/api/v1/loans", loanBody_);
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "rejected");
    EXPECT_EQ(json["code"], "INSUFFICIENT_FUNDS");
}

TEST_F(LoanHandlerTest, CreateLoan_MissingName_Returns400)
{
    EXPECT_CALL(*mockService_, createLoan(_)).Times(0);

    auto req = createRequest("POST", "/api/v1/loans",
        R"({"tenant_id": "tenant-1", "principal": 100, "start_date": "2024-01-15"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Loan name is required");
}

TEST_F(LoanHandlerTest, CreateLoan_BadDate_Returns400)
{
    auto req = createRequest("POST", "/api/v1/loans",
        R"({"tenant_id": "tenant-1", "name": "X", "principal": 100, "start_date": "15/01/2024"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(LoanHandlerTest, CreateLoan_InvalidJson_Returns400)
{
    auto req = createRequest("POST", "/api/v1/loans", "invalid");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Invalid JSON");
}

// ============================================================================
// ТЕСТЫ: GET/PUT /api/v1/loans/{id}
// ============================================================================

TEST_F(LoanHandlerTest, GetLoan_Returns200WithPayments)
{
    EXPECT_CALL(*mockService_, getLoan("loan-1")).WillOnce(Return(createOverview("loan-1")));

    auto req = createRequest("GET", "/api/v1/loans/loan-1");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["payment_frequency"], "monthly");
    ASSERT_EQ(json["payments"].size(), 1u);
    EXPECT_EQ(json["payments"][0]["payment_date"], "2024-02-15");
    EXPECT_DOUBLE_EQ(json["payments"][0]["balance_after"].get<double>(), 1105.38);
}

TEST_F(LoanHandlerTest, GetLoan_NotFound_Returns404)
{
    EXPECT_CALL(*mockService_, getLoan("loan-x")).WillOnce(Return(std::nullopt));

    auto req = createRequest("GET", "/api/v1/loans/loan-x");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(LoanHandlerTest, UpdateLoan_Returns200)
{
    EXPECT_CALL(*mockService_, updateLoan("loan-1", _))
        .WillOnce(Return(domain::LoanResult::completed(createTestLoan("loan-1"), "Loan updated")));

    auto req = createRequest("PUT", "/api/v1/loans/loan-1", loanBody_);
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(LoanHandlerTest, UpdateLoan_NotFound_Returns404)
{
    EXPECT_CALL(*mockService_, updateLoan("loan-x", _))
        .WillOnce(Return(domain::LoanResult::rejected(domain::LoanErrorCode::NOT_FOUND, "Loan not found: loan-x")));

    auto req = createRequest("PUT", "/api/v1/loans/loan-x", loanBody_);
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(LoanHandlerTest, DeleteLoan_Returns200)
{
    EXPECT_CALL(*mockService_, deleteLoan("loan-1"))
        .WillOnce(Return(domain::LoanResult::completed(createTestLoan("loan-1"), "Loan deleted successfully")));

    auto req = createRequest("DELETE", "/api/v1/loans/loan-1");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "completed");
    EXPECT_EQ(json["loan"]["id"], "loan-1");
}

TEST_F(LoanHandlerTest, DeleteLoan_NotFound_Returns404)
{
    EXPECT_CALL(*mockService_, deleteLoan("loan-x"))
        .WillOnce(Return(domain::LoanResult::rejected(domain::LoanErrorCode::NOT_FOUND, "Loan not found: loan-x")));

    auto req = createRequest("DELETE", "/api/v1/loans/loan-x");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(LoanHandlerTest, DeleteLoanCollection_Returns405)
{
    EXPECT_CALL(*mockService_, deleteLoan(_)).Times(0);

    auto req = createRequest("DELETE", "/api/v1/loans");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

// ============================================================================
// ТЕСТЫ: GET /api/v1/loans/{id}/schedule
// ============================================================================

TEST_F(LoanHandlerTest, GetSchedule_Returns200)
{
    domain::AmortizationScheduleEntry entry;
    entry.paymentNumber = 1;
    entry.paymentDate = domain::parseDate("2024-02-15");
    entry.paymentAmount = domain::Money::fromDouble(106.62);
    entry.principalAmount = domain::Money::fromDouble(94.62);
    entry.interestAmount = domain::Money::fromDouble(12.0);
    entry.remainingBalanceAfter = domain::Money::fromDouble(1105.38);

    EXPECT_CALL(*mockService_, getSchedule("loan-1"))
        .WillOnce(Return(std::vector<domain::AmortizationScheduleEntry>{entry}));

    auto req = createRequest("GET", "/api/v1/loans/loan-1/schedule");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["loan_id"], "loan-1");
    ASSERT_EQ(json["schedule"].size(), 1u);
    EXPECT_DOUBLE_EQ(json["schedule"][0]["principal_amount"].get<double>(), 94.62);
}

TEST_F(LoanHandlerTest, GetSchedule_NotFound_Returns404)
{
    EXPECT_CALL(*mockService_, getSchedule("loan-x")).WillOnce(Return(std::nullopt));

    auto req = createRequest("GET", "/api/v1/loans/loan-x/schedule");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(LoanHandlerTest, ServiceThrows_Returns500)
{
    EXPECT_CALL(*mockService_, getLoan("loan-1"))
        .WillOnce(Throw(std::runtime_error("connection lost")));

    auto req = createRequest("GET", "/api/v1/loans/loan-1");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Internal server error");
}
