/**
 * @file PaymentAllocationEngineTest.cpp
 * @brief Unit tests for PaymentAllocationEngine
 */

#include <gtest/gtest.h>
#include "application/PaymentAllocationEngine.hpp"
#include "domain/LoanError.hpp"
#include <random>

using namespace loans;
using namespace loans::application;
using domain::Money;
using domain::PaymentFrequency;

class PaymentAllocationEngineTest : public ::testing::Test {
protected:
    PaymentAllocationEngine engine_;
};

// ============================================================================
// AUTOMATIC ALLOCATION
// ============================================================================

TEST_F(PaymentAllocationEngineTest, Allocate_InterestFirstThenPrincipal) {
    auto split = engine_.allocate(Money::fromDouble(1000.0), 0.12, Money::fromDouble(100.0), 12);

    EXPECT_EQ(split.interest, Money::fromDouble(10.0));
    EXPECT_EQ(split.principal, Money::fromDouble(90.0));
    EXPECT_EQ(split.total(), Money::fromDouble(100.0));
}

TEST_F(PaymentAllocationEngineTest, Allocate_PaymentBelowInterest_AllInterest) {
    auto split = engine_.allocate(Money::fromDouble(1000.0), 0.12, Money::fromDouble(5.0), 12);

    EXPECT_EQ(split.interest, Money::fromDouble(5.0));
    EXPECT_TRUE(split.principal.isZero());
}

TEST_F(PaymentAllocationEngineTest, Allocate_ZeroRate_AllPrincipal) {
    auto split = engine_.allocate(Money::fromDouble(1000.0), 0.0, Money::fromDouble(250.0), 12);

    EXPECT_TRUE(split.interest.isZero());
    EXPECT_EQ(split.principal, Money::fromDouble(250.0));
}

TEST_F(PaymentAllocationEngineTest, Allocate_Overpayment_PrincipalNotCapped) {
    auto split = engine_.allocate(Money::fromDouble(50.0), 0.12, Money::fromDouble(100.0), 12);

    EXPECT_EQ(split.interest, Money::fromDouble(0.5));
    EXPECT_EQ(split.principal, Money::fromDouble(99.5));
}

TEST_F(PaymentAllocationEngineTest, Allocate_NothingOutstanding_NoInterest) {
    auto split = engine_.allocate(Money::zero(), 0.12, Money::fromDouble(10.0), 12);

    EXPECT_TRUE(split.interest.isZero());
    EXPECT_EQ(split.principal, Money::fromDouble(10.0));
}

TEST_F(PaymentAllocationEngineTest, Allocate_UsesGivenInterestPeriods) {
    // 1000 * 0.12 / 52 = 2.3077
    auto split = engine_.allocate(Money::fromDouble(1000.0), 0.12, Money::fromDouble(100.0), 52);
    EXPECT_EQ(split.interest, Money::fromDouble(2.31));
}

TEST_F(PaymentAllocationEngineTest, Allocate_NonPositiveTotal_Throws) {
    try {
        engine_.allocate(Money::fromDouble(1000.0), 0.12, Money::zero(), 12);
        FAIL() << "Expected LoanException";
    } catch (const domain::LoanException& e) {
        EXPECT_EQ(e.code(), domain::LoanErrorCode::INVALID_PAYMENT);
    }
    EXPECT_THROW(engine_.allocate(Money::fromDouble(1000.0), 0.12, Money::fromDouble(-1.0), 12),
                 domain::LoanException);
}

TEST_F(PaymentAllocationEngineTest, Allocate_InvalidPeriods_Throws) {
    EXPECT_THROW(engine_.allocate(Money::fromDouble(1000.0), 0.12, Money::fromDouble(10.0), 0),
                 std::invalid_argument);
}

// ============================================================================
// CUSTOM / SCHEDULED SPLIT
// ============================================================================

TEST_F(PaymentAllocationEngineTest, CustomSplit_AcceptedAsIs) {
    auto split = engine_.customSplit(Money::fromDouble(70.0), Money::fromDouble(30.0));

    EXPECT_EQ(split.principal, Money::fromDouble(70.0));
    EXPECT_EQ(split.interest, Money::fromDouble(30.0));
}

TEST_F(PaymentAllocationEngineTest, ScheduledSplit_FollowsRegularPayment) {
    auto split = engine_.scheduledSplit(Money::fromDouble(1105.38), 0.12, PaymentFrequency::MONTHLY,
                                        Money::fromDouble(106.62));

    EXPECT_EQ(split.interest, Money::fromDouble(11.05));
    EXPECT_EQ(split.principal, Money::fromDouble(95.57));
}

TEST_F(PaymentAllocationEngineTest, ScheduledSplit_CapsPrincipalAtOutstanding) {
    auto split = engine_.scheduledSplit(Money::fromDouble(50.0), 0.12, PaymentFrequency::MONTHLY,
                                        Money::fromDouble(106.62));

    EXPECT_EQ(split.interest, Money::fromDouble(0.5));
    EXPECT_EQ(split.principal, Money::fromDouble(50.0));
}

TEST_F(PaymentAllocationEngineTest, ScheduledSplit_NothingOutstanding_Zero) {
    auto split = engine_.scheduledSplit(Money::zero(), 0.12, PaymentFrequency::MONTHLY, Money::fromDouble(106.62));

    EXPECT_TRUE(split.principal.isZero());
    EXPECT_TRUE(split.interest.isZero());
}

// ============================================================================
// PROPERTIES
// ============================================================================

TEST_F(PaymentAllocationEngineTest, RandomizedPayments_NeverOverAllocate) {
    std::mt19937 rng(20240215);
    std::uniform_int_distribution<int64_t> balanceDist(0, 100000000);
    std::uniform_real_distribution<double> rateDist(0.0, 1.0);
    std::uniform_int_distribution<int64_t> totalDist(1, 5000000);

    const int periodChoices[] = {1, 4, 12, 26, 52, 365};

    for (int iteration = 0; iteration < 500; ++iteration) {
        auto balance = Money::fromCents(balanceDist(rng));
        double rate = rateDist(rng);
        auto total = Money::fromCents(totalDist(rng));
        int periods = periodChoices[iteration % 6];

        SCOPED_TRACE("balance=" + balance.toString() + " rate=" + std::to_string(rate)
                     + " total=" + total.toString() + " periods=" + std::to_string(periods));

        auto split = engine_.allocate(balance, rate, total, periods);

        EXPECT_LE(split.interest, total);
        EXPECT_FALSE(split.interest.isNegative());
        EXPECT_FALSE(split.principal.isNegative());
        EXPECT_EQ(split.principal + split.interest, total);
    }
}
