/**
 * @file PaymentAmountCalculatorTest.cpp
 * @brief Unit tests for PaymentAmountCalculator
 */

#include <gtest/gtest.h>
#include "application/PaymentAmountCalculator.hpp"
#include "domain/LoanError.hpp"

using namespace loans;
using namespace loans::application;
using domain::Money;
using domain::PaymentFrequency;

class PaymentAmountCalculatorTest : public ::testing::Test {
protected:
    PaymentAmountCalculator calculator_;
};

// ============================================================================
// AMORTIZING PAYMENT
// ============================================================================

TEST_F(PaymentAmountCalculatorTest, Monthly_1200_At12Percent_OneYear) {
    auto payment = calculator_.compute(Money::fromDouble(1200.0), 0.12, 12, PaymentFrequency::MONTHLY);
    EXPECT_EQ(payment, Money::fromDouble(106.62));
}

TEST_F(PaymentAmountCalculatorTest, Monthly_10000_At6Percent_TwoYears) {
    auto payment = calculator_.compute(Money::fromDouble(10000.0), 0.06, 24, PaymentFrequency::MONTHLY);
    EXPECT_EQ(payment, Money::fromDouble(443.21));
}

TEST_F(PaymentAmountCalculatorTest, ZeroRate_SplitsEvenly) {
    auto payment = calculator_.compute(Money::fromDouble(10000.0), 0.0, 10, PaymentFrequency::MONTHLY);
    EXPECT_EQ(payment, Money::fromDouble(1000.0));
}

TEST_F(PaymentAmountCalculatorTest, ZeroRate_RoundsToCent) {
    auto payment = calculator_.compute(Money::fromDouble(1000.0), 0.0, 3, PaymentFrequency::MONTHLY);
    EXPECT_EQ(payment, Money::fromDouble(333.33));
}

TEST_F(PaymentAmountCalculatorTest, SinglePeriod_PaysPrincipalPlusInterest) {
    // Годовой платёж за год: 1000 * 1.10
    auto payment = calculator_.compute(Money::fromDouble(1000.0), 0.10, 12, PaymentFrequency::ANNUALLY);
    EXPECT_EQ(payment, Money::fromDouble(1100.0));
}

TEST_F(PaymentAmountCalculatorTest, PaymentCoversFirstPeriodInterest) {
    auto principal = Money::fromDouble(250000.0);
    auto payment = calculator_.compute(principal, 0.05, 360, PaymentFrequency::MONTHLY);
    EXPECT_GT(payment, principal.applyRate(0.05 / 12));
}

// ============================================================================
// PERIODS
// ============================================================================

TEST_F(PaymentAmountCalculatorTest, TotalPeriods_PerFrequency) {
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(12, PaymentFrequency::WEEKLY), 52);
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(12, PaymentFrequency::BIWEEKLY), 26);
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(12, PaymentFrequency::MONTHLY), 12);
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(12, PaymentFrequency::QUARTERLY), 4);
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(12, PaymentFrequency::ANNUALLY), 1);
}

TEST_F(PaymentAmountCalculatorTest, TotalPeriods_RoundsToNearest) {
    // 7 * 52 / 12 = 30.33
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(7, PaymentFrequency::WEEKLY), 30);
    // 6 / 12 = 0.5 → 1
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(6, PaymentFrequency::ANNUALLY), 1);
}

TEST_F(PaymentAmountCalculatorTest, TotalPeriods_AtLeastOne) {
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(1, PaymentFrequency::ANNUALLY), 1);
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(1, PaymentFrequency::QUARTERLY), 1);

    auto payment = calculator_.compute(Money::fromDouble(500.0), 0.0, 1, PaymentFrequency::QUARTERLY);
    EXPECT_EQ(payment, Money::fromDouble(500.0));
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST_F(PaymentAmountCalculatorTest, InvalidPrincipal_Throws) {
    try {
        calculator_.compute(Money::zero(), 0.05, 12, PaymentFrequency::MONTHLY);
        FAIL() << "Expected LoanException";
    } catch (const domain::LoanException& e) {
        EXPECT_EQ(e.code(), domain::LoanErrorCode::INVALID_PRINCIPAL);
    }
}

TEST_F(PaymentAmountCalculatorTest, InvalidRate_Throws) {
    try {
        calculator_.compute(Money::fromDouble(1000.0), 1.5, 12, PaymentFrequency::MONTHLY);
        FAIL() << "Expected LoanException";
    } catch (const domain::LoanException& e) {
        EXPECT_EQ(e.code(), domain::LoanErrorCode::INVALID_RATE);
    }
    EXPECT_THROW(calculator_.compute(Money::fromDouble(1000.0), -0.01, 12, PaymentFrequency::MONTHLY),
                 domain::LoanException);
}

TEST_F(PaymentAmountCalculatorTest, InvalidTerm_Throws) {
    try {
        calculator_.compute(Money::fromDouble(1000.0), 0.05, 0, PaymentFrequency::MONTHLY);
        FAIL() << "Expected LoanException";
    } catch (const domain::LoanException& e) {
        EXPECT_EQ(e.code(), domain::LoanErrorCode::INVALID_TERM);
    }
}

TEST_F(PaymentAmountCalculatorTest, TermAboveHundredYears_Rejected) {
    EXPECT_NO_THROW(calculator_.compute(Money::fromDouble(1000.0), 0.05, 1200, PaymentFrequency::WEEKLY));

    for (int term : {1201, 10000000, 41300000}) {
        try {
            calculator_.compute(Money::fromDouble(1000.0), 0.05, term, PaymentFrequency::WEEKLY);
            FAIL() << "Expected LoanException for term " << term;
        } catch (const domain::LoanException& e) {
            EXPECT_EQ(e.code(), domain::LoanErrorCode::INVALID_TERM);
        }
    }
}

TEST_F(PaymentAmountCalculatorTest, TotalPeriods_LargeTermDoesNotWrap) {
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(1200, PaymentFrequency::WEEKLY), 5200);
    EXPECT_EQ(PaymentAmountCalculator::totalPeriods(41300000, PaymentFrequency::WEEKLY), 178966667);
}
