/**
 * @file AmortizationServiceTest.cpp
 * @brief Unit tests for AmortizationService
 */

#include <gtest/gtest.h>
#include "application/AmortizationService.hpp"
#include "../mocks/FixedClock.hpp"

#include <cmath>
#include <memory>

using namespace loan;
using namespace loan::application;
using loan::domain::Date;
using loan::domain::ErrorCode;
using loan::domain::LoanRequest;

class AmortizationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<tests::FixedClock>(Date(2026, 10, 19));
        service_ = std::make_shared<AmortizationService>(clock_);
    }

    LoanRequest makeRequest(double principal, double rate, double years,
                            int perYear, const Date& start) {
        LoanRequest request;
        request.principal = principal;
        request.annualRatePercent = rate;
        request.termYears = years;
        request.paymentsPerYear = perYear;
        request.startDate = start;
        return request;
    }

    const std::vector<domain::PaymentLine>& scheduleOf(const ports::input::AmortizeResult& out) {
        EXPECT_TRUE(out.result.schedule.has_value());
        return *out.result.schedule;
    }

    std::shared_ptr<tests::FixedClock> clock_;
    std::shared_ptr<AmortizationService> service_;
};

// ============================================================================
// REFERENCE SCENARIO: 1200 at 12% over 1 year, monthly
// ============================================================================

TEST_F(AmortizationServiceTest, MonthlyLoan_PaymentAndFirstLine) {
    auto out = service_->amortize(makeRequest(1200, 12, 1, 12, Date(2024, 1, 1)));

    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(out.result.payment, 106.62);

    const auto& schedule = scheduleOf(out);
    ASSERT_EQ(schedule.size(), 12u);

    const auto& first = schedule.front();
    EXPECT_EQ(first.paymentNo, 1);
    EXPECT_EQ(first.date, Date(2024, 1, 1));
    EXPECT_DOUBLE_EQ(first.payment, 106.62);
    EXPECT_DOUBLE_EQ(first.interest, 12.00);
    EXPECT_DOUBLE_EQ(first.principal, 94.62);
    EXPECT_DOUBLE_EQ(first.balance, 1105.38);

    const auto& second = schedule[1];
    EXPECT_EQ(second.date, Date(2024, 2, 1));
    EXPECT_DOUBLE_EQ(second.interest, 11.05);
    EXPECT_DOUBLE_EQ(second.principal, 95.57);
    EXPECT_DOUBLE_EQ(second.balance, 1009.81);
}

TEST_F(AmortizationServiceTest, MonthlyLoan_FinalPaymentClearsBalance) {
    auto out = service_->amortize(makeRequest(1200, 12, 1, 12, Date(2024, 1, 1)));

    ASSERT_TRUE(out.success);
    const auto& last = scheduleOf(out).back();

    EXPECT_EQ(last.paymentNo, 12);
    EXPECT_EQ(last.date, Date(2024, 12, 1));
    EXPECT_DOUBLE_EQ(last.interest, 1.06);
    EXPECT_DOUBLE_EQ(last.principal, 105.54);
    EXPECT_DOUBLE_EQ(last.payment, 106.60);
    EXPECT_EQ(last.balance, 0.0);
}

TEST_F(AmortizationServiceTest, MonthlyLoan_Totals) {
    auto out = service_->amortize(makeRequest(1200, 12, 1, 12, Date(2024, 1, 1)));

    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(out.result.totalInterest, 79.42);
    EXPECT_DOUBLE_EQ(out.result.totalPayment, 1279.42);
}

// ============================================================================
// LONG SCHEDULES (incremental rounding)
// ============================================================================

TEST_F(AmortizationServiceTest, ThirtyYearMortgage_MatchesIncrementalRounding) {
    auto out = service_->amortize(makeRequest(250000, 6.5, 30, 12, Date(2024, 1, 31)));

    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(out.result.payment, 1580.17);
    EXPECT_DOUBLE_EQ(out.result.totalInterest, 318861.58);
    EXPECT_DOUBLE_EQ(out.result.totalPayment, 568861.58);

    const auto& schedule = scheduleOf(out);
    ASSERT_EQ(schedule.size(), 360u);

    EXPECT_DOUBLE_EQ(schedule[0].interest, 1354.17);
    EXPECT_DOUBLE_EQ(schedule[0].principal, 226.00);
    EXPECT_DOUBLE_EQ(schedule[0].balance, 249774.00);
    EXPECT_EQ(schedule[1].date, Date(2024, 2, 29));

    const auto& last = schedule.back();
    EXPECT_EQ(last.date, Date(2053, 12, 31));
    EXPECT_DOUBLE_EQ(last.payment, 1580.55);
    EXPECT_DOUBLE_EQ(last.interest, 8.52);
    EXPECT_DOUBLE_EQ(last.principal, 1572.03);
    EXPECT_EQ(last.balance, 0.0);
}

TEST_F(AmortizationServiceTest, QuarterlyPayments_DatesStepByMonth) {
    auto out = service_->amortize(makeRequest(10000, 5, 2, 4, Date(2024, 8, 31)));

    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(out.result.payment, 1321.33);
    EXPECT_DOUBLE_EQ(out.result.totalInterest, 570.64);

    const auto& schedule = scheduleOf(out);
    ASSERT_EQ(schedule.size(), 8u);
    EXPECT_DOUBLE_EQ(schedule[0].interest, 125.00);
    EXPECT_EQ(schedule[1].date, Date(2024, 9, 30));
    EXPECT_EQ(schedule.back().date, Date(2025, 3, 31));
    EXPECT_DOUBLE_EQ(schedule.back().principal, 1305.02);
}

TEST_F(AmortizationServiceTest, BiweeklyPayments_FractionalRate) {
    auto out = service_->amortize(makeRequest(5000, 7.25, 3, 26, Date(2024, 1, 15)));

    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(out.result.payment, 71.42);
    EXPECT_DOUBLE_EQ(out.result.totalInterest, 570.35);

    const auto& schedule = scheduleOf(out);
    ASSERT_EQ(schedule.size(), 78u);
    EXPECT_DOUBLE_EQ(schedule[0].interest, 13.94);
    EXPECT_DOUBLE_EQ(schedule.back().payment, 71.01);
    EXPECT_DOUBLE_EQ(schedule.back().principal, 70.81);
}

// ============================================================================
// SCHEDULE INVARIANTS
// ============================================================================

TEST_F(AmortizationServiceTest, Schedule_InvariantsHoldAcrossLoans) {
    const LoanRequest requests[] = {
        makeRequest(1200, 12, 1, 12, Date(2024, 1, 1)),
        makeRequest(250000, 6.5, 30, 12, Date(2024, 1, 31)),
        makeRequest(10000, 5, 2, 4, Date(2024, 8, 31)),
        makeRequest(999.99, 19.99, 2.5, 12, Date(2023, 5, 31)),
        makeRequest(1000, 0, 1, 12, Date(2024, 1, 31)),
    };

    for (const auto& request : requests) {
        auto out = service_->amortize(request);
        ASSERT_TRUE(out.success);

        const auto& schedule = scheduleOf(out);
        ASSERT_EQ(static_cast<int64_t>(schedule.size()), request.paymentCount());

        double principalSum = 0.0;
        double previousBalance = request.principal;
        for (size_t i = 0; i < schedule.size(); ++i) {
            EXPECT_EQ(schedule[i].paymentNo, static_cast<int64_t>(i + 1));
            EXPECT_LE(schedule[i].balance, previousBalance);
            EXPECT_GE(schedule[i].balance, 0.0);
            previousBalance = schedule[i].balance;
            principalSum += schedule[i].principal;
        }

        EXPECT_EQ(schedule.back().balance, 0.0);
        EXPECT_NEAR(principalSum, request.principal, 0.01 * schedule.size());
    }
}

// ============================================================================
// ZERO RATE
// ============================================================================

TEST_F(AmortizationServiceTest, ZeroRate_EqualInstallmentsLastAbsorbsResidue) {
    auto out = service_->amortize(makeRequest(1000, 0, 1, 12, Date(2024, 1, 31)));

    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(out.result.payment, 83.33);
    EXPECT_DOUBLE_EQ(out.result.totalInterest, 0.0);
    EXPECT_DOUBLE_EQ(out.result.totalPayment, 1000.0);

    const auto& schedule = scheduleOf(out);
    for (size_t i = 0; i + 1 < schedule.size(); ++i) {
        EXPECT_DOUBLE_EQ(schedule[i].principal, 83.33);
        EXPECT_DOUBLE_EQ(schedule[i].interest, 0.0);
    }
    EXPECT_DOUBLE_EQ(schedule.back().principal, 83.37);
    EXPECT_DOUBLE_EQ(schedule.back().payment, 83.37);
    EXPECT_EQ(schedule.back().date, Date(2024, 12, 31));
}

TEST_F(AmortizationServiceTest, ZeroRate_CommonYearFebruary) {
    auto out = service_->amortize(makeRequest(100, 0, 1, 3, Date(2023, 1, 31)));

    ASSERT_TRUE(out.success);
    const auto& schedule = scheduleOf(out);
    ASSERT_EQ(schedule.size(), 3u);
    EXPECT_EQ(schedule[1].date, Date(2023, 2, 28));
    EXPECT_DOUBLE_EQ(schedule[1].balance, 33.34);
    EXPECT_DOUBLE_EQ(schedule[2].principal, 33.34);
}

TEST_F(AmortizationServiceTest, ZeroPrincipal_TrivialSchedule) {
    auto out = service_->amortize(makeRequest(0, 5, 1, 12, Date(2024, 1, 1)));

    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(out.result.payment, 0.0);
    EXPECT_DOUBLE_EQ(out.result.totalPayment, 0.0);
    for (const auto& line : scheduleOf(out)) {
        EXPECT_DOUBLE_EQ(line.payment, 0.0);
        EXPECT_DOUBLE_EQ(line.balance, 0.0);
    }
}

// ============================================================================
// SCHEDULE FLAG / TERM
// ============================================================================

TEST_F(AmortizationServiceTest, IncludeScheduleFalse_OnlyTotals) {
    auto request = makeRequest(1200, 12, 1, 12, Date(2024, 1, 1));
    request.includeSchedule = false;

    auto out = service_->amortize(request);

    ASSERT_TRUE(out.success);
    EXPECT_FALSE(out.result.schedule.has_value());
    EXPECT_DOUBLE_EQ(out.result.payment, 106.62);
    EXPECT_DOUBLE_EQ(out.result.totalInterest, 79.42);
}

TEST_F(AmortizationServiceTest, ZeroTerm_ReturnsInvalidTerm) {
    auto out = service_->amortize(makeRequest(1200, 12, 0, 12, Date(2024, 1, 1)));

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error.code, ErrorCode::INVALID_TERM);
    EXPECT_EQ(out.error.message, "Term must be positive");
}

TEST_F(AmortizationServiceTest, TermRoundingToZero_ReturnsInvalidTerm) {
    // 0.04 * 12 = 0.48 -> 0 платежей
    auto out = service_->amortize(makeRequest(1200, 12, 0.04, 12, Date(2024, 1, 1)));

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error.code, ErrorCode::INVALID_TERM);
}

TEST_F(AmortizationServiceTest, NegativeTerm_ReturnsInvalidTerm) {
    auto out = service_->amortize(makeRequest(1200, 12, -1, 12, Date(2024, 1, 1)));

    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error.code, ErrorCode::INVALID_TERM);
}

TEST_F(AmortizationServiceTest, NonPositivePaymentsPerYear_ReturnsInvalidTerm) {
    EXPECT_FALSE(service_->amortize(makeRequest(1200, 12, 1, 0, Date(2024, 1, 1))).success);
    EXPECT_FALSE(service_->amortize(makeRequest(1200, 12, -1, -12, Date(2024, 1, 1))).success);
}

TEST_F(AmortizationServiceTest, PaymentCount_RoundsHalfToEven) {
    EXPECT_EQ(makeRequest(1, 0, 2.5, 1, Date()).paymentCount(), 2);
    EXPECT_EQ(makeRequest(1, 0, 3.5, 1, Date()).paymentCount(), 4);
    EXPECT_EQ(makeRequest(1, 0, 0.5, 1, Date()).paymentCount(), 0);
}

TEST_F(AmortizationServiceTest, HalfPeriodTerm_SinglePayment) {
    auto out = service_->amortize(makeRequest(500, 10, 1.5, 1, Date(2024, 3, 10)));

    ASSERT_TRUE(out.success);
    const auto& schedule = scheduleOf(out);
    ASSERT_EQ(schedule.size(), 2u);
    EXPECT_EQ(schedule.back().balance, 0.0);
}

// ============================================================================
// NORMALIZE THROUGH THE SERVICE PORT
// ============================================================================

TEST_F(AmortizationServiceTest, Normalize_UsesClockForMissingStartDate) {
    auto normalized = service_->normalize({{"principal", "1200"}, {"annual_rate", "12"}, {"term_years", "1"}});

    ASSERT_TRUE(normalized.success);
    EXPECT_EQ(normalized.request.startDate, Date(2026, 10, 19));
    EXPECT_EQ(clock_->getCallCount(), 1);

    auto out = service_->amortize(normalized.request);
    ASSERT_TRUE(out.success);
    EXPECT_EQ(scheduleOf(out).front().date, Date(2026, 10, 19));
    EXPECT_EQ(scheduleOf(out).back().date, Date(2027, 9, 19));
}

TEST_F(AmortizationServiceTest, Normalize_ReadsClockOnEveryCall) {
    clock_->setToday(Date(2024, 1, 31));
    auto first = service_->normalize({{"term_years", "1"}});

    clock_->setToday(Date(2024, 2, 29));
    auto second = service_->normalize({{"term_years", "1"}, {"start_date", ""}});

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.request.startDate, Date(2024, 1, 31));
    EXPECT_EQ(second.request.startDate, Date(2024, 2, 29));
    EXPECT_EQ(clock_->getCallCount(), 2);
}

TEST_F(AmortizationServiceTest, LevelPayment_Formula) {
    EXPECT_DOUBLE_EQ(AmortizationService::levelPayment(1200, 0.01, 12), 106.62);
    EXPECT_DOUBLE_EQ(AmortizationService::levelPayment(1000, 0.0, 12), 83.33);
}
