/**
 * @file ReportServiceTest.cpp
 * @brief Unit tests for ReportService
 */

#include <gtest/gtest.h>
#include "application/ReportService.hpp"
#include "application/LedgerStore.hpp"
#include "../mocks/InMemoryDocumentStore.hpp"
#include "../mocks/FixedClock.hpp"

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;

class ReportServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryDocumentStore>();
        clock_ = std::make_shared<FixedClock>(domain::CalendarDate(2024, 5, 27));
        ledger_ = std::make_shared<LedgerStore>(store_, clock_);
        reports_ = std::make_shared<ReportService>(ledger_, clock_);
    }

    std::shared_ptr<InMemoryDocumentStore> store_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<LedgerStore> ledger_;
    std::shared_ptr<ReportService> reports_;
};

TEST_F(ReportServiceTest, IncomeAndExpenseForMonth) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTransaction(domain::CalendarDate(2024, 5, 1), "SMBC", 1000, "");
    ledger_->addTransaction(domain::CalendarDate(2024, 5, 2), "SMBC", -300, "");
    ledger_->addTransaction(domain::CalendarDate(2024, 4, 30), "SMBC", -9999, "");

    auto summary = reports_->summary("2024-05");

    EXPECT_EQ(summary.period, "2024-05");
    EXPECT_EQ(summary.income, 1000);
    EXPECT_EQ(summary.expense, 300);
    EXPECT_EQ(summary.totalBalance, 1000 - 300 - 9999);
}

TEST_F(ReportServiceTest, OtherMonthsExcluded) {
    ledger_->addTransaction(domain::CalendarDate(2024, 5, 3), "SMBC", 1000, "");
    ledger_->addTransaction(domain::CalendarDate(2024, 5, 10), "SMBC", -300, "");
    ledger_->addTransaction(domain::CalendarDate(2024, 4, 20), "SMBC", 5000, "");

    EXPECT_EQ(reports_->periodIncome("2024-05"), 1000);
    EXPECT_EQ(reports_->periodExpense("2024-05"), 300);
    EXPECT_EQ(reports_->periodIncome("2024-04"), 5000);
}

TEST_F(ReportServiceTest, TotalBalance_SumsAllAccounts) {
    ledger_->addAccount("SMBC", 10000);
    ledger_->addAccount("現金", -2500);

    EXPECT_EQ(reports_->totalBalance(), 7500);
}

TEST_F(ReportServiceTest, EmptyPeriod_ZeroIncomeAndExpense) {
    ledger_->addAccount("SMBC", 500);

    EXPECT_EQ(reports_->periodIncome("2030-01"), 0);
    EXPECT_EQ(reports_->periodExpense("2030-01"), 0);
}

TEST_F(ReportServiceTest, OrphanTransactionsStillCounted) {
    ledger_->addTransaction(domain::CalendarDate(2024, 5, 3), "ghost", -700, "");

    EXPECT_EQ(reports_->periodExpense("2024-05"), 700);
    EXPECT_EQ(reports_->totalBalance(), 0);
}

TEST_F(ReportServiceTest, CurrentPeriod_FromClock) {
    EXPECT_EQ(reports_->currentPeriod(), "2024-05");

    clock_->set(domain::CalendarDate(2025, 1, 1));
    EXPECT_EQ(reports_->currentPeriod(), "2025-01");
}

TEST(ReportServicePureTest, Summarize_OverSnapshot) {
    domain::LedgerState state;
    state.accounts.push_back(domain::Account("acc-1", "SMBC", 700));
    state.transactions = {
        {"tx-1", "2024-05-01", "SMBC", 1000},
        {"tx-2", "2024-05-02", "SMBC", -300},
        {"tx-3", "garbage", "SMBC", 5},
    };

    auto summary = ReportService::summarize(state, "2024-05");

    EXPECT_EQ(summary.totalBalance, 700);
    EXPECT_EQ(summary.income, 1000);
    EXPECT_EQ(summary.expense, 300);
}
