/**
 * @file RecurringChargeServiceTest.cpp
 * @brief Unit tests for RecurringChargeService
 */

#include <gtest/gtest.h>
#include "application/RecurringChargeService.hpp"
#include "../mocks/InMemoryDocumentStore.hpp"
#include "../mocks/FixedClock.hpp"

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;

class RecurringChargeServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryDocumentStore>();
        clock_ = std::make_shared<FixedClock>(domain::CalendarDate(2024, 5, 27));
        ledger_ = std::make_shared<LedgerStore>(store_, clock_);
        service_ = std::make_shared<RecurringChargeService>(ledger_, clock_);
    }

    domain::ApplyResult expected(int added, int future, int dup, int noAccount) {
        domain::ApplyResult result;
        result.added = added;
        result.skippedFuture = future;
        result.skippedDuplicate = dup;
        result.skippedNoAccount = noAccount;
        return result;
    }

    std::shared_ptr<InMemoryDocumentStore> store_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<LedgerStore> ledger_;
    std::shared_ptr<RecurringChargeService> service_;
};

// ============================================================================
// ELIGIBILITY
// ============================================================================

TEST_F(RecurringChargeServiceTest, DueTemplateAdded_FutureSkipped) {
    ledger_->addAccount("SMBC", 100000);
    ledger_->addTemplate({"NURO光", "SMBC", -5000, "", 27});
    ledger_->addTemplate({"家賃", "SMBC", -80000, "", 28});

    auto result = service_->applyForDate(domain::CalendarDate(2024, 5, 27));

    EXPECT_EQ(result, expected(1, 1, 0, 0));
    auto txs = ledger_->transactions();
    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].date, "2024-05-27");
    EXPECT_EQ(txs[0].account, "SMBC");
    EXPECT_EQ(txs[0].amount, -5000);
    EXPECT_EQ(txs[0].memo, "固定費:NURO光");
    EXPECT_EQ(ledger_->accounts()[0].balance, 95000);
}

TEST_F(RecurringChargeServiceTest, Day28_FutureOn27_AddedOn28) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTemplate({"家賃", "SMBC", -80000, "", 28});

    EXPECT_EQ(service_->applyForDate(domain::CalendarDate(2024, 5, 27)), expected(0, 1, 0, 0));
    EXPECT_TRUE(ledger_->transactions().empty());

    EXPECT_EQ(service_->applyForDate(domain::CalendarDate(2024, 5, 28)), expected(1, 0, 0, 0));
    EXPECT_EQ(ledger_->transactions()[0].date, "2024-05-28");
}

TEST_F(RecurringChargeServiceTest, DayBeyondMonthLength_NeverDue) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTemplate({"カード", "SMBC", -1000, "", 31});

    auto result = service_->applyForDate(domain::CalendarDate(2023, 2, 28));

    EXPECT_EQ(result, expected(0, 1, 0, 0));
}

TEST_F(RecurringChargeServiceTest, EarlierDayInMonth_DatedOnTemplateDay) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTemplate({"奨学金", "SMBC", -15000, "", 5});

    service_->applyForDate(domain::CalendarDate(2024, 6, 20));

    ASSERT_EQ(ledger_->transactions().size(), 1u);
    EXPECT_EQ(ledger_->transactions()[0].date, "2024-06-05");
}

// ============================================================================
// IDEMPOTENCE
// ============================================================================

TEST_F(RecurringChargeServiceTest, SecondApply_AddsNothing) {
    ledger_->addAccount("SMBC", 100000);
    ledger_->addTemplate({"NURO光", "SMBC", -5000, "", 27});

    service_->applyForDate(domain::CalendarDate(2024, 5, 27));
    auto second = service_->applyForDate(domain::CalendarDate(2024, 5, 30));

    EXPECT_EQ(second, expected(0, 0, 1, 0));
    EXPECT_EQ(ledger_->transactions().size(), 1u);
    EXPECT_EQ(ledger_->accounts()[0].balance, 95000);
}

TEST_F(RecurringChargeServiceTest, SecondApply_LeavesLedgerIdentical) {
    ledger_->addAccount("SMBC", 100000);
    ledger_->addAccount("現金", 5000);
    ledger_->addTemplate({"NURO光", "SMBC", -5000, "", 27});
    ledger_->addTemplate({"奨学金", "SMBC", -15000, "返済", 10});
    ledger_->addTemplate({"お小遣い", "現金", 3000, "", 1});
    ledger_->addTransaction(domain::CalendarDate(2024, 5, 12), "現金", -800, "ランチ");

    service_->applyForDate(domain::CalendarDate(2024, 5, 27));
    const auto transactionsAfterFirst = ledger_->transactions();
    const auto accountsAfterFirst = ledger_->accounts();

    auto second = service_->applyForDate(domain::CalendarDate(2024, 5, 27));

    EXPECT_EQ(second, expected(0, 0, 3, 0));
    EXPECT_EQ(ledger_->transactions(), transactionsAfterFirst);
    EXPECT_EQ(ledger_->accounts(), accountsAfterFirst);
}

TEST_F(RecurringChargeServiceTest, NextMonth_AddsAgain) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTemplate({"NURO光", "SMBC", -5000, "", 27});

    service_->applyForDate(domain::CalendarDate(2024, 5, 27));
    auto june = service_->applyForDate(domain::CalendarDate(2024, 6, 27));

    EXPECT_EQ(june.added, 1);
    EXPECT_EQ(ledger_->accounts()[0].balance, -10000);
}

TEST_F(RecurringChargeServiceTest, ManuallyEnteredMatchingTransaction_CountsAsDuplicate) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTemplate({"家賃", "SMBC", -80000, "振込", 25});
    ledger_->addTransaction(domain::CalendarDate(2024, 5, 25), "SMBC", -80000, "固定費:家賃 / 振込");

    auto result = service_->applyForDate(domain::CalendarDate(2024, 5, 27));

    EXPECT_EQ(result, expected(0, 0, 1, 0));
}

TEST_F(RecurringChargeServiceTest, IdenticalTemplates_SecondIsDuplicate) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTemplate({"家賃", "SMBC", -80000, "", 1});
    ledger_->addTemplate({"家賃", "SMBC", -80000, "", 1});

    auto result = service_->applyForDate(domain::CalendarDate(2024, 5, 2));

    EXPECT_EQ(result, expected(1, 0, 1, 0));
}

// ============================================================================
// MISSING ACCOUNT
// ============================================================================

TEST_F(RecurringChargeServiceTest, DeletedAccount_SkippedNoAccount) {
    auto account = ledger_->addAccount("楽天", 0);
    ledger_->addTemplate({"携帯", "楽天", -3000, "", 10});
    ledger_->deleteAccount(account.id);

    auto result = service_->applyForDate(domain::CalendarDate(2024, 5, 27));

    EXPECT_EQ(result, expected(0, 0, 0, 1));
    EXPECT_TRUE(ledger_->transactions().empty());
}

// ============================================================================
// PERSISTENCE
// ============================================================================

TEST_F(RecurringChargeServiceTest, AlwaysPersistsBothCollections) {
    ledger_->addAccount("SMBC", 0);
    store_->resetCounters();

    service_->applyForDate(domain::CalendarDate(2024, 5, 27));

    EXPECT_EQ(store_->saveCallCount(), 2);
    EXPECT_TRUE(store_->contains("transactions"));
}

TEST_F(RecurringChargeServiceTest, SaveFailure_NothingApplied) {
    ledger_->addAccount("SMBC", 1000);
    ledger_->addTemplate({"NURO光", "SMBC", -500, "", 1});
    store_->failSavesFor("accounts");

    EXPECT_THROW(service_->applyForDate(domain::CalendarDate(2024, 5, 27)), domain::PersistenceError);

    EXPECT_TRUE(ledger_->transactions().empty());
    EXPECT_EQ(ledger_->accounts()[0].balance, 1000);
}

TEST_F(RecurringChargeServiceTest, ApplyForToday_UsesClock) {
    ledger_->addAccount("SMBC", 0);
    ledger_->addTemplate({"NURO光", "SMBC", -5000, "", 27});
    clock_->set(domain::CalendarDate(2024, 5, 26));

    EXPECT_EQ(service_->applyForToday(), expected(0, 1, 0, 0));

    clock_->set(domain::CalendarDate(2024, 5, 27));
    EXPECT_EQ(service_->applyForToday(), expected(1, 0, 0, 0));
}

// ============================================================================
// HELPERS
// ============================================================================

TEST(RecurringChargeHelpersTest, ComposeMemo) {
    domain::FixedCostTemplate plain("fc-1", " NURO光 ", "SMBC", -5000, "  ", 27);
    domain::FixedCostTemplate withMemo("fc-2", "家賃", "SMBC", -80000, " 振込 ", 25);

    EXPECT_EQ(RecurringChargeService::composeMemo(plain), "固定費:NURO光");
    EXPECT_EQ(RecurringChargeService::composeMemo(withMemo), "固定費:家賃 / 振込");
}

TEST(RecurringChargeHelpersTest, ComposeDate_ZeroPadsDay) {
    EXPECT_EQ(RecurringChargeService::composeDate("2024-05", 5), "2024-05-05");
    EXPECT_EQ(RecurringChargeService::composeDate("2024-05", 27), "2024-05-27");
}
