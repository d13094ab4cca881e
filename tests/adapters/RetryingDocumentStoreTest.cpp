#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/persistence/RetryingDocumentStore.hpp"
#include "../mocks/MockDocumentStore.hpp"

using namespace ledger;
using namespace ledger::adapters::secondary;
using namespace ledger::tests;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;
using json = nlohmann::json;

// ============================================================================
// Test Fixture
// ============================================================================

class RetryingDocumentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockDelegate_ = std::make_shared<MockDocumentStore>();
        retrying_ = std::make_shared<RetryingDocumentStore>(
            mockDelegate_, 3, std::chrono::milliseconds(0));
    }

    static domain::PersistenceError failure(const std::string& key) {
        return domain::PersistenceError(key, "disk busy");
    }

    std::shared_ptr<MockDocumentStore> mockDelegate_;
    std::shared_ptr<RetryingDocumentStore> retrying_;
};

// ============================================================================
// SAVE
// ============================================================================

TEST_F(RetryingDocumentStoreTest, Save_SuccessOnFirstAttempt) {
    EXPECT_CALL(*mockDelegate_, save("accounts", _)).Times(1);

    retrying_->save("accounts", json::array());
}

TEST_F(RetryingDocumentStoreTest, Save_RecoversAfterTransientFailure) {
    EXPECT_CALL(*mockDelegate_, save("accounts", _))
        .WillOnce(Throw(failure("accounts")))
        .WillOnce(Throw(failure("accounts")))
        .WillOnce(Return());

    EXPECT_NO_THROW(retrying_->save("accounts", json::array()));
}

TEST_F(RetryingDocumentStoreTest, Save_GivesUpAfterMaxAttempts) {
    EXPECT_CALL(*mockDelegate_, save("accounts", _))
        .Times(3)
        .WillRepeatedly(Throw(failure("accounts")));

    EXPECT_THROW(retrying_->save("accounts", json::array()), domain::PersistenceError);
}

TEST_F(RetryingDocumentStoreTest, Save_OtherExceptionsNotRetried) {
    EXPECT_CALL(*mockDelegate_, save(_, _))
        .Times(1)
        .WillOnce(Throw(std::logic_error("bug")));

    EXPECT_THROW(retrying_->save("accounts", json::array()), std::logic_error);
}

// ============================================================================
// LOAD
// ============================================================================

TEST_F(RetryingDocumentStoreTest, Load_ReturnsDelegateResult) {
    json document = json::array({{{"id", "acc-1"}}});
    EXPECT_CALL(*mockDelegate_, load("accounts", _))
        .WillOnce(Throw(failure("accounts")))
        .WillOnce(Return(document));

    EXPECT_EQ(retrying_->load("accounts", json::array()), document);
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

TEST_F(RetryingDocumentStoreTest, Constructor_RejectsZeroAttempts) {
    EXPECT_THROW(
        RetryingDocumentStore(mockDelegate_, 0, std::chrono::milliseconds(0)),
        std::invalid_argument);
}
