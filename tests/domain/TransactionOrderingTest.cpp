/**
 * @file TransactionOrderingTest.cpp
 * @brief Unit tests for TransactionOrder
 */

#include <gtest/gtest.h>
#include "domain/TransactionOrdering.hpp"

using namespace ledger::domain;

namespace {

std::vector<std::string> ids(const std::vector<Transaction>& transactions) {
    std::vector<std::string> result;
    for (const auto& tx : transactions) {
        result.push_back(tx.id);
    }
    return result;
}

} // namespace

TEST(TransactionOrderingTest, SortsByDateAscending) {
    std::vector<Transaction> txs = {
        {"tx-c", "2024-05-10", "SMBC", -100},
        {"tx-a", "2024-04-30", "SMBC", -100},
        {"tx-b", "2024-05-01", "SMBC", -100},
    };

    sortTransactions(txs);

    EXPECT_EQ(ids(txs), (std::vector<std::string>{"tx-a", "tx-b", "tx-c"}));
}

TEST(TransactionOrderingTest, SameDate_TieBrokenById) {
    std::vector<Transaction> txs = {
        {"tx-2", "2024-05-01", "SMBC", 10},
        {"tx-1", "2024-05-01", "現金", 20},
    };

    sortTransactions(txs);

    EXPECT_EQ(ids(txs), (std::vector<std::string>{"tx-1", "tx-2"}));
}

TEST(TransactionOrderingTest, UnparsableDatesSortLast) {
    std::vector<Transaction> txs = {
        {"tx-1", "not-a-date", "SMBC", 10},
        {"tx-2", "2099-12-31", "SMBC", 10},
        {"tx-0", "2024-02-30", "SMBC", 10},
        {"tx-3", "2000-01-01", "SMBC", 10},
    };

    sortTransactions(txs);

    EXPECT_EQ(ids(txs), (std::vector<std::string>{"tx-3", "tx-2", "tx-0", "tx-1"}));
    EXPECT_TRUE(isSorted(txs));
}

TEST(TransactionOrderingTest, IsSorted_DetectsDisorder) {
    std::vector<Transaction> txs = {
        {"tx-1", "2024-05-02", "SMBC", 10},
        {"tx-2", "2024-05-01", "SMBC", 10},
    };

    EXPECT_FALSE(isSorted(txs));
}

TEST(TransactionOrderingTest, SortingTwice_IdenticalResult) {
    std::vector<Transaction> txs = {
        {"tx-9", "garbage", "SMBC", 1, "b"},
        {"tx-5", "2024-05-01", "現金", -20, "x"},
        {"tx-1", "2024-05-01", "SMBC", 10, "a"},
        {"tx-7", "", "SMBC", 3},
        {"tx-3", "2024-04-30", "SMBC", 7},
        {"tx-2", "2024-05-01", "SMBC", 10, "a"},
    };

    sortTransactions(txs);
    const auto once = txs;
    sortTransactions(txs);

    EXPECT_EQ(txs, once);
    EXPECT_EQ(ids(txs), (std::vector<std::string>{"tx-3", "tx-1", "tx-2", "tx-5", "tx-7", "tx-9"}));
}
