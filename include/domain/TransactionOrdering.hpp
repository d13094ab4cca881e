#pragma once

#include "Transaction.hpp"
#include "CalendarDate.hpp"
#include <algorithm>
#include <tuple>
#include <vector>

namespace ledger::domain {

/**
 * @brief Единственный порядок транзакций для хранения и отображения
 *
 * 1. Дата по возрастанию; непарсящиеся даты - после всех корректных.
 * 2. При равной дате - id лексикографически.
 */
struct TransactionOrder {
    bool operator()(const Transaction& lhs, const Transaction& rhs) const {
        return key(lhs) < key(rhs);
    }

private:
    // (0, yyyymmdd) для корректной даты, (1, 0) - для битой
    static std::tuple<int, int, const std::string&> key(const Transaction& tx) {
        auto parsed = CalendarDate::parse(tx.date);
        if (!parsed) {
            return {1, 0, tx.id};
        }
        return {0, parsed->year() * 10000 + parsed->month() * 100 + parsed->day(), tx.id};
    }
};

inline void sortTransactions(std::vector<Transaction>& transactions) {
    std::stable_sort(transactions.begin(), transactions.end(), TransactionOrder{});
}

inline bool isSorted(const std::vector<Transaction>& transactions) {
    return std::is_sorted(transactions.begin(), transactions.end(), TransactionOrder{});
}

} // namespace ledger::domain
