#pragma once

#include "Account.hpp"
#include "Transaction.hpp"
#include "FixedCostTemplate.hpp"
#include <vector>

namespace ledger::domain {

/**
 * @brief Снимок всех трёх коллекций
 */
struct LedgerState {
    std::vector<Account> accounts;
    std::vector<Transaction> transactions;
    std::vector<FixedCostTemplate> templates;
};

} // namespace ledger::domain
