#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Персистентная коллекция записей
 *
 * Строковое значение - ключ документа в IDocumentStore.
 */
enum class Collection {
    ACCOUNTS,
    TRANSACTIONS,
    FIXED_COSTS
};

inline std::string toString(Collection collection) {
    switch (collection) {
        case Collection::ACCOUNTS:     return "accounts";
        case Collection::TRANSACTIONS: return "transactions";
        case Collection::FIXED_COSTS:  return "fixed_costs";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если ключ не распознан
 */
inline Collection collectionFromString(const std::string& str) {
    if (str == "accounts")     return Collection::ACCOUNTS;
    if (str == "transactions") return Collection::TRANSACTIONS;
    if (str == "fixed_costs")  return Collection::FIXED_COSTS;
    throw std::invalid_argument("Unknown Collection: " + str);
}

} // namespace ledger::domain
