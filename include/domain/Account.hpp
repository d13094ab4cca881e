#pragma once

#include <cstdint>
#include <string>

namespace ledger::domain {

/**
 * @brief Банковский счёт (кошелёк) пользователя
 *
 * Баланс хранится в минимальных единицах валюты (иены, без дробной части).
 * Инвариант: balance == начальный баланс + сумма amount всех транзакций,
 * ссылающихся на счёт по имени.
 */
struct Account {
    std::string id;         ///< "acc-..." неизменяемый
    std::string name;       ///< Название ("SMBC", "現金"), уникальность не гарантируется
    int64_t balance = 0;    ///< Текущий баланс

    Account() = default;

    Account(const std::string& id, const std::string& name, int64_t balance)
        : id(id), name(name), balance(balance) {}

    bool operator==(const Account& other) const = default;
};

} // namespace ledger::domain
