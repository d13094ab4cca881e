#pragma once

#include <cstdint>
#include <string>

namespace ledger::domain {

/**
 * @brief Запись о доходе или расходе
 *
 * account - ИМЯ счёта на момент создания (денормализованная ссылка).
 * После переименования или удаления счёта ссылка "осиротеет" - это допустимо.
 */
struct Transaction {
    std::string id;         ///< "tx-..."
    std::string date;       ///< YYYY-MM-DD, в старых данных может не парситься
    std::string account;    ///< Имя счёта
    int64_t amount = 0;     ///< > 0 доход, < 0 расход
    std::string memo;

    Transaction() = default;

    Transaction(
        const std::string& id,
        const std::string& date,
        const std::string& account,
        int64_t amount,
        const std::string& memo = ""
    ) : id(id), date(date), account(account), amount(amount), memo(memo) {}

    bool isIncome() const { return amount > 0; }
    bool isExpense() const { return amount < 0; }

    bool operator==(const Transaction& other) const = default;
};

} // namespace ledger::domain
