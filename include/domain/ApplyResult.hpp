#pragma once

namespace ledger::domain {

/**
 * @brief Итог пакетного применения шаблонов фиксированных платежей
 */
struct ApplyResult {
    int added = 0;
    int skippedFuture = 0;      ///< День ещё не наступил
    int skippedDuplicate = 0;   ///< Такая транзакция уже есть
    int skippedNoAccount = 0;   ///< Счёт шаблона не найден

    int total() const {
        return added + skippedFuture + skippedDuplicate + skippedNoAccount;
    }

    bool operator==(const ApplyResult& other) const = default;
};

} // namespace ledger::domain
