#pragma once

#include <cstdint>
#include <string>

namespace ledger::domain {

/**
 * @brief Шаблон ежемесячного фиксированного платежа (固定費)
 *
 * Сам баланс не меняет - из него генерируются транзакции текущего месяца.
 */
struct FixedCostTemplate {
    static constexpr int MIN_DAY = 1;
    static constexpr int MAX_DAY = 31;
    static constexpr const char* MEMO_PREFIX = "固定費:";

    std::string id;         ///< "fc-..."
    std::string name;       ///< "奨学金", "NURO光"
    std::string account;    ///< Имя счёта списания
    int64_t amount = 0;
    std::string memo;
    int day = MIN_DAY;      ///< День месяца, с которого шаблон становится "eligible"

    FixedCostTemplate() = default;

    FixedCostTemplate(
        const std::string& id,
        const std::string& name,
        const std::string& account,
        int64_t amount,
        const std::string& memo,
        int day
    ) : id(id), name(name), account(account), amount(amount), memo(memo), day(day) {}

    static bool isValidDay(int d) {
        return d >= MIN_DAY && d <= MAX_DAY;
    }

    bool operator==(const FixedCostTemplate& other) const = default;
};

} // namespace ledger::domain
