#pragma once

#include <cstdint>
#include <string>

namespace ledger::domain {

/**
 * @brief Метрики главного экрана: общий баланс и доход/расход за месяц
 */
struct PeriodSummary {
    std::string period;         ///< "YYYY-MM"
    int64_t totalBalance = 0;
    int64_t income = 0;
    int64_t expense = 0;        ///< Всегда >= 0
};

} // namespace ledger::domain
