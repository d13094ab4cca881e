#pragma once

#include "domain/PeriodSummary.hpp"
#include <cstdint>
#include <string>

namespace ledger::ports::input {

/**
 * @brief Интерфейс агрегированных метрик (только чтение)
 */
class IReportService {
public:
    virtual ~IReportService() = default;

    virtual int64_t totalBalance() const = 0;

    /**
     * @brief Сумма положительных транзакций, дата которых начинается с prefix
     */
    virtual int64_t periodIncome(const std::string& periodPrefix) const = 0;

    /**
     * @brief Модуль суммы отрицательных транзакций периода (>= 0)
     */
    virtual int64_t periodExpense(const std::string& periodPrefix) const = 0;

    virtual domain::PeriodSummary summary(const std::string& periodPrefix) const = 0;

    /**
     * @brief "YYYY-MM" текущего месяца
     */
    virtual std::string currentPeriod() const = 0;
};

} // namespace ledger::ports::input
