#pragma once

#include "domain/ApplyResult.hpp"
#include "domain/CalendarDate.hpp"

namespace ledger::ports::input {

/**
 * @brief Интерфейс пакетного добавления фиксированных платежей за месяц
 *
 * Идемпотентен: повторный вызов за ту же дату ничего не добавляет.
 */
class IRecurringChargeService {
public:
    virtual ~IRecurringChargeService() = default;

    /**
     * @brief Развернуть шаблоны в транзакции текущего месяца даты today
     */
    virtual domain::ApplyResult applyForDate(const domain::CalendarDate& today) = 0;

    /**
     * @brief То же, для даты из IClock
     */
    virtual domain::ApplyResult applyForToday() = 0;
};

} // namespace ledger::ports::input
