#pragma once

#include "domain/CalendarDate.hpp"

namespace ledger::ports::output {

/**
 * @brief Источник текущей даты
 *
 * Единственная точка, где ядро узнаёт "сегодня". В тестах подменяется.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::CalendarDate today() const = 0;
};

} // namespace ledger::ports::output
