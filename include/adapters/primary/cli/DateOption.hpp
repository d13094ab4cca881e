#pragma once

#include "adapters/primary/cli/CommandArgs.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/errors/ValidationError.hpp"
#include "ports/output/IClock.hpp"

namespace ledger::adapters::primary::cli {

/**
 * @brief Значение --date или сегодняшняя дата
 * @throws domain::ValidationError если дата не в формате YYYY-MM-DD
 */
inline domain::CalendarDate dateOptionOrToday(
    const CommandArgs& args,
    const ports::output::IClock& clock)
{
    auto raw = args.find("date");
    if (!raw) {
        return clock.today();
    }
    auto parsed = domain::CalendarDate::parse(*raw);
    if (!parsed) {
        throw domain::ValidationError("Invalid date '" + *raw + "', expected YYYY-MM-DD");
    }
    return *parsed;
}

} // namespace ledger::adapters::primary::cli
