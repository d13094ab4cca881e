#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>
#include <ctime>

namespace ledger::adapters::secondary {

/**
 * @brief Текущая дата по локальному времени машины
 */
class SystemClock : public ports::output::IClock {
public:
    domain::CalendarDate today() const override {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        return domain::CalendarDate(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
    }
};

} // namespace ledger::adapters::secondary
