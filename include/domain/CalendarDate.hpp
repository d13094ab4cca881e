#pragma once

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>

namespace ledger::domain {

/**
 * @brief Календарная дата без времени и часового пояса
 *
 * Строковое представление - ISO 8601 (YYYY-MM-DD). Разбор строгий:
 * ровно 10 символов, существующий день месяца с учётом високосных лет.
 */
class CalendarDate {
public:
    CalendarDate() = default;

    /**
     * @throws std::invalid_argument если такой даты не существует
     */
    CalendarDate(int year, int month, int day)
        : year_(year), month_(month), day_(day)
    {
        if (!isValid(year, month, day)) {
            throw std::invalid_argument(
                "Invalid calendar date: " + std::to_string(year) + "-" +
                std::to_string(month) + "-" + std::to_string(day));
        }
    }

    static std::optional<CalendarDate> parse(const std::string& str) {
        if (str.size() != 10 || str[4] != '-' || str[7] != '-') {
            return std::nullopt;
        }
        for (size_t i = 0; i < str.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (str[i] < '0' || str[i] > '9') return std::nullopt;
        }

        int year = std::stoi(str.substr(0, 4));
        int month = std::stoi(str.substr(5, 2));
        int day = std::stoi(str.substr(8, 2));
        if (!isValid(year, month, day)) {
            return std::nullopt;
        }
        return CalendarDate(year, month, day);
    }

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    /**
     * @brief "YYYY-MM" - префикс периода для месячных агрегатов
     */
    std::string monthPrefix() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d", year_, month_);
        return buf;
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year_, month_, day_);
        return buf;
    }

    static bool isLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    static int daysInMonth(int year, int month) {
        static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && isLeapYear(year)) return 29;
        return DAYS[month - 1];
    }

    static bool isValid(int year, int month, int day) {
        if (year < 1 || year > 9999) return false;
        if (month < 1 || month > 12) return false;
        return day >= 1 && day <= daysInMonth(year, month);
    }

    bool operator==(const CalendarDate& other) const {
        return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
    }

    bool operator<(const CalendarDate& other) const {
        return std::tie(year_, month_, day_) < std::tie(other.year_, other.month_, other.day_);
    }

private:
    int year_ = 1970;
    int month_ = 1;
    int day_ = 1;
};

} // namespace ledger::domain
