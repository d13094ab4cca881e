/**
 * @file CalendarDateTest.cpp
 * @brief Unit tests for CalendarDate
 */

#include <gtest/gtest.h>
#include "domain/CalendarDate.hpp"

using namespace ledger::domain;

TEST(CalendarDateTest, Parse_ValidDate) {
    auto date = CalendarDate::parse("2024-05-27");

    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->year(), 2024);
    EXPECT_EQ(date->month(), 5);
    EXPECT_EQ(date->day(), 27);
}

TEST(CalendarDateTest, Parse_RejectsWrongShape) {
    EXPECT_FALSE(CalendarDate::parse("").has_value());
    EXPECT_FALSE(CalendarDate::parse("2024-5-27").has_value());
    EXPECT_FALSE(CalendarDate::parse("2024/05/27").has_value());
    EXPECT_FALSE(CalendarDate::parse("2024-05-27T00:00").has_value());
    EXPECT_FALSE(CalendarDate::parse("abcd-ef-gh").has_value());
    EXPECT_FALSE(CalendarDate::parse("2024-0a-01").has_value());
}

TEST(CalendarDateTest, Parse_RejectsNonExistentDay) {
    EXPECT_FALSE(CalendarDate::parse("2024-13-01").has_value());
    EXPECT_FALSE(CalendarDate::parse("2024-00-10").has_value());
    EXPECT_FALSE(CalendarDate::parse("2024-04-31").has_value());
    EXPECT_FALSE(CalendarDate::parse("2023-02-29").has_value());
}

TEST(CalendarDateTest, LeapYears) {
    EXPECT_TRUE(CalendarDate::parse("2024-02-29").has_value());
    EXPECT_TRUE(CalendarDate::parse("2000-02-29").has_value());
    EXPECT_FALSE(CalendarDate::parse("1900-02-29").has_value());

    EXPECT_EQ(CalendarDate::daysInMonth(2024, 2), 29);
    EXPECT_EQ(CalendarDate::daysInMonth(2023, 2), 28);
    EXPECT_EQ(CalendarDate::daysInMonth(2023, 11), 30);
}

TEST(CalendarDateTest, Formatting) {
    CalendarDate date(2024, 3, 7);

    EXPECT_EQ(date.toString(), "2024-03-07");
    EXPECT_EQ(date.monthPrefix(), "2024-03");
}

TEST(CalendarDateTest, Constructor_InvalidDateThrows) {
    EXPECT_THROW(CalendarDate(2024, 2, 30), std::invalid_argument);
    EXPECT_THROW(CalendarDate(2024, 0, 1), std::invalid_argument);
}

TEST(CalendarDateTest, Ordering) {
    EXPECT_TRUE(CalendarDate(2024, 1, 31) < CalendarDate(2024, 2, 1));
    EXPECT_TRUE(CalendarDate(2023, 12, 31) < CalendarDate(2024, 1, 1));
    EXPECT_FALSE(CalendarDate(2024, 2, 1) < CalendarDate(2024, 2, 1));
    EXPECT_EQ(CalendarDate(2024, 2, 1), *CalendarDate::parse("2024-02-01"));
}
