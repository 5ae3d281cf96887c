/*
 * test_date.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 *
 * Tests for calendar date parsing and formatting
 */

#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "weather/date.hpp"

using namespace frostguard;
using namespace frostguard::weather;
using namespace std::chrono;

TEST(DateTest, ParsesIsoDate) {
    auto date = parseDate("2025-02-18");
    EXPECT_EQ(date.year(), year{2025});
    EXPECT_EQ(date.month(), February);
    EXPECT_EQ(date.day(), day{18});
}

TEST(DateTest, FormatsWithPadding) {
    Date date{year{2025}, month{3}, day{7}};
    EXPECT_EQ(formatDate(date), "2025-03-07");
}

TEST(DateTest, FormatParseRoundTrip) {
    EXPECT_EQ(formatDate(parseDate("2024-02-29")), "2024-02-29");
}

TEST(DateTest, RejectsMalformedText) {
    EXPECT_THROW(parseDate(""), InvalidDate);
    EXPECT_THROW(parseDate("2025-2-18"), InvalidDate);
    EXPECT_THROW(parseDate("2025/02/18"), InvalidDate);
    EXPECT_THROW(parseDate("2025-02-1x"), InvalidDate);
    EXPECT_THROW(parseDate("20250218"), InvalidDate);
    EXPECT_THROW(parseDate("-123-01-01"), InvalidDate);
    EXPECT_THROW(parseDate("2025--1-01"), InvalidDate);
    EXPECT_THROW(parseDate("2025-02-+1"), InvalidDate);
}

TEST(DateTest, RejectsImpossibleCalendarDates) {
    EXPECT_THROW(parseDate("2025-02-29"), InvalidDate);
    EXPECT_THROW(parseDate("2025-13-01"), InvalidDate);
    EXPECT_THROW(parseDate("2025-04-31"), InvalidDate);
}

TEST(DateTest, InvalidDateReportsItsKind) {
    try {
        parseDate("yesterday");
        FAIL() << "Expected InvalidDate";
    } catch (const FrostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidDate);
        EXPECT_EQ(errorKindStatus(e.kind()), 400);
    }
}

TEST(DateTest, AddDaysCrossesMonthAndYear) {
    EXPECT_EQ(formatDate(addDays(parseDate("2025-02-28"), 1)), "2025-03-01");
    EXPECT_EQ(formatDate(addDays(parseDate("2025-01-01"), -1)), "2024-12-31");
}

TEST(DateTest, SystemTodayIsValid) { EXPECT_TRUE(systemToday().ok()); }
