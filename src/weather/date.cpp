/*
 * date.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Calendar date helpers

**************************************************/

#include "date.hpp"

#include <algorithm>
#include <charconv>
#include <format>

#include "exception/exception.hpp"

namespace frostguard::weather {

namespace {
constexpr size_t DATE_TEXT_LENGTH = 10;

auto parseField(std::string_view text, size_t offset, size_t length) -> int {
    int value = 0;
    const char* begin = text.data() + offset;
    const char* end = begin + length;
    // from_chars takes a sign; every field must be plain digits
    if (!std::all_of(begin, end, [](char c) { return c >= '0' && c <= '9'; })) {
        THROW_INVALID_DATE("Malformed date: " + std::string(text));
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        THROW_INVALID_DATE("Malformed date: " + std::string(text));
    }
    return value;
}
}  // namespace

auto parseDate(std::string_view text) -> Date {
    if (text.size() != DATE_TEXT_LENGTH || text[4] != '-' || text[7] != '-') {
        THROW_INVALID_DATE("Expected YYYY-MM-DD, got: " + std::string(text));
    }

    int year = parseField(text, 0, 4);
    int month = parseField(text, 5, 2);
    int day = parseField(text, 8, 2);

    Date date{std::chrono::year{year},
              std::chrono::month{static_cast<unsigned>(month)},
              std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        THROW_INVALID_DATE("Not a calendar date: " + std::string(text));
    }
    return date;
}

auto formatDate(const Date& date) -> std::string {
    return std::format("{:04d}-{:02d}-{:02d}", static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

auto addDays(const Date& date, int days) -> Date {
    return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

auto systemToday() -> Date {
    return Date{
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

}  // namespace frostguard::weather
