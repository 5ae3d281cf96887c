/*
 * date.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Calendar date helpers

**************************************************/

#ifndef FROSTGUARD_WEATHER_DATE_HPP
#define FROSTGUARD_WEATHER_DATE_HPP

#include <functional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace frostguard::weather {

/**
 * @brief Parses a strict `YYYY-MM-DD` date.
 * @throws InvalidDate if the text is malformed or not a calendar date.
 */
auto parseDate(std::string_view text) -> Date;

/**
 * @brief Formats a date as `YYYY-MM-DD`.
 */
auto formatDate(const Date& date) -> std::string;

/**
 * @brief Shifts a date by a whole number of days.
 */
auto addDays(const Date& date, int days) -> Date;

/**
 * @brief Supplies the processing date. Swappable for tests.
 */
using DateProvider = std::function<Date()>;

/**
 * @brief Today's date in UTC from the system clock.
 */
auto systemToday() -> Date;

}  // namespace frostguard::weather

#endif  // FROSTGUARD_WEATHER_DATE_HPP
