#pragma once

#include <tempus/core/error.hpp>

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace tempus {

/// Supported span of UTC years.
inline constexpr std::int32_t kMinYear = 0;
inline constexpr std::int32_t kMaxYear = 9999;

/// Day 0 is 2000-01-01.
inline constexpr std::int32_t kEpochYear = 2000;

/// Epoch day of 0000-01-01.
inline constexpr std::int32_t kMinEpochDays = -730'485;
/// Epoch day of 9999-12-31.
inline constexpr std::int32_t kMaxEpochDays = 2'921'939;

inline constexpr std::int64_t kSecondsPerDay = 86'400;

/// Proleptic Gregorian calendar date. Year 0 is 1 BC.
struct Date {
    std::int32_t year = kEpochYear;
    std::uint8_t month = 1;
    std::uint8_t day = 1;

    auto operator<=>(const Date&) const = default;
};

[[nodiscard]] constexpr auto is_leap_year(std::int32_t year) noexcept -> bool {
    return std::chrono::year{year}.is_leap();
}

/// Number of days in `month` of `year`, or 0 if month is not in 1..12.
[[nodiscard]] auto days_in_month(std::int32_t year, unsigned month) noexcept -> unsigned;

/// True if the month and day exist in the date's year and the year is
/// within kMinYear..kMaxYear.
[[nodiscard]] auto is_valid_date(const Date& date) noexcept -> bool;

/// Epoch day of a date. Fails with InvalidDate for nonexistent dates or
/// years outside 0..9999.
[[nodiscard]] auto days_from_date(const Date& date) -> Result<std::int32_t>;

/// Date of an epoch day. Fails with OutOfRange outside
/// kMinEpochDays..kMaxEpochDays.
[[nodiscard]] auto date_from_days(std::int32_t days) -> Result<Date>;

/// ISO weekday, Monday = 1 through Sunday = 7.
[[nodiscard]] auto day_of_week(std::int32_t days) noexcept -> unsigned;

namespace detail {

// Conversions without range checks. Callers dealing with local dates one
// day past either end of the range rely on these.
[[nodiscard]] auto civil_to_days(std::int32_t year, unsigned month, unsigned day) noexcept
    -> std::int64_t;
[[nodiscard]] auto days_to_civil(std::int64_t days) noexcept -> Date;

}  // namespace detail

}  // namespace tempus

namespace std {

template <>
struct hash<tempus::Date> {
    auto operator()(const tempus::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(tempus::detail::civil_to_days(d.year, d.month, d.day));
    }
};

}  // namespace std
