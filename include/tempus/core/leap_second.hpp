#pragma once

#include <tempus/core/decimal.hpp>
#include <tempus/core/timestamp.hpp>

#include <cstdint>

namespace tempus {

/// Leap seconds were introduced with UTC in its current form in 1972.
inline constexpr std::int32_t kFirstLeapSecondYear = 1972;

/// True if the UTC day may end with a positive leap second: the last day of
/// a month in 1972 or later.
[[nodiscard]] auto is_leap_second_day(std::int32_t epoch_days) noexcept -> bool;

/// Largest value below 86400 at the precision of `seconds` if `seconds`
/// reaches into a leap second (86400.25 -> 86399.99); otherwise `seconds`.
[[nodiscard]] auto clamp_utc_time_of_day_seconds(const Decimal& seconds) -> Decimal;

[[nodiscard]] auto in_leap_second(const Timestamp& ts) -> bool;

/// Clamp away a partial leap second, keeping the local offset.
[[nodiscard]] auto without_leap_seconds(const Timestamp& ts) -> Timestamp;

}  // namespace tempus
