#pragma once

#include <tempus/core/calendar.hpp>
#include <tempus/core/error.hpp>
#include <tempus/core/timestamp.hpp>
#include <tempus/core/zone_offset.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>

namespace tempus::text {

/// Parse `YYYY-MM-DDThh:mm:ss[.fraction](Z|+hh:mm|-hh:mm)`.
///
/// The year may have any number of digits and an optional sign. `-00:00`
/// marks an unknown local offset; `Z` and `+00:00` a zero offset. A seconds
/// field of 60 is accepted on the final UTC second of a leap-second day.
/// Syntax errors are MalformedTimestamp with the failing column; numeric
/// fields that parse but do not form a valid timestamp report
/// InvalidDate, InvalidTimeOfDay, InvalidLeapSecond or OutOfRange.
[[nodiscard]] auto from_string(std::string_view text) -> Result<Timestamp>;

/// As from_string, but any seconds field of 60 fails with InvalidLeapSecond.
[[nodiscard]] auto from_no_leap_seconds_string(std::string_view text) -> Result<Timestamp>;

/// Format the local date, time and offset of a timestamp; the inverse of
/// from_string.
[[nodiscard]] auto to_string(const Timestamp& ts) -> std::string;

/// Parse `Z`, `+hh:mm` or `-hh:mm`. An empty result means `-00:00`.
[[nodiscard]] auto parse_zone_offset(std::string_view text) -> Result<std::optional<ZoneOffset>>;

[[nodiscard]] auto format_zone_offset(const std::optional<ZoneOffset>& offset) -> std::string;
[[nodiscard]] auto format_date(const Date& date) -> std::string;
[[nodiscard]] auto format_time_of_day(const TimeOfDay& time) -> std::string;

}  // namespace tempus::text

template <>
struct fmt::formatter<tempus::Timestamp> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tempus::Timestamp& ts, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(tempus::text::to_string(ts), ctx);
    }
};

template <>
struct fmt::formatter<tempus::Date> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tempus::Date& date, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(tempus::text::format_date(date), ctx);
    }
};

template <>
struct fmt::formatter<tempus::TimeOfDay> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tempus::TimeOfDay& time, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(tempus::text::format_time_of_day(time),
                                                        ctx);
    }
};

template <>
struct fmt::formatter<tempus::ZoneOffset> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tempus::ZoneOffset& offset, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(tempus::text::format_zone_offset(offset),
                                                        ctx);
    }
};
