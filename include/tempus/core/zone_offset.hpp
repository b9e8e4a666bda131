#pragma once

#include <tempus/core/decimal.hpp>
#include <tempus/core/error.hpp>

#include <cstdint>

namespace tempus {

inline constexpr std::int32_t kMinutesPerDay = 24 * 60;

/// Largest magnitude of a zone offset, 23:59.
inline constexpr std::int32_t kMaxOffsetMinutes = kMinutesPerDay - 1;

/// Signed displacement of local time ahead of UTC.
///
/// A zero offset always carries sign +1; there is no "-00:00" ZoneOffset.
/// The unknown-offset state is expressed by a timestamp without an offset,
/// not by a ZoneOffset value.
struct ZoneOffset {
    std::int8_t sign = 1;
    std::uint8_t hour = 0;
    std::uint8_t minute = 0;

    [[nodiscard]] constexpr auto total_minutes() const noexcept -> std::int32_t {
        return sign * (static_cast<std::int32_t>(hour) * 60 + minute);
    }

    /// Decompose signed minutes into sign/hour/minute.
    [[nodiscard]] static auto from_minutes(std::int32_t minutes) -> Result<ZoneOffset>;

    bool operator==(const ZoneOffset&) const = default;
};

inline constexpr ZoneOffset kZoneOffsetZero{};

/// Checks sign, field ranges and the no-negative-zero rule.
[[nodiscard]] auto validate_zone_offset(const ZoneOffset& offset) -> Result<void>;

/// Wall-clock time of day. `second` lies in [60, 61) only during a
/// positive leap second.
struct TimeOfDay {
    std::uint8_t hour = 0;
    std::uint8_t minute = 0;
    Decimal second;

    bool operator==(const TimeOfDay&) const = default;
};

/// Checks hour < 24, minute < 60 and 0 <= second < 61. Whether a second
/// of 60 is legal depends on the day and is decided by the caller.
[[nodiscard]] auto validate_time_of_day(const TimeOfDay& time) -> Result<void>;

}  // namespace tempus
