#pragma once

#include <tempus/core/calendar.hpp>
#include <tempus/core/error.hpp>
#include <tempus/core/timestamp.hpp>
#include <tempus/core/zone_offset.hpp>

#include <optional>

namespace tempus {

/// Build a timestamp from a wall-clock date and time observed at `offset`
/// ahead of UTC. The offset is attached to the result.
///
/// A second of 60 is accepted only when, after removing the offset, it
/// falls on the final second of an eligible UTC day (see
/// is_leap_second_day); 23:59:60+01:00 is therefore never valid, while
/// 00:59:60+01:00 may be.
[[nodiscard]] auto from_local_date_time_offset(const Date& date, const TimeOfDay& time,
                                               const ZoneOffset& offset) -> Result<Timestamp>;

/// As from_local_date_time_offset; an empty offset reads the fields as UTC
/// and leaves the local offset unknown.
[[nodiscard]] auto from_local_date_time(const Date& date, const TimeOfDay& time,
                                        const std::optional<ZoneOffset>& offset)
    -> Result<Timestamp>;

[[nodiscard]] auto utc_date(const Timestamp& ts) -> Date;
[[nodiscard]] auto utc_time_of_day(const Timestamp& ts) -> TimeOfDay;

/// Date at the attached offset. At the ends of the supported range this may
/// be in year -1 or 10000.
[[nodiscard]] auto local_date(const Timestamp& ts) -> Date;
[[nodiscard]] auto local_time_of_day(const Timestamp& ts) -> TimeOfDay;

/// Attached offset; kZoneOffsetZero when the offset is unknown.
[[nodiscard]] auto local_offset(const Timestamp& ts) -> ZoneOffset;

/// Same instant with another offset attached. Throws InvariantError for an
/// offset that fails validate_zone_offset.
[[nodiscard]] auto with_local_offset(const Timestamp& ts, const ZoneOffset& offset) -> Timestamp;

/// Same instant with the local offset marked unknown.
[[nodiscard]] auto without_local_offset(const Timestamp& ts) -> Timestamp;

}  // namespace tempus
