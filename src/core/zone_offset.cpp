#include <tempus/core/zone_offset.hpp>

#include <fmt/core.h>

#include <cstdlib>

namespace tempus {

auto ZoneOffset::from_minutes(std::int32_t minutes) -> Result<ZoneOffset> {
    if (minutes < -kMaxOffsetMinutes || minutes > kMaxOffsetMinutes) {
        return make_error(ErrorKind::InvalidTimeOfDay,
                          fmt::format("zone offset of {} minutes exceeds 23:59", minutes));
    }
    const std::int32_t magnitude = std::abs(minutes);
    return ZoneOffset{
        .sign = static_cast<std::int8_t>(minutes < 0 ? -1 : 1),
        .hour = static_cast<std::uint8_t>(magnitude / 60),
        .minute = static_cast<std::uint8_t>(magnitude % 60),
    };
}

auto validate_zone_offset(const ZoneOffset& offset) -> Result<void> {
    if (offset.sign != 1 && offset.sign != -1) {
        return make_error(ErrorKind::InvalidTimeOfDay,
                          fmt::format("zone offset sign must be +1 or -1, got {}", offset.sign));
    }
    if (offset.hour > 23 || offset.minute > 59) {
        return make_error(ErrorKind::InvalidTimeOfDay,
                          fmt::format("zone offset {:02}:{:02} out of range", offset.hour,
                                      offset.minute));
    }
    if (offset.sign == -1 && offset.hour == 0 && offset.minute == 0) {
        return make_error(ErrorKind::InvalidTimeOfDay, "zero zone offset must not be negative");
    }
    return {};
}

auto validate_time_of_day(const TimeOfDay& time) -> Result<void> {
    if (time.hour > 23) {
        return make_error(ErrorKind::InvalidTimeOfDay,
                          fmt::format("hour {} out of range", time.hour));
    }
    if (time.minute > 59) {
        return make_error(ErrorKind::InvalidTimeOfDay,
                          fmt::format("minute {} out of range", time.minute));
    }
    if (time.second.is_negative() || time.second >= Decimal{61}) {
        return make_error(ErrorKind::InvalidTimeOfDay,
                          fmt::format("second {} out of range", time.second));
    }
    return {};
}

}  // namespace tempus
