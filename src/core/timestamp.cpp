#include <tempus/core/leap_second.hpp>
#include <tempus/core/timestamp.hpp>
#include <tempus/core/zone_offset.hpp>

#include <fmt/core.h>

namespace tempus {

auto validate_instant(const Instant& instant) -> Result<void> {
    if (instant.epoch_days < kMinEpochDays || instant.epoch_days > kMaxEpochDays) {
        return make_error(ErrorKind::OutOfRange,
                          fmt::format("epoch day {} is outside years {}..{}", instant.epoch_days,
                                      kMinYear, kMaxYear));
    }
    const Decimal& seconds = instant.utc_time_of_day_seconds;
    if (seconds.is_negative() || seconds >= Decimal{kSecondsPerDay + 1}) {
        return make_error(ErrorKind::InvalidInstant,
                          fmt::format("UTC time of day {} is outside [0, 86401)", seconds));
    }
    if (seconds >= Decimal{kSecondsPerDay} && !is_leap_second_day(instant.epoch_days)) {
        return make_error(ErrorKind::InvalidLeapSecond,
                          fmt::format("epoch day {} cannot end with a leap second",
                                      instant.epoch_days));
    }
    if (instant.local_offset_minutes.has_value() &&
        (*instant.local_offset_minutes < -kMaxOffsetMinutes ||
         *instant.local_offset_minutes > kMaxOffsetMinutes)) {
        return make_error(ErrorKind::InvalidInstant,
                          fmt::format("local offset of {} minutes exceeds 23:59",
                                      *instant.local_offset_minutes));
    }
    return {};
}

auto Timestamp::from_instant(const Instant& instant) -> Timestamp {
    auto valid = validate_instant(instant);
    if (!valid) {
        throw InvariantError(valid.error().kind, valid.error().message);
    }
    return Timestamp{instant};
}

auto Timestamp::try_from_instant(const Instant& instant) -> Result<Timestamp> {
    auto valid = validate_instant(instant);
    if (!valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return Timestamp{instant};
}

auto temporally_equal(const Timestamp& lhs, const Timestamp& rhs) noexcept -> bool {
    return lhs.epoch_days() == rhs.epoch_days() &&
           lhs.utc_time_of_day_seconds() == rhs.utc_time_of_day_seconds();
}

auto fully_equal(const Timestamp& lhs, const Timestamp& rhs) noexcept -> bool {
    return temporally_equal(lhs, rhs) && lhs.local_offset_minutes() == rhs.local_offset_minutes();
}

auto temporal_compare(const Timestamp& lhs, const Timestamp& rhs) noexcept
    -> std::strong_ordering {
    if (auto cmp = lhs.epoch_days() <=> rhs.epoch_days(); cmp != 0) {
        return cmp;
    }
    return lhs.utc_time_of_day_seconds() <=> rhs.utc_time_of_day_seconds();
}

}  // namespace tempus
