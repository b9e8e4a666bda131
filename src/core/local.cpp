#include <tempus/core/leap_second.hpp>
#include <tempus/core/local.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cstdint>

namespace tempus {

namespace {

constexpr std::int64_t kSecondsPerHour = 3600;
constexpr std::int64_t kSecondsPerMinute = 60;
constexpr std::int64_t kLastSecondOfDay = kSecondsPerDay - 1;

struct DayTime {
    std::int64_t days = 0;
    Decimal seconds;
};

struct LocalView {
    Date date;
    TimeOfDay time;
};

/// Carry whole days out of `seconds` so that it lies in [0, 86400).
auto normalize(std::int64_t days, const Decimal& seconds) -> DayTime {
    const std::chrono::seconds whole{seconds.floor_div(1)};
    const auto carry = std::chrono::floor<std::chrono::days>(whole);
    return DayTime{
        .days = days + carry.count(),
        .seconds = seconds - Decimal{std::chrono::seconds{carry}.count()},
    };
}

/// Split seconds in [0, 86400) into hour, minute and fractional second.
auto split_time_of_day(const Decimal& seconds) -> TimeOfDay {
    const std::chrono::hh_mm_ss hms{std::chrono::seconds{seconds.floor_div(1)}};
    const std::int64_t hour = hms.hours().count();
    const std::int64_t minute = hms.minutes().count();
    return TimeOfDay{
        .hour = static_cast<std::uint8_t>(hour),
        .minute = static_cast<std::uint8_t>(minute),
        .second = seconds - Decimal{hour * kSecondsPerHour + minute * kSecondsPerMinute},
    };
}

auto view_at_offset(const Timestamp& ts, std::int32_t offset_minutes) -> LocalView {
    const Decimal& seconds = ts.utc_time_of_day_seconds();
    const std::int64_t offset_seconds = std::int64_t{offset_minutes} * kSecondsPerMinute;
    if (seconds >= Decimal{kSecondsPerDay}) {
        // The leap second repeats the final local minute as second 60.
        const DayTime shifted =
            normalize(ts.epoch_days(), Decimal{kLastSecondOfDay + offset_seconds});
        TimeOfDay time = split_time_of_day(shifted.seconds);
        time.second = Decimal{60} + (seconds - Decimal{kSecondsPerDay});
        return LocalView{.date = detail::days_to_civil(shifted.days), .time = time};
    }
    const DayTime shifted = normalize(ts.epoch_days(), seconds + Decimal{offset_seconds});
    return LocalView{
        .date = detail::days_to_civil(shifted.days),
        .time = split_time_of_day(shifted.seconds),
    };
}

auto offset_minutes_of(const Timestamp& ts) -> std::int32_t {
    return ts.local_offset_minutes().value_or(0);
}

auto check_epoch_days(std::int64_t days) -> Result<void> {
    if (days < kMinEpochDays || days > kMaxEpochDays) {
        return make_error(ErrorKind::OutOfRange,
                          fmt::format("UTC date falls outside years {}..{}", kMinYear, kMaxYear));
    }
    return {};
}

}  // namespace

auto from_local_date_time(const Date& date, const TimeOfDay& time,
                          const std::optional<ZoneOffset>& offset) -> Result<Timestamp> {
    // Local dates may spill one year past either end of the UTC range.
    if (date.year < kMinYear - 1 || date.year > kMaxYear + 1) {
        return make_error(ErrorKind::OutOfRange,
                          fmt::format("year {} is outside years {}..{}", date.year, kMinYear,
                                      kMaxYear));
    }
    if (date.day < 1 || date.day > days_in_month(date.year, date.month)) {
        return make_error(ErrorKind::InvalidDate,
                          fmt::format("no such date {:04}-{:02}-{:02}", date.year, date.month,
                                      date.day));
    }
    if (auto valid = validate_time_of_day(time); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    std::int64_t offset_seconds = 0;
    if (offset.has_value()) {
        if (auto valid = validate_zone_offset(*offset); !valid) {
            return std::unexpected(std::move(valid.error()));
        }
        offset_seconds = std::int64_t{offset->total_minutes()} * kSecondsPerMinute;
    }

    const std::int64_t local_days = detail::civil_to_days(date.year, date.month, date.day);
    const std::int64_t clock_seconds =
        std::int64_t{time.hour} * kSecondsPerHour + std::int64_t{time.minute} * kSecondsPerMinute;

    DayTime utc;
    if (time.second >= Decimal{60}) {
        // Locate the UTC second just before the leap second.
        const DayTime before =
            normalize(local_days, Decimal{clock_seconds + 59 - offset_seconds});
        if (before.seconds != Decimal{kLastSecondOfDay}) {
            return make_error(ErrorKind::InvalidTimeOfDay,
                              fmt::format("second {} is only valid at 23:59 UTC", time.second));
        }
        if (auto in_range = check_epoch_days(before.days); !in_range) {
            return std::unexpected(std::move(in_range.error()));
        }
        if (!is_leap_second_day(static_cast<std::int32_t>(before.days))) {
            const Date day = detail::days_to_civil(before.days);
            return make_error(ErrorKind::InvalidLeapSecond,
                              fmt::format("{:04}-{:02}-{:02} cannot end with a leap second",
                                          day.year, day.month, day.day));
        }
        utc = DayTime{
            .days = before.days,
            .seconds = Decimal{kSecondsPerDay} + (time.second - Decimal{60}),
        };
    } else {
        utc = normalize(local_days, Decimal{clock_seconds - offset_seconds} + time.second);
        if (auto in_range = check_epoch_days(utc.days); !in_range) {
            return std::unexpected(std::move(in_range.error()));
        }
    }

    std::optional<std::int16_t> offset_minutes;
    if (offset.has_value()) {
        offset_minutes = static_cast<std::int16_t>(offset->total_minutes());
    }
    return Timestamp::try_from_instant(Instant{
        .epoch_days = static_cast<std::int32_t>(utc.days),
        .utc_time_of_day_seconds = utc.seconds,
        .local_offset_minutes = offset_minutes,
    });
}

auto from_local_date_time_offset(const Date& date, const TimeOfDay& time,
                                 const ZoneOffset& offset) -> Result<Timestamp> {
    return from_local_date_time(date, time, offset);
}

auto utc_date(const Timestamp& ts) -> Date {
    return detail::days_to_civil(ts.epoch_days());
}

auto utc_time_of_day(const Timestamp& ts) -> TimeOfDay {
    return view_at_offset(ts, 0).time;
}

auto local_date(const Timestamp& ts) -> Date {
    return view_at_offset(ts, offset_minutes_of(ts)).date;
}

auto local_time_of_day(const Timestamp& ts) -> TimeOfDay {
    return view_at_offset(ts, offset_minutes_of(ts)).time;
}

auto local_offset(const Timestamp& ts) -> ZoneOffset {
    auto offset = ZoneOffset::from_minutes(offset_minutes_of(ts));
    if (!offset) {
        throw InvariantError(offset.error().kind, offset.error().message);
    }
    return *offset;
}

auto with_local_offset(const Timestamp& ts, const ZoneOffset& offset) -> Timestamp {
    if (auto valid = validate_zone_offset(offset); !valid) {
        throw InvariantError(valid.error().kind, valid.error().message);
    }
    Instant instant = ts.to_instant();
    instant.local_offset_minutes = static_cast<std::int16_t>(offset.total_minutes());
    return Timestamp::from_instant(instant);
}

auto without_local_offset(const Timestamp& ts) -> Timestamp {
    Instant instant = ts.to_instant();
    instant.local_offset_minutes.reset();
    return Timestamp::from_instant(instant);
}

}  // namespace tempus
