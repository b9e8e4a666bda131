#include <tempus/core/calendar.hpp>
#include <tempus/core/leap_second.hpp>

namespace tempus {

auto is_leap_second_day(std::int32_t epoch_days) noexcept -> bool {
    if (epoch_days < kMinEpochDays || epoch_days > kMaxEpochDays) {
        return false;
    }
    const Date date = detail::days_to_civil(epoch_days);
    return date.year >= kFirstLeapSecondYear && date.day == days_in_month(date.year, date.month);
}

auto clamp_utc_time_of_day_seconds(const Decimal& seconds) -> Decimal {
    const Decimal day_end = Decimal{kSecondsPerDay}.with_scale(seconds.scale());
    if (seconds < day_end) {
        return seconds;
    }
    return Decimal::from_parts(day_end.coefficient() - 1, seconds.scale());
}

auto in_leap_second(const Timestamp& ts) -> bool {
    return ts.utc_time_of_day_seconds() >= Decimal{kSecondsPerDay};
}

auto without_leap_seconds(const Timestamp& ts) -> Timestamp {
    Instant instant = ts.to_instant();
    instant.utc_time_of_day_seconds = clamp_utc_time_of_day_seconds(instant.utc_time_of_day_seconds);
    return Timestamp::from_instant(instant);
}

}  // namespace tempus
