#include <tempus/core/calendar.hpp>
#include <tempus/core/epoch_seconds.hpp>
#include <tempus/core/leap_second.hpp>

#include <fmt/core.h>

#include <cstdint>

namespace tempus {

namespace {

// Bounds the value before the day count is taken in 64 bits.
constexpr std::int64_t kSecondsLimit = std::int64_t{kMaxEpochDays + 1} * kSecondsPerDay;

}  // namespace

auto to_epoch_seconds(const Timestamp& ts) -> Decimal {
    return Decimal{std::int64_t{ts.epoch_days()} * kSecondsPerDay} +
           clamp_utc_time_of_day_seconds(ts.utc_time_of_day_seconds());
}

auto from_epoch_seconds(const Decimal& seconds) -> Timestamp {
    if (seconds >= Decimal{kSecondsLimit} || seconds < Decimal{-kSecondsLimit}) {
        throw InvariantError(ErrorKind::OutOfRange,
                             fmt::format("{} epoch seconds is outside years {}..{}", seconds,
                                         kMinYear, kMaxYear));
    }
    const std::int64_t days = seconds.floor_div(kSecondsPerDay);
    if (days < kMinEpochDays || days > kMaxEpochDays) {
        throw InvariantError(ErrorKind::OutOfRange,
                             fmt::format("{} epoch seconds is outside years {}..{}", seconds,
                                         kMinYear, kMaxYear));
    }
    return Timestamp::from_instant(Instant{
        .epoch_days = static_cast<std::int32_t>(days),
        .utc_time_of_day_seconds = seconds - Decimal{days * kSecondsPerDay},
        .local_offset_minutes = std::int16_t{0},
    });
}

auto subtract(const Timestamp& lhs, const Timestamp& rhs) -> Decimal {
    return to_epoch_seconds(lhs) - to_epoch_seconds(rhs);
}

}  // namespace tempus
