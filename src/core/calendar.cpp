#include <tempus/core/calendar.hpp>

#include <fmt/core.h>

#include <chrono>

namespace tempus {

namespace {

// sys_days counts from 1970-01-01; epoch days count from 2000-01-01.
constexpr std::chrono::sys_days kEpochDay =
    std::chrono::sys_days{std::chrono::year{kEpochYear} / std::chrono::January / 1};

constexpr auto civil_to_days_impl(std::int32_t y, unsigned m, unsigned d) noexcept
    -> std::int64_t {
    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{m}, day{d}};
    return (sys_days{ymd} - kEpochDay).count();
}

constexpr auto days_to_civil_impl(std::int64_t days_since_epoch) noexcept -> Date {
    using namespace std::chrono;
    const year_month_day ymd{kEpochDay + days(days_since_epoch)};
    return Date{
        .year = static_cast<int>(ymd.year()),
        .month = static_cast<std::uint8_t>(static_cast<unsigned>(ymd.month())),
        .day = static_cast<std::uint8_t>(static_cast<unsigned>(ymd.day())),
    };
}

static_assert(kEpochDay.time_since_epoch().count() == 10'957);
static_assert(civil_to_days_impl(2000, 1, 1) == 0);
static_assert(civil_to_days_impl(1970, 1, 1) == -10'957);
static_assert(civil_to_days_impl(kMinYear, 1, 1) == kMinEpochDays);
static_assert(civil_to_days_impl(kMaxYear, 12, 31) == kMaxEpochDays);
static_assert(days_to_civil_impl(kMinEpochDays) == Date{.year = 0, .month = 1, .day = 1});
static_assert(days_to_civil_impl(kMaxEpochDays) == Date{.year = 9999, .month = 12, .day = 31});
static_assert(days_to_civil_impl(59) == Date{.year = 2000, .month = 2, .day = 29});

}  // namespace

namespace detail {

auto civil_to_days(std::int32_t year, unsigned month, unsigned day) noexcept -> std::int64_t {
    return civil_to_days_impl(year, month, day);
}

auto days_to_civil(std::int64_t days) noexcept -> Date {
    return days_to_civil_impl(days);
}

}  // namespace detail

auto days_in_month(std::int32_t y, unsigned m) noexcept -> unsigned {
    using namespace std::chrono;
    const month mon{m};
    if (!mon.ok()) {
        return 0;
    }
    return static_cast<unsigned>(year_month_day_last{year{y}, month_day_last{mon}}.day());
}

auto is_valid_date(const Date& date) noexcept -> bool {
    if (date.year < kMinYear || date.year > kMaxYear) {
        return false;
    }
    using namespace std::chrono;
    const year_month_day ymd{year{date.year}, month{date.month}, day{date.day}};
    return ymd.ok();
}

auto days_from_date(const Date& date) -> Result<std::int32_t> {
    if (!is_valid_date(date)) {
        return make_error(ErrorKind::InvalidDate,
                          fmt::format("no such date {:04}-{:02}-{:02}", date.year, date.month,
                                      date.day));
    }
    return static_cast<std::int32_t>(detail::civil_to_days(date.year, date.month, date.day));
}

auto date_from_days(std::int32_t days) -> Result<Date> {
    if (days < kMinEpochDays || days > kMaxEpochDays) {
        return make_error(ErrorKind::OutOfRange,
                          fmt::format("epoch day {} is outside years {}..{}", days, kMinYear,
                                      kMaxYear));
    }
    return detail::days_to_civil(days);
}

auto day_of_week(std::int32_t epoch_days) noexcept -> unsigned {
    using namespace std::chrono;
    return weekday{kEpochDay + days(epoch_days)}.iso_encoding();
}

}  // namespace tempus
