#include <tempus/tempus.hpp>

#include <fmt/core.h>

auto main() -> int {
    // Parse the leap second that ended 2016
    auto leap = tempus::text::from_string("2016-12-31T23:59:60.25Z");
    if (!leap) {
        fmt::print("parse failed: {}\n", leap.error().format());
        return 1;
    }

    fmt::print("=== Leap second ===\n");
    fmt::print("timestamp: {}\n", *leap);
    fmt::print("epoch days: {}, utc seconds: {}\n", leap->epoch_days(),
               leap->utc_time_of_day_seconds());
    fmt::print("in leap second: {}\n", tempus::in_leap_second(*leap));
    fmt::print("clamped: {}\n", tempus::without_leap_seconds(*leap));

    // View the same instant from Tokyo
    fmt::print("\n=== Local offsets ===\n");
    auto tokyo = tempus::with_local_offset(*leap, tempus::ZoneOffset{.sign = 1, .hour = 9});
    fmt::print("tokyo: {}\n", tokyo);
    fmt::print("local date: {}, utc date: {}\n", tempus::local_date(tokyo),
               tempus::utc_date(tokyo));
    fmt::print("temporally equal: {}, fully equal: {}\n", tempus::temporally_equal(*leap, tokyo),
               tempus::fully_equal(*leap, tokyo));

    // Durations ignore the leap second
    fmt::print("\n=== Epoch seconds ===\n");
    auto new_year = tempus::text::from_string("2017-01-01T00:00:00Z");
    if (!new_year) {
        fmt::print("parse failed: {}\n", new_year.error().format());
        return 1;
    }
    fmt::print("seconds since epoch: {}\n", tempus::to_epoch_seconds(*leap));
    fmt::print("until new year: {}\n", tempus::subtract(*new_year, *leap));
    fmt::print("epoch: {}\n", tempus::kEpoch);

    return 0;
}
