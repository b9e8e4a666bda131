#include <tempus/core/leap_second.hpp>
#include <tempus/core/local.hpp>
#include <tempus/text/rfc3339.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <optional>
#include <string_view>

using tempus::Date;
using tempus::ErrorKind;
using tempus::ZoneOffset;
using tempus::text::from_no_leap_seconds_string;
using tempus::text::from_string;

namespace {

auto parse_ok(std::string_view text) -> tempus::Timestamp {
    auto result = from_string(text);
    if (!result) {
        FAIL(result.error().format());
    }
    return *result;
}

auto error_of(std::string_view text) -> tempus::TimeError {
    auto result = from_string(text);
    REQUIRE_FALSE(result.has_value());
    return result.error();
}

}  // namespace

TEST_CASE("Parse basic RFC 3339 timestamps", "[text][rfc3339]") {
    SECTION("UTC designator") {
        auto ts = parse_ok("2000-01-01T00:00:00Z");
        REQUIRE(tempus::fully_equal(ts, tempus::kEpoch));
    }

    SECTION("lower-case separators") {
        auto ts = parse_ok("2000-01-01t00:00:00z");
        REQUIRE(tempus::fully_equal(ts, tempus::kEpoch));
    }

    SECTION("+00:00 is the same as Z") {
        auto ts = parse_ok("2000-01-01T00:00:00+00:00");
        REQUIRE(tempus::fully_equal(ts, tempus::kEpoch));
    }

    SECTION("-00:00 leaves the offset unknown") {
        auto ts = parse_ok("2000-01-01T00:00:00-00:00");
        REQUIRE(tempus::temporally_equal(ts, tempus::kEpoch));
        REQUIRE_FALSE(ts.local_offset_minutes().has_value());
    }

    SECTION("fraction and offset") {
        auto ts = parse_ok("2024-03-01T02:15:07.125+05:30");
        REQUIRE(ts.local_offset_minutes() == std::int16_t{330});
        REQUIRE(tempus::utc_date(ts) == Date{.year = 2024, .month = 2, .day = 29});
        REQUIRE(tempus::utc_time_of_day(ts).second.to_string() == "7.125");
    }
}

TEST_CASE("Parse years of any width", "[text][rfc3339]") {
    REQUIRE(tempus::utc_date(parse_ok("0-01-01T00:00:00Z")) == Date{.year = 0, .month = 1, .day = 1});
    REQUIRE(tempus::utc_date(parse_ok("800-06-15T12:00:00Z")).year == 800);
    REQUIRE(tempus::utc_date(parse_ok("+2024-06-15T12:00:00Z")).year == 2024);
    REQUIRE(tempus::utc_date(parse_ok("02024-06-15T12:00:00Z")).year == 2024);
    REQUIRE(tempus::local_date(parse_ok("10000-01-01T00:30:00+01:00")).year == 10000);
    REQUIRE(tempus::local_date(parse_ok("-0001-12-31T23:30:00-01:00")).year == -1);

    SECTION("years outside the range") {
        REQUIRE(error_of("10001-01-01T00:00:00Z").kind == ErrorKind::OutOfRange);
        REQUIRE(error_of("10000-01-01T00:00:00Z").kind == ErrorKind::OutOfRange);
        REQUIRE(error_of("-0002-01-01T00:00:00Z").kind == ErrorKind::OutOfRange);
        REQUIRE(error_of("1234567890-01-01T00:00:00Z").kind == ErrorKind::OutOfRange);
    }

    SECTION("years too large for any integer") {
        auto error = error_of("+99999999999999999999-01-01T00:00:00Z");
        REQUIRE(error.kind == ErrorKind::OutOfRange);
        REQUIRE(error.column == 2);
    }
}

TEST_CASE("Leap seconds in text", "[text][rfc3339]") {
    SECTION("accepted on an eligible day") {
        auto ts = parse_ok("2016-12-31T23:59:60.5Z");
        REQUIRE(tempus::in_leap_second(ts));
        REQUIRE(ts.utc_time_of_day_seconds().to_string() == "86400.5");
    }

    SECTION("accepted at the matching local time") {
        auto ts = parse_ok("2016-12-31T15:59:60-08:00");
        REQUIRE(tempus::in_leap_second(ts));
        REQUIRE(tempus::utc_date(ts) == Date{.year = 2016, .month = 12, .day = 31});
    }

    SECTION("rejected on other days") {
        REQUIRE(error_of("2023-06-29T23:59:60Z").kind == ErrorKind::InvalidLeapSecond);
        REQUIRE(error_of("1969-12-31T23:59:60Z").kind == ErrorKind::InvalidLeapSecond);
    }

    SECTION("rejected away from 23:59 UTC") {
        REQUIRE(error_of("2016-12-31T23:59:60+01:00").kind == ErrorKind::InvalidTimeOfDay);
    }

    SECTION("the no-leap-seconds variant rejects them everywhere") {
        auto result = from_no_leap_seconds_string("2016-12-31T23:59:60.5Z");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::InvalidLeapSecond);

        auto ordinary = from_no_leap_seconds_string("2016-12-31T23:59:59.5Z");
        REQUIRE(ordinary.has_value());
        REQUIRE(tempus::fully_equal(*ordinary, parse_ok("2016-12-31T23:59:59.5Z")));
    }
}

TEST_CASE("Calendar and clock errors", "[text][rfc3339]") {
    REQUIRE(error_of("1900-02-29T00:00:00Z").kind == ErrorKind::InvalidDate);
    REQUIRE(error_of("2023-04-31T00:00:00Z").kind == ErrorKind::InvalidDate);
    REQUIRE(error_of("2023-00-10T00:00:00Z").kind == ErrorKind::InvalidDate);
    REQUIRE(error_of("2023-01-10T24:00:00Z").kind == ErrorKind::InvalidTimeOfDay);
    REQUIRE(error_of("2023-01-10T12:60:00Z").kind == ErrorKind::InvalidTimeOfDay);
    REQUIRE(error_of("2023-01-10T12:00:61Z").kind == ErrorKind::InvalidTimeOfDay);
    REQUIRE(error_of("2023-01-10T12:00:00+24:00").kind == ErrorKind::InvalidTimeOfDay);
    REQUIRE(error_of("2023-01-10T12:00:00+05:60").kind == ErrorKind::InvalidTimeOfDay);
}

TEST_CASE("Malformed timestamps", "[text][rfc3339]") {
    struct Case {
        std::string_view text;
        std::size_t column;
    };
    const Case cases[] = {
        {"", 1},
        {"T00:00:00Z", 1},
        {"2023/01/10T00:00:00Z", 5},
        {"2023-1-10T00:00:00Z", 6},
        {"-", 2},
        {"+-2023-01-10T00:00:00Z", 2},
        {"2023-+1-10T00:00:00Z", 6},
        {"2023-01--1T00:00:00Z", 9},
        {"2023-01-10T00:00:00+-1:00", 21},
        {"2023-01-10 00:00:00Z", 11},
        {"2023-01-10T00:00Z", 17},
        {"2023-01-10T00:00:00", 20},
        {"2023-01-10T00:00:00.Z", 21},
        {"2023-01-10T00:00:00+0500", 23},
        {"2023-01-10T00:00:00Zjunk", 21},
        {"2023-01-10T00:00:00.123456789012345678901234567Z", 21},
    };
    for (const auto& c : cases) {
        INFO("input: " << c.text);
        auto error = error_of(c.text);
        REQUIRE(error.kind == ErrorKind::MalformedTimestamp);
        REQUIRE(error.column == c.column);
    }
}

TEST_CASE("Formatting reproduces the local fields", "[text][rfc3339]") {
    const std::string_view inputs[] = {
        "2000-01-01T00:00:00Z",
        "2024-03-01T02:15:07.125+05:30",
        "1999-12-31T20:00:00.000-08:00",
        "2016-12-31T23:59:60.5Z",
        "2017-01-01T05:29:60.250+05:30",
        "2010-07-04T00:05:09.000100-00:00",
        "0800-06-15T12:00:00Z",
        "10000-01-01T00:30:00+01:00",
        "-0001-12-31T23:30:00-01:00",
    };
    for (auto input : inputs) {
        INFO("input: " << input);
        auto ts = parse_ok(input);
        REQUIRE(tempus::text::to_string(ts) == input);

        auto reparsed = parse_ok(tempus::text::to_string(ts));
        REQUIRE(tempus::fully_equal(reparsed, ts));
        REQUIRE(tempus::local_date(reparsed) == tempus::local_date(ts));
        REQUIRE(tempus::local_time_of_day(reparsed) == tempus::local_time_of_day(ts));
    }

    SECTION("+00:00 is written as Z") {
        REQUIRE(tempus::text::to_string(parse_ok("2023-05-05T05:05:05+00:00")) ==
                "2023-05-05T05:05:05Z");
    }

    SECTION("formatting after changing the offset") {
        auto ts = tempus::with_local_offset(parse_ok("2016-12-31T23:59:60.5Z"),
                                            ZoneOffset{.sign = -1, .hour = 3, .minute = 30});
        REQUIRE(tempus::text::to_string(ts) == "2016-12-31T20:29:60.5-03:30");
    }

    SECTION("fmt formatters") {
        auto ts = parse_ok("2024-03-01T02:15:07.125+05:30");
        REQUIRE(fmt::format("{}", ts) == "2024-03-01T02:15:07.125+05:30");
        REQUIRE(fmt::format("{}", tempus::utc_date(ts)) == "2024-02-29");
        REQUIRE(fmt::format("{}", tempus::utc_time_of_day(ts)) == "20:45:07.125");
        REQUIRE(fmt::format("{}", tempus::local_offset(ts)) == "+05:30");
    }
}

TEST_CASE("Zone offset text", "[text][rfc3339]") {
    auto offset_of = [](std::string_view text) {
        auto result = tempus::text::parse_zone_offset(text);
        REQUIRE(result.has_value());
        return *result;
    };
    REQUIRE(offset_of("Z") == std::optional<ZoneOffset>{tempus::kZoneOffsetZero});
    REQUIRE(offset_of("-07:15") ==
            std::optional<ZoneOffset>{ZoneOffset{.sign = -1, .hour = 7, .minute = 15}});
    REQUIRE_FALSE(offset_of("-00:00").has_value());
    REQUIRE_FALSE(tempus::text::parse_zone_offset("+7:15").has_value());
    REQUIRE_FALSE(tempus::text::parse_zone_offset("+07:15x").has_value());

    REQUIRE(tempus::text::format_zone_offset(std::nullopt) == "-00:00");
    REQUIRE(tempus::text::format_zone_offset(tempus::kZoneOffsetZero) == "Z");
    REQUIRE(tempus::text::format_zone_offset(ZoneOffset{.sign = -1, .hour = 12}) == "-12:00");
}
