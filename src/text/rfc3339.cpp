#include <tempus/core/local.hpp>
#include <tempus/text/rfc3339.hpp>

#include <fmt/core.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <utility>

namespace tempus::text {

namespace {

constexpr std::size_t kMaxYearDigits = 9;

auto is_digit(char ch) -> bool {
    return ch >= '0' && ch <= '9';
}

class TimestampParser {
   public:
    explicit TimestampParser(std::string_view text) : text_(text) {}

    auto parse_timestamp(bool allow_leap_seconds) -> Result<Timestamp> {
        auto year = parse_year();
        if (!year) {
            return std::unexpected(std::move(year.error()));
        }
        std::uint8_t month = 0;
        std::uint8_t day = 0;
        std::uint8_t hour = 0;
        std::uint8_t minute = 0;
        if (auto ok = expect('-', "'-' after year"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = parse_two_digits(month, "month"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = expect('-', "'-' after month"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = parse_two_digits(day, "day"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (at_end() || (peek() != 'T' && peek() != 't')) {
            return fail("expected 'T' between date and time");
        }
        pos_ += 1;
        if (auto ok = parse_two_digits(hour, "hour"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = expect(':', "':' after hour"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = parse_two_digits(minute, "minute"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = expect(':', "':' after minute"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        auto second = parse_seconds();
        if (!second) {
            return std::unexpected(std::move(second.error()));
        }
        auto offset = parse_offset();
        if (!offset) {
            return std::unexpected(std::move(offset.error()));
        }
        if (!at_end()) {
            return fail("unexpected characters after time zone offset");
        }

        if (!allow_leap_seconds && *second >= Decimal{60} && *second < Decimal{61}) {
            return make_error(ErrorKind::InvalidLeapSecond, "leap seconds are not permitted");
        }
        return from_local_date_time(Date{.year = *year, .month = month, .day = day},
                                    TimeOfDay{.hour = hour, .minute = minute, .second = *second},
                                    *offset);
    }

    auto parse_offset() -> Result<std::optional<ZoneOffset>> {
        if (at_end()) {
            return fail("expected time zone offset");
        }
        const char sign = peek();
        if (sign == 'Z' || sign == 'z') {
            pos_ += 1;
            return kZoneOffsetZero;
        }
        if (sign != '+' && sign != '-') {
            return fail("expected 'Z', '+' or '-' for time zone offset");
        }
        pos_ += 1;
        std::uint8_t hour = 0;
        std::uint8_t minute = 0;
        if (auto ok = parse_two_digits(hour, "offset hour"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = expect(':', "':' in time zone offset"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = parse_two_digits(minute, "offset minute"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (hour == 0 && minute == 0) {
            // RFC 3339 section 4.3: -00:00 means the local offset is unknown.
            return sign == '-' ? std::optional<ZoneOffset>{} : kZoneOffsetZero;
        }
        ZoneOffset offset{
            .sign = static_cast<std::int8_t>(sign == '-' ? -1 : 1),
            .hour = hour,
            .minute = minute,
        };
        if (auto valid = validate_zone_offset(offset); !valid) {
            return std::unexpected(std::move(valid.error()));
        }
        return offset;
    }

    [[nodiscard]] auto at_end() const -> bool { return pos_ >= text_.size(); }

    auto fail(std::string message) const -> std::unexpected<TimeError> {
        return make_error(ErrorKind::MalformedTimestamp, std::move(message), pos_ + 1);
    }

   private:
    [[nodiscard]] auto peek() const -> char { return text_[pos_]; }

    auto expect(char ch, std::string_view what) -> Result<void> {
        if (at_end() || peek() != ch) {
            return fail(fmt::format("expected {}", what));
        }
        pos_ += 1;
        return {};
    }

    auto parse_two_digits(std::uint8_t& out, std::string_view field) -> Result<void> {
        if (pos_ + 2 > text_.size()) {
            return fail(fmt::format("expected two-digit {}", field));
        }
        const char* first = text_.data() + pos_;
        unsigned value = 0;
        auto result = std::from_chars(first, first + 2, value);
        if (result.ec != std::errc() || result.ptr != first + 2) {
            return fail(fmt::format("expected two-digit {}", field));
        }
        out = static_cast<std::uint8_t>(value);
        pos_ += 2;
        return {};
    }

    auto parse_year() -> Result<std::int32_t> {
        bool negative = false;
        if (!at_end() && (peek() == '+' || peek() == '-')) {
            negative = peek() == '-';
            pos_ += 1;
        }
        if (at_end() || !is_digit(peek())) {
            return fail("expected year");
        }
        const std::size_t start = pos_;
        const char* first = text_.data() + pos_;
        std::int32_t value = 0;
        auto result = std::from_chars(first, text_.data() + text_.size(), value);
        const auto digits = static_cast<std::size_t>(result.ptr - first);
        if (result.ec == std::errc::result_out_of_range || digits > kMaxYearDigits) {
            return make_error(ErrorKind::OutOfRange, "year has too many digits", start + 1);
        }
        pos_ += digits;
        return negative ? -value : value;
    }

    auto parse_seconds() -> Result<Decimal> {
        const std::size_t start = pos_;
        std::uint8_t whole = 0;
        if (auto ok = parse_two_digits(whole, "second"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (!at_end() && peek() == '.') {
            pos_ += 1;
            const std::size_t fraction_start = pos_;
            while (!at_end() && is_digit(peek())) {
                pos_ += 1;
            }
            if (pos_ == fraction_start) {
                return fail("expected digits after '.'");
            }
            if (pos_ - fraction_start > Decimal::kMaxScale) {
                return make_error(ErrorKind::MalformedTimestamp,
                                  fmt::format("fraction exceeds {} digits", Decimal::kMaxScale),
                                  fraction_start + 1);
            }
        }
        auto seconds = Decimal::parse(text_.substr(start, pos_ - start));
        if (!seconds.has_value()) {
            return make_error(ErrorKind::MalformedTimestamp, "invalid seconds field", start + 1);
        }
        return *seconds;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

auto from_string(std::string_view text) -> Result<Timestamp> {
    return TimestampParser(text).parse_timestamp(true);
}

auto from_no_leap_seconds_string(std::string_view text) -> Result<Timestamp> {
    return TimestampParser(text).parse_timestamp(false);
}

auto parse_zone_offset(std::string_view text) -> Result<std::optional<ZoneOffset>> {
    TimestampParser parser(text);
    auto offset = parser.parse_offset();
    if (!offset) {
        return offset;
    }
    if (!parser.at_end()) {
        return parser.fail("unexpected characters after time zone offset");
    }
    return offset;
}

auto format_zone_offset(const std::optional<ZoneOffset>& offset) -> std::string {
    if (!offset.has_value()) {
        return "-00:00";
    }
    if (offset->total_minutes() == 0) {
        return "Z";
    }
    return fmt::format("{}{:02}:{:02}", offset->sign < 0 ? '-' : '+', offset->hour,
                       offset->minute);
}

auto format_date(const Date& date) -> std::string {
    if (date.year < 0) {
        return fmt::format("-{:04}-{:02}-{:02}", -date.year, date.month, date.day);
    }
    return fmt::format("{:04}-{:02}-{:02}", date.year, date.month, date.day);
}

auto format_time_of_day(const TimeOfDay& time) -> std::string {
    const char* pad = time.second < Decimal{10} ? "0" : "";
    return fmt::format("{:02}:{:02}:{}{}", time.hour, time.minute, pad, time.second);
}

auto to_string(const Timestamp& ts) -> std::string {
    std::optional<ZoneOffset> offset;
    if (ts.local_offset_minutes().has_value()) {
        offset = local_offset(ts);
    }
    return fmt::format("{}T{}{}", format_date(local_date(ts)),
                       format_time_of_day(local_time_of_day(ts)), format_zone_offset(offset));
}

}  // namespace tempus::text
