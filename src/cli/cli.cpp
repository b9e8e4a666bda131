#include <tempus/cli/cli.hpp>
#include <tempus/core/calendar.hpp>
#include <tempus/core/epoch_seconds.hpp>
#include <tempus/core/leap_second.hpp>
#include <tempus/core/local.hpp>
#include <tempus/core/timestamp.hpp>
#include <tempus/text/rfc3339.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <ostream>
#include <string>

namespace tempus::cli {

namespace {

auto read_timestamp(std::string_view text, const CliConfig& config) -> Result<Timestamp> {
    auto result = config.allow_leap_seconds ? text::from_string(text)
                                            : text::from_no_leap_seconds_string(text);
    if (result) {
        spdlog::debug("parsed '{}' as epoch day {}, {} s", text, result->epoch_days(),
                      result->utc_time_of_day_seconds().to_string());
    } else {
        spdlog::debug("rejected '{}': {}", text, result.error().format());
    }
    return result;
}

auto for_display(const Timestamp& ts, const CliConfig& config) -> Timestamp {
    if (config.display_offset.has_value()) {
        return with_local_offset(ts, *config.display_offset);
    }
    return ts;
}

void report(std::ostream& out, std::string_view text, const TimeError& error) {
    out << fmt::format("error: '{}': {}\n", text, error.format());
}

auto weekday_name(unsigned iso_weekday) -> std::string_view {
    constexpr std::string_view kNames[] = {"Monday", "Tuesday",  "Wednesday", "Thursday",
                                           "Friday", "Saturday", "Sunday"};
    return kNames[(iso_weekday - 1) % 7];
}

void print_timestamp(std::ostream& out, const Timestamp& ts) {
    const auto offset_minutes = ts.local_offset_minutes();
    out << fmt::format("timestamp:      {}\n", ts);
    out << fmt::format("utc:            {}T{}Z\n", utc_date(ts), utc_time_of_day(ts));
    out << fmt::format("local:          {} {}\n", local_date(ts), local_time_of_day(ts));
    out << fmt::format("offset:         {}\n",
                       offset_minutes ? fmt::format("{} ({} min)", local_offset(ts),
                                                    *offset_minutes)
                                      : std::string("unknown"));
    out << fmt::format("epoch days:     {} ({})\n", ts.epoch_days(),
                       weekday_name(day_of_week(ts.epoch_days())));
    out << fmt::format("utc seconds:    {}\n", ts.utc_time_of_day_seconds());
    out << fmt::format("epoch seconds:  {}\n", to_epoch_seconds(ts));
    out << fmt::format("leap second:    {}\n", in_leap_second(ts) ? "yes" : "no");
}

}  // namespace

void configure_logging(const CliConfig& config) {
    spdlog::set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::debug("verbose logging enabled, leap seconds {}",
                  config.allow_leap_seconds ? "allowed" : "rejected");
}

auto resolve_display_offset(std::string_view flag_value, const char* env_value)
    -> Result<std::optional<ZoneOffset>> {
    std::string_view source = flag_value;
    if (source.empty() && env_value != nullptr) {
        source = env_value;
    }
    if (source.empty()) {
        return std::optional<ZoneOffset>{};
    }
    auto offset = text::parse_zone_offset(source);
    if (!offset) {
        return offset;
    }
    if (!offset->has_value()) {
        return make_error(ErrorKind::InvalidTimeOfDay,
                          "display offset must be a known offset, not -00:00");
    }
    spdlog::debug("display offset {}", text::format_zone_offset(*offset));
    return offset;
}

auto inspect(std::string_view text, const CliConfig& config, std::ostream& out) -> bool {
    auto ts = read_timestamp(text, config);
    if (!ts) {
        report(out, text, ts.error());
        return false;
    }
    print_timestamp(out, for_display(*ts, config));
    return true;
}

auto from_seconds(std::string_view seconds, const CliConfig& config, std::ostream& out) -> bool {
    auto value = Decimal::parse(seconds);
    if (!value.has_value()) {
        report(out, seconds,
               TimeError{.kind = ErrorKind::MalformedTimestamp,
                         .message = "expected a decimal number of seconds"});
        return false;
    }
    const Decimal limit{(std::int64_t{kMaxEpochDays} + 1) * kSecondsPerDay};
    const Decimal floor{std::int64_t{kMinEpochDays} * kSecondsPerDay};
    if (*value < floor || *value >= limit) {
        report(out, seconds,
               TimeError{.kind = ErrorKind::OutOfRange,
                         .message = fmt::format("seconds must lie in [{}, {})", floor, limit)});
        return false;
    }
    print_timestamp(out, for_display(from_epoch_seconds(*value), config));
    return true;
}

auto difference(std::string_view lhs, std::string_view rhs, const CliConfig& config,
                std::ostream& out) -> bool {
    auto left = read_timestamp(lhs, config);
    if (!left) {
        report(out, lhs, left.error());
        return false;
    }
    auto right = read_timestamp(rhs, config);
    if (!right) {
        report(out, rhs, right.error());
        return false;
    }
    out << fmt::format("{}\n", subtract(*left, *right));
    return true;
}

}  // namespace tempus::cli
