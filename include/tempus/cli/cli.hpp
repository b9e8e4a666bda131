#pragma once

#include <tempus/core/error.hpp>
#include <tempus/core/zone_offset.hpp>

#include <iosfwd>
#include <optional>
#include <string_view>

namespace tempus::cli {

/// Configuration for a tempus command.
struct CliConfig {
    /// Log at debug level instead of info.
    bool verbose = false;
    /// When false, textual input is read with from_no_leap_seconds_string.
    bool allow_leap_seconds = true;
    /// Re-attach this offset to every result before printing it. Taken from
    /// --display-offset, falling back to TEMPUS_DISPLAY_OFFSET.
    std::optional<ZoneOffset> display_offset;
};

/// Apply the logging settings of `config` to the default spdlog logger.
void configure_logging(const CliConfig& config);

/// Resolve the display offset: a non-empty flag value wins over the
/// environment value; both absent yields no display offset.
[[nodiscard]] auto resolve_display_offset(std::string_view flag_value, const char* env_value)
    -> Result<std::optional<ZoneOffset>>;

/// Print every representation of a textual timestamp.
/// Returns false (after printing the error) if the input is rejected.
[[nodiscard]] auto inspect(std::string_view text, const CliConfig& config, std::ostream& out)
    -> bool;

/// Print the timestamp for a count of seconds since 2000-01-01T00:00:00Z.
[[nodiscard]] auto from_seconds(std::string_view seconds, const CliConfig& config,
                                std::ostream& out) -> bool;

/// Print the seconds elapsed from `rhs` to `lhs`, leap seconds ignored.
[[nodiscard]] auto difference(std::string_view lhs, std::string_view rhs, const CliConfig& config,
                              std::ostream& out) -> bool;

}  // namespace tempus::cli
