#include <tempus/core/error.hpp>

#include <fmt/core.h>

namespace tempus {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::InvalidDate:
            return "InvalidDate";
        case ErrorKind::InvalidTimeOfDay:
            return "InvalidTimeOfDay";
        case ErrorKind::InvalidLeapSecond:
            return "InvalidLeapSecond";
        case ErrorKind::InvalidInstant:
            return "InvalidInstant";
        case ErrorKind::OutOfRange:
            return "OutOfRange";
        case ErrorKind::MalformedTimestamp:
            return "MalformedTimestamp";
    }
    return "Unknown";
}

auto TimeError::format() const -> std::string {
    if (column == 0) {
        return fmt::format("{}: {}", to_string(kind), message);
    }
    return fmt::format("{} at column {}: {}", to_string(kind), column, message);
}

InvariantError::InvariantError(ErrorKind kind, const std::string& message)
    : std::logic_error(fmt::format("{}: {}", to_string(kind), message)), kind_(kind) {}

}  // namespace tempus
