#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tempus {

/// Failure categories shared by every conversion in the library.
enum class ErrorKind : std::uint8_t {
    InvalidDate,
    InvalidTimeOfDay,
    InvalidLeapSecond,
    InvalidInstant,
    OutOfRange,
    MalformedTimestamp,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// Recoverable error reported for untrusted input.
struct TimeError {
    ErrorKind kind = ErrorKind::MalformedTimestamp;
    std::string message;
    /// 1-based column of the offending character for textual input, 0 otherwise.
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, TimeError>;

/// Thrown when a value with no corresponding timestamp reaches an operation
/// that requires one (a broken invariant rather than bad input).
class InvariantError : public std::logic_error {
   public:
    InvariantError(ErrorKind kind, const std::string& message);

    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

   private:
    ErrorKind kind_;
};

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message, std::size_t column = 0)
    -> std::unexpected<TimeError> {
    return std::unexpected(TimeError{.kind = kind, .message = std::move(message), .column = column});
}

}  // namespace tempus
