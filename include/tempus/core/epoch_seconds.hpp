#pragma once

#include <tempus/core/decimal.hpp>
#include <tempus/core/timestamp.hpp>

namespace tempus {

/// Seconds since 2000-01-01T00:00:00Z, counting every day as 86400 seconds.
/// A partial leap second is clamped away first, so two timestamps inside
/// the same leap second map to values just below the following midnight.
[[nodiscard]] auto to_epoch_seconds(const Timestamp& ts) -> Decimal;

/// Inverse of to_epoch_seconds with a zero local offset. Throws
/// InvariantError (OutOfRange) outside years 0..9999.
[[nodiscard]] auto from_epoch_seconds(const Decimal& seconds) -> Timestamp;

/// to_epoch_seconds(lhs) - to_epoch_seconds(rhs).
[[nodiscard]] auto subtract(const Timestamp& lhs, const Timestamp& rhs) -> Decimal;

}  // namespace tempus
