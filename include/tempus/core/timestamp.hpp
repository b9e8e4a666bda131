#pragma once

#include <tempus/core/calendar.hpp>
#include <tempus/core/decimal.hpp>
#include <tempus/core/error.hpp>

#include <compare>
#include <cstdint>
#include <optional>

namespace tempus {

/// UTC-relative decomposition of a timestamp.
///
/// `local_offset_minutes` is empty for "UTC, local offset unknown", which
/// is distinct from an explicit offset of zero.
struct Instant {
    std::int32_t epoch_days = 0;
    Decimal utc_time_of_day_seconds;
    std::optional<std::int16_t> local_offset_minutes;

    bool operator==(const Instant&) const = default;
};

/// A single point in time with its local offset attached as metadata.
///
/// Timestamps are only produced by the conversion functions, so every
/// Timestamp satisfies the Instant invariants: the time of day lies in
/// [0, 86400), or in [86400, 86401) on a leap-second day, and the epoch day
/// lies within years 0..9999.
class Timestamp {
   public:
    /// Throws InvariantError if the instant has no corresponding timestamp.
    [[nodiscard]] static auto from_instant(const Instant& instant) -> Timestamp;

    /// Like from_instant, for instants that come from untrusted input.
    [[nodiscard]] static auto try_from_instant(const Instant& instant) -> Result<Timestamp>;

    [[nodiscard]] static constexpr auto epoch() noexcept -> Timestamp {
        return Timestamp{Instant{.epoch_days = 0,
                                 .utc_time_of_day_seconds = Decimal{},
                                 .local_offset_minutes = std::int16_t{0}}};
    }

    [[nodiscard]] auto to_instant() const -> Instant { return instant_; }

    [[nodiscard]] auto epoch_days() const noexcept -> std::int32_t { return instant_.epoch_days; }

    [[nodiscard]] auto utc_time_of_day_seconds() const noexcept -> const Decimal& {
        return instant_.utc_time_of_day_seconds;
    }

    [[nodiscard]] auto local_offset_minutes() const noexcept -> std::optional<std::int16_t> {
        return instant_.local_offset_minutes;
    }

   private:
    constexpr explicit Timestamp(Instant instant) noexcept : instant_(instant) {}

    Instant instant_;
};

/// 2000-01-01T00:00:00Z with a zero local offset.
inline constexpr Timestamp kEpoch = Timestamp::epoch();

/// Same point in time; offsets are ignored.
[[nodiscard]] auto temporally_equal(const Timestamp& lhs, const Timestamp& rhs) noexcept -> bool;

/// Same point in time and same local offset (including both unknown).
[[nodiscard]] auto fully_equal(const Timestamp& lhs, const Timestamp& rhs) noexcept -> bool;

/// Orders timestamps by their UTC instant.
[[nodiscard]] auto temporal_compare(const Timestamp& lhs, const Timestamp& rhs) noexcept
    -> std::strong_ordering;

/// Checks an instant against the range, offset and leap-second invariants.
[[nodiscard]] auto validate_instant(const Instant& instant) -> Result<void>;

}  // namespace tempus
