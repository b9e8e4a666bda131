#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tempus {

/// Exact fixed-point decimal number.
///
/// A Decimal is `coefficient * 10^-scale`. The scale records the number of
/// fractional digits the value was written with and survives arithmetic:
/// sums and differences take the larger scale of their operands, so
/// `Decimal::parse("0.50") + Decimal{1}` prints as `1.50`. Comparison is
/// numeric and ignores the scale.
class Decimal {
   public:
    __extension__ using Coefficient = __int128;

    /// Largest supported number of fractional digits.
    static constexpr std::uint8_t kMaxScale = 24;

    constexpr Decimal() noexcept = default;

    constexpr explicit Decimal(std::int64_t value) noexcept : coefficient_(value) {}

    /// Build `coefficient * 10^-scale`. Throws std::invalid_argument if
    /// scale exceeds kMaxScale.
    [[nodiscard]] static auto from_parts(Coefficient coefficient, std::uint8_t scale) -> Decimal;

    /// Parse plain decimal notation: `[+-]digits[.digits]`.
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<Decimal>;

    [[nodiscard]] constexpr auto coefficient() const noexcept -> Coefficient { return coefficient_; }
    [[nodiscard]] constexpr auto scale() const noexcept -> std::uint8_t { return scale_; }

    [[nodiscard]] constexpr auto is_zero() const noexcept -> bool { return coefficient_ == 0; }
    [[nodiscard]] constexpr auto is_negative() const noexcept -> bool { return coefficient_ < 0; }

    /// Same value written with `scale` fractional digits. Only widening is
    /// exact, so a smaller scale than the current one throws
    /// std::invalid_argument.
    [[nodiscard]] auto with_scale(std::uint8_t scale) const -> Decimal;

    /// floor(*this / divisor) for a positive divisor.
    [[nodiscard]] auto floor_div(std::int64_t divisor) const -> std::int64_t;

    /// Render with exactly scale() fractional digits.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator-() const -> Decimal;

    friend auto operator+(const Decimal& lhs, const Decimal& rhs) -> Decimal;
    friend auto operator-(const Decimal& lhs, const Decimal& rhs) -> Decimal;
    friend auto operator*(const Decimal& lhs, std::int64_t rhs) -> Decimal;

    friend auto operator==(const Decimal& lhs, const Decimal& rhs) noexcept -> bool;
    friend auto operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept
        -> std::strong_ordering;

   private:
    Coefficient coefficient_ = 0;
    std::uint8_t scale_ = 0;
};

}  // namespace tempus

template <>
struct fmt::formatter<tempus::Decimal> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tempus::Decimal& value, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};
