#include <tempus/core/decimal.hpp>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace tempus {

namespace {

using Coefficient = Decimal::Coefficient;

constexpr auto pow10(std::uint8_t exponent) -> Coefficient {
    Coefficient result = 1;
    for (std::uint8_t i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

static_assert(pow10(Decimal::kMaxScale) == pow10(12) * pow10(12));

auto order(Coefficient lhs, Coefficient rhs) noexcept -> std::strong_ordering {
    if (lhs < rhs) {
        return std::strong_ordering::less;
    }
    if (lhs > rhs) {
        return std::strong_ordering::greater;
    }
    return std::strong_ordering::equal;
}

auto sign_of(Coefficient value) noexcept -> std::strong_ordering {
    return order(value, 0);
}

}  // namespace

auto Decimal::from_parts(Coefficient coefficient, std::uint8_t scale) -> Decimal {
    if (scale > kMaxScale) {
        throw std::invalid_argument("Decimal: scale exceeds 24 fractional digits");
    }
    Decimal result;
    result.coefficient_ = coefficient;
    result.scale_ = scale;
    return result;
}

auto Decimal::parse(std::string_view text) -> std::optional<Decimal> {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        pos += 1;
    }

    Coefficient coefficient = 0;
    auto accumulate = [&coefficient](char ch) -> bool {
        return !__builtin_mul_overflow(coefficient, 10, &coefficient) &&
               !__builtin_add_overflow(coefficient, ch - '0', &coefficient);
    };
    auto is_digit = [](char ch) { return ch >= '0' && ch <= '9'; };

    std::size_t start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
        if (!accumulate(text[pos])) {
            return std::nullopt;
        }
        pos += 1;
    }
    if (pos == start) {
        return std::nullopt;
    }

    std::size_t scale = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos += 1;
        start = pos;
        while (pos < text.size() && is_digit(text[pos])) {
            if (!accumulate(text[pos])) {
                return std::nullopt;
            }
            pos += 1;
        }
        scale = pos - start;
        if (scale == 0 || scale > kMaxScale) {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    return from_parts(negative ? -coefficient : coefficient, static_cast<std::uint8_t>(scale));
}

auto Decimal::with_scale(std::uint8_t scale) const -> Decimal {
    if (scale < scale_ || scale > kMaxScale) {
        throw std::invalid_argument("Decimal: scale can only be widened up to 24 digits");
    }
    Coefficient widened = 0;
    if (__builtin_mul_overflow(coefficient_, pow10(scale - scale_), &widened)) {
        throw std::overflow_error("Decimal: overflow while rescaling");
    }
    return from_parts(widened, scale);
}

auto Decimal::floor_div(std::int64_t divisor) const -> std::int64_t {
    if (divisor <= 0) {
        throw std::invalid_argument("Decimal: floor_div requires a positive divisor");
    }
    Coefficient scaled_divisor = 0;
    if (__builtin_mul_overflow(static_cast<Coefficient>(divisor), pow10(scale_),
                               &scaled_divisor)) {
        throw std::overflow_error("Decimal: overflow in floor_div");
    }
    Coefficient quotient = coefficient_ / scaled_divisor;
    if (coefficient_ % scaled_divisor != 0 && coefficient_ < 0) {
        quotient -= 1;
    }
    if (quotient < std::numeric_limits<std::int64_t>::min() ||
        quotient > std::numeric_limits<std::int64_t>::max()) {
        throw std::overflow_error("Decimal: floor_div result exceeds 64 bits");
    }
    return static_cast<std::int64_t>(quotient);
}

auto Decimal::to_string() const -> std::string {
    __extension__ using Magnitude = unsigned __int128;
    Magnitude magnitude = coefficient_ < 0 ? -static_cast<Magnitude>(coefficient_)
                                           : static_cast<Magnitude>(coefficient_);
    std::string digits;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    } while (magnitude != 0);
    while (digits.size() < static_cast<std::size_t>(scale_) + 1) {
        digits.push_back('0');
    }
    std::reverse(digits.begin(), digits.end());
    if (scale_ > 0) {
        digits.insert(digits.size() - scale_, 1, '.');
    }
    if (coefficient_ < 0) {
        digits.insert(digits.begin(), '-');
    }
    return digits;
}

auto Decimal::operator-() const -> Decimal {
    Coefficient negated = 0;
    if (__builtin_sub_overflow(Coefficient{0}, coefficient_, &negated)) {
        throw std::overflow_error("Decimal: overflow in negation");
    }
    return from_parts(negated, scale_);
}

auto operator+(const Decimal& lhs, const Decimal& rhs) -> Decimal {
    const std::uint8_t scale = std::max(lhs.scale_, rhs.scale_);
    const Decimal left = lhs.with_scale(scale);
    const Decimal right = rhs.with_scale(scale);
    Coefficient sum = 0;
    if (__builtin_add_overflow(left.coefficient_, right.coefficient_, &sum)) {
        throw std::overflow_error("Decimal: overflow in addition");
    }
    return Decimal::from_parts(sum, scale);
}

auto operator-(const Decimal& lhs, const Decimal& rhs) -> Decimal {
    const std::uint8_t scale = std::max(lhs.scale_, rhs.scale_);
    const Decimal left = lhs.with_scale(scale);
    const Decimal right = rhs.with_scale(scale);
    Coefficient difference = 0;
    if (__builtin_sub_overflow(left.coefficient_, right.coefficient_, &difference)) {
        throw std::overflow_error("Decimal: overflow in subtraction");
    }
    return Decimal::from_parts(difference, scale);
}

auto operator*(const Decimal& lhs, std::int64_t rhs) -> Decimal {
    Coefficient product = 0;
    if (__builtin_mul_overflow(lhs.coefficient_, static_cast<Coefficient>(rhs), &product)) {
        throw std::overflow_error("Decimal: overflow in multiplication");
    }
    return Decimal::from_parts(product, lhs.scale_);
}

auto operator==(const Decimal& lhs, const Decimal& rhs) noexcept -> bool {
    return (lhs <=> rhs) == std::strong_ordering::equal;
}

auto operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept -> std::strong_ordering {
    if (lhs.scale_ == rhs.scale_) {
        return order(lhs.coefficient_, rhs.coefficient_);
    }
    // Widen the smaller scale; if that overflows, its magnitude exceeds
    // anything the other side can hold.
    if (lhs.scale_ < rhs.scale_) {
        Coefficient widened = 0;
        if (__builtin_mul_overflow(lhs.coefficient_, pow10(rhs.scale_ - lhs.scale_), &widened)) {
            return sign_of(lhs.coefficient_);
        }
        return order(widened, rhs.coefficient_);
    }
    Coefficient widened = 0;
    if (__builtin_mul_overflow(rhs.coefficient_, pow10(lhs.scale_ - rhs.scale_), &widened)) {
        return 0 <=> sign_of(rhs.coefficient_);
    }
    return order(lhs.coefficient_, widened);
}

}  // namespace tempus
