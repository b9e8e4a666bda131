#include <tempus/core/decimal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <stdexcept>

using tempus::Decimal;

namespace {

auto dec(std::string_view text) -> Decimal {
    auto value = Decimal::parse(text);
    REQUIRE(value.has_value());
    return *value;
}

}  // namespace

TEST_CASE("Decimal parses plain decimal notation", "[core][decimal]") {
    SECTION("integers") {
        auto value = dec("86400");
        REQUIRE(value.scale() == 0);
        REQUIRE(value == Decimal{86400});
        REQUIRE(value.to_string() == "86400");
    }

    SECTION("fractions keep their written precision") {
        auto value = dec("0.500");
        REQUIRE(value.scale() == 3);
        REQUIRE(value.to_string() == "0.500");
        REQUIRE(value == dec("0.5"));
    }

    SECTION("signs") {
        REQUIRE(dec("-1.25").to_string() == "-1.25");
        REQUIRE(dec("+7").to_string() == "7");
        REQUIRE(dec("-0").to_string() == "0");
        REQUIRE(dec("-0.05").is_negative());
    }

    SECTION("rejects malformed text") {
        REQUIRE_FALSE(Decimal::parse("").has_value());
        REQUIRE_FALSE(Decimal::parse("-").has_value());
        REQUIRE_FALSE(Decimal::parse(".5").has_value());
        REQUIRE_FALSE(Decimal::parse("5.").has_value());
        REQUIRE_FALSE(Decimal::parse("1e3").has_value());
        REQUIRE_FALSE(Decimal::parse("1.2.3").has_value());
        REQUIRE_FALSE(Decimal::parse(" 1").has_value());
    }

    SECTION("rejects more than 24 fractional digits") {
        REQUIRE(Decimal::parse("0.123456789012345678901234").has_value());
        REQUIRE_FALSE(Decimal::parse("0.1234567890123456789012345").has_value());
    }

    SECTION("rejects coefficients beyond 128 bits") {
        REQUIRE_FALSE(Decimal::parse("999999999999999999999999999999999999999999").has_value());
    }
}

TEST_CASE("Decimal arithmetic preserves precision", "[core][decimal]") {
    SECTION("sum takes the larger scale") {
        auto sum = dec("0.50") + Decimal{1};
        REQUIRE(sum.scale() == 2);
        REQUIRE(sum.to_string() == "1.50");
    }

    SECTION("difference can go negative") {
        auto diff = dec("1.5") - dec("2.25");
        REQUIRE(diff.to_string() == "-0.75");
        REQUIRE(diff.is_negative());
    }

    SECTION("integer multiplication keeps the scale") {
        auto product = dec("1.10") * 3;
        REQUIRE(product.to_string() == "3.30");
    }

    SECTION("negation") {
        REQUIRE((-dec("4.20")).to_string() == "-4.20");
    }

    SECTION("many small fractions add up exactly") {
        Decimal total;
        for (int i = 0; i < 10; ++i) {
            total = total + dec("0.1");
        }
        REQUIRE(total == Decimal{1});
        REQUIRE(total.to_string() == "1.0");
    }
}

TEST_CASE("Decimal comparison is numeric", "[core][decimal]") {
    REQUIRE(dec("1.5") == dec("1.50000"));
    REQUIRE(dec("1.49999") < dec("1.5"));
    REQUIRE(dec("-2") < dec("-1.999"));
    REQUIRE(dec("86400") > dec("86399.999999999"));
    REQUIRE(dec("0") == Decimal{});

    SECTION("comparison survives rescaling overflow") {
        auto huge = Decimal::from_parts(Decimal::Coefficient{1} << 120, 0);
        auto tiny = dec("0.000000000000000000000001");
        REQUIRE(huge > tiny);
        REQUIRE(tiny < huge);
        REQUIRE(-huge < tiny);
    }
}

TEST_CASE("Decimal floor division", "[core][decimal]") {
    REQUIRE(dec("86400").floor_div(86400) == 1);
    REQUIRE(dec("86399.999").floor_div(86400) == 0);
    REQUIRE(dec("-0.001").floor_div(86400) == -1);
    REQUIRE(dec("-86400").floor_div(86400) == -1);
    REQUIRE(dec("-86400.5").floor_div(86400) == -2);
    REQUIRE(dec("3599.9").floor_div(1) == 3599);
    REQUIRE_THROWS_AS(dec("1").floor_div(0), std::invalid_argument);
}

TEST_CASE("Decimal rescaling", "[core][decimal]") {
    REQUIRE(Decimal{86400}.with_scale(2).to_string() == "86400.00");
    REQUIRE_THROWS_AS(dec("1.25").with_scale(1), std::invalid_argument);
    REQUIRE_THROWS_AS(Decimal::from_parts(1, 25), std::invalid_argument);

    auto big = Decimal::from_parts(Decimal::Coefficient{1} << 125, 0);
    REQUIRE_THROWS_AS(big.with_scale(24), std::overflow_error);
    REQUIRE_THROWS_AS(big * 1'000'000, std::overflow_error);
}

TEST_CASE("Decimal formats through fmt", "[core][decimal]") {
    REQUIRE(fmt::format("{}", dec("12.0050")) == "12.0050");
    REQUIRE(fmt::format("[{:>8}]", dec("1.5")) == "[     1.5]");
}

TEST_CASE("Decimal coefficients beyond 64 bits", "[core][decimal]") {
    const Decimal::Coefficient big = Decimal::Coefficient{1} << 100;
    const Decimal value = Decimal::from_parts(big, Decimal::kMaxScale);
    REQUIRE((value.coefficient() == big));
    REQUIRE(value.to_string() == "1267650.600228229401496703205376");
    REQUIRE((-value).to_string() == "-1267650.600228229401496703205376");
    REQUIRE(dec("1267650.600228229401496703205376") == value);
}
