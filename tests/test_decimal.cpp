#include <colmat/core/decimal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

using colmat::Decimal;

TEST_CASE("Decimal parse and print", "[core][decimal]") {
    SECTION("plain notation") {
        auto value = Decimal::parse("-12.340");
        REQUIRE(value.has_value());
        REQUIRE(value->unscaled() == -12340);
        REQUIRE(value->scale() == 3);
        REQUIRE(value->to_string() == "-12.340");
    }

    SECTION("leading zeros are not octal") {
        auto value = Decimal::parse("007.50");
        REQUIRE(value.has_value());
        REQUIRE(value->unscaled() == 750);
        REQUIRE(value->to_string() == "7.50");
    }

    SECTION("exponent") {
        auto value = Decimal::parse("1e3");
        REQUIRE(value.has_value());
        REQUIRE(value->scale() == -3);
        REQUIRE(value->to_string() == "1000");

        auto small = Decimal::parse("+25E-4");
        REQUIRE(small.has_value());
        REQUIRE(small->to_string() == "0.0025");
    }

    SECTION("invalid text") {
        REQUIRE_FALSE(Decimal::parse("").has_value());
        REQUIRE_FALSE(Decimal::parse("abc").has_value());
        REQUIRE_FALSE(Decimal::parse("1.2.3").has_value());
        REQUIRE_FALSE(Decimal::parse("1e").has_value());
    }

    SECTION("exponents beyond the scale range") {
        REQUIRE_FALSE(Decimal::parse("1.5e-9223372036854775808").has_value());
        REQUIRE_FALSE(Decimal::parse("1e9223372036854775807").has_value());
        REQUIRE_FALSE(Decimal::parse("1e2147483647").has_value());
        REQUIRE_FALSE(Decimal::parse("1e-40000").has_value());
        REQUIRE_FALSE(Decimal::parse("1e99999999999999999999").has_value());

        auto widest = Decimal::parse("1e32767");
        REQUIRE(widest.has_value());
        REQUIRE(widest->scale() == -32767);
        REQUIRE(widest->to_string().size() == 32768);
        REQUIRE(widest->to_bytes().has_value());
    }
}

TEST_CASE("Decimal from binary floating point", "[core][decimal]") {
    auto tenth = Decimal::from_double(0.1);
    REQUIRE(tenth.has_value());
    REQUIRE(tenth->to_string() == "0.1");

    auto whole = Decimal::from_double(-3.0);
    REQUIRE(whole.has_value());
    REQUIRE(whole->to_int64() == -3);

    REQUIRE_FALSE(Decimal::from_double(std::numeric_limits<double>::quiet_NaN()).has_value());
    REQUIRE_FALSE(Decimal::from_double(std::numeric_limits<double>::infinity()).has_value());
}

TEST_CASE("Decimal numeric views", "[core][decimal]") {
    REQUIRE(Decimal(129, 1).to_int64() == 12);
    REQUIRE(Decimal(-129, 1).to_int64() == -12);
    REQUIRE(Decimal(5, 3).to_int64() == 0);
    REQUIRE(Decimal(7, -2).to_int64() == 700);
    REQUIRE(Decimal(12345, 2).to_double() == 123.45);

    SECTION("integer part wraps to the low 64 bits") {
        Decimal big((Decimal::Unscaled(1) << 64) + 5, 0);
        REQUIRE(big.to_int64() == 5);
        Decimal negative(-((Decimal::Unscaled(1) << 64) + 5), 0);
        REQUIRE(negative.to_int64() == -5);
    }
}

TEST_CASE("Decimal serialization", "[core][decimal]") {
    auto encode = [](const Decimal& value) {
        auto bytes = value.to_bytes();
        REQUIRE(bytes.has_value());
        return *bytes;
    };

    REQUIRE(encode(Decimal(12345, 2)) == std::vector<std::uint8_t>{0x00, 0x02, 0x30, 0x39});
    REQUIRE(encode(Decimal(0, 0)) == std::vector<std::uint8_t>{0x00, 0x00, 0x00});
    REQUIRE(encode(Decimal(-1, 0)) == std::vector<std::uint8_t>{0x00, 0x00, 0xFF});
    REQUIRE(encode(Decimal(128, 0)) == std::vector<std::uint8_t>{0x00, 0x00, 0x00, 0x80});
    REQUIRE(encode(Decimal(-128, 0)) == std::vector<std::uint8_t>{0x00, 0x00, 0x80});
    REQUIRE(encode(Decimal(-129, 0)) == std::vector<std::uint8_t>{0x00, 0x00, 0xFF, 0x7F});
    REQUIRE(encode(Decimal(1, -1)) == std::vector<std::uint8_t>{0xFF, 0xFF, 0x01});

    SECTION("decode") {
        std::vector<std::uint8_t> bytes{0x00, 0x03, 0xFF, 0x7F};
        auto value = Decimal::from_bytes(bytes);
        REQUIRE(value.has_value());
        REQUIRE(*value == Decimal(-129, 3));
        REQUIRE(value->to_string() == "-0.129");
    }

    SECTION("truncated input") {
        std::vector<std::uint8_t> bytes{0x00, 0x01};
        REQUIRE_FALSE(Decimal::from_bytes(bytes).has_value());
    }

    SECTION("scale beyond 16 bits") {
        REQUIRE_FALSE(Decimal(1, 40000).to_bytes().has_value());
    }
}

TEST_CASE("Decimal equality keeps the scale", "[core][decimal]") {
    REQUIRE(Decimal(10, 1) == Decimal(10, 1));
    REQUIRE_FALSE(Decimal(10, 1) == Decimal(100, 2));
    REQUIRE(std::hash<Decimal>{}(Decimal(42, 1)) == std::hash<Decimal>{}(Decimal(42, 1)));
}
