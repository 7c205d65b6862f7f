#pragma once

#include <colmat/core/decimal.hpp>
#include <colmat/core/error.hpp>
#include <colmat/core/types.hpp>

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace colmat {

// ─── Derivation table ─────────────────────────────────────────────────────────
//  Which stored type can be derived from which, element by element. Identity is
//  always allowed; Unknown is handled by the callers (placeholder fill).

[[nodiscard]] constexpr auto is_numeric_stored(DataType stored) noexcept -> bool {
    return stored == DataType::Int32 || stored == DataType::Int64 || stored == DataType::Float32 ||
           stored == DataType::Float64;
}

[[nodiscard]] constexpr auto can_convert(DataType from, DataType to) noexcept -> bool {
    if (from == to) {
        return from != DataType::Unknown;
    }
    switch (to) {
        case DataType::Int32:
        case DataType::Int64:
        case DataType::Float32:
        case DataType::Float64:
            return is_numeric_stored(from) || from == DataType::Decimal || from == DataType::String;
        case DataType::Decimal:
            return is_numeric_stored(from) || from == DataType::String || from == DataType::Bytes;
        case DataType::String:
            return is_numeric_stored(from) || from == DataType::Decimal || from == DataType::Bytes;
        case DataType::Bytes:
            return from == DataType::Decimal || from == DataType::String;
        default:
            return false;
    }
}

template <StoredValue From, StoredValue To>
inline constexpr bool is_convertible_v = can_convert(stored_type_of_v<From>, stored_type_of_v<To>);

// ─── Text and numeric helpers ─────────────────────────────────────────────────

/// Integer text, or decimal text truncated toward zero ("12.9" -> 12).
[[nodiscard]] auto parse_int64(std::string_view text) -> std::expected<std::int64_t, std::string>;
[[nodiscard]] auto parse_int32(std::string_view text) -> std::expected<std::int32_t, std::string>;

/// Accepts "NaN", "Infinity" and "-Infinity" besides ordinary numbers.
[[nodiscard]] auto parse_double(std::string_view text) -> std::expected<double, std::string>;
[[nodiscard]] auto parse_float(std::string_view text) -> std::expected<float, std::string>;

/// Shortest round-trip text; integral values keep a trailing ".0".
[[nodiscard]] auto format_double(double value) -> std::string;
[[nodiscard]] auto format_float(float value) -> std::string;

/// Lowercase hexadecimal.
[[nodiscard]] auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;
[[nodiscard]] auto parse_hex(std::string_view text) -> std::expected<Bytes, std::string>;

/// Truncate toward zero, saturating at the 64-bit range; NaN becomes 0.
[[nodiscard]] auto truncate_to_int64(double value) noexcept -> std::int64_t;

namespace detail {

template <typename T>
auto value_or_throw(std::expected<T, std::string> result) -> T {
    if (!result) {
        throw Error(ErrorCode::ConversionError, result.error());
    }
    return std::move(*result);
}

}  // namespace detail

// ─── Element conversion ───────────────────────────────────────────────────────

/// Convert one value. Narrowing between integers keeps the low bits
/// (two's complement), never saturates and never fails.
template <StoredValue From, StoredValue To>
    requires is_convertible_v<From, To>
[[nodiscard]] auto convert_value(const From& value) -> To {
    if constexpr (std::is_same_v<From, To>) {
        return value;
    } else if constexpr (std::is_same_v<To, std::int32_t>) {
        if constexpr (std::is_same_v<From, std::string>) {
            return detail::value_or_throw(parse_int32(value));
        } else {
            return static_cast<std::int32_t>(convert_value<From, std::int64_t>(value));
        }
    } else if constexpr (std::is_same_v<To, std::int64_t>) {
        if constexpr (std::is_same_v<From, std::int32_t>) {
            return value;
        } else if constexpr (std::is_floating_point_v<From>) {
            return truncate_to_int64(static_cast<double>(value));
        } else if constexpr (std::is_same_v<From, Decimal>) {
            return value.to_int64();
        } else {
            return detail::value_or_throw(parse_int64(value));
        }
    } else if constexpr (std::is_floating_point_v<To>) {
        if constexpr (std::is_arithmetic_v<From>) {
            return static_cast<To>(value);
        } else if constexpr (std::is_same_v<From, Decimal>) {
            return static_cast<To>(value.to_double());
        } else if constexpr (std::is_same_v<To, float>) {
            return detail::value_or_throw(parse_float(value));
        } else {
            return detail::value_or_throw(parse_double(value));
        }
    } else if constexpr (std::is_same_v<To, Decimal>) {
        if constexpr (std::is_integral_v<From>) {
            return Decimal::from_int64(value);
        } else if constexpr (std::is_floating_point_v<From>) {
            return detail::value_or_throw(Decimal::from_double(static_cast<double>(value)));
        } else if constexpr (std::is_same_v<From, std::string>) {
            return detail::value_or_throw(Decimal::parse(value));
        } else {
            return detail::value_or_throw(Decimal::from_bytes(value));
        }
    } else if constexpr (std::is_same_v<To, std::string>) {
        if constexpr (std::is_integral_v<From>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<From, float>) {
            return format_float(value);
        } else if constexpr (std::is_same_v<From, double>) {
            return format_double(value);
        } else if constexpr (std::is_same_v<From, Decimal>) {
            return value.to_string();
        } else {
            return to_hex(value);
        }
    } else {
        if constexpr (std::is_same_v<From, Decimal>) {
            return detail::value_or_throw(value.to_bytes());
        } else {
            return detail::value_or_throw(parse_hex(value));
        }
    }
}

/// Convert `src` element-wise into the first src.size() slots of `dst`.
template <StoredValue From, StoredValue To>
    requires is_convertible_v<From, To>
void convert_values(std::span<const From> src, std::span<To> dst) {
    for (std::size_t i = 0; i < src.size(); ++i) {
        dst[i] = convert_value<From, To>(src[i]);
    }
}

/// Convert each row's sequence, keeping every row's length.
template <StoredValue From, StoredValue To>
    requires is_convertible_v<From, To>
void convert_rows(std::span<const std::vector<From>> src, std::span<std::vector<To>> dst) {
    for (std::size_t row = 0; row < src.size(); ++row) {
        const auto& in = src[row];
        auto& out = dst[row];
        out.resize(in.size());
        for (std::size_t i = 0; i < in.size(); ++i) {
            out[i] = convert_value<From, To>(in[i]);
        }
    }
}

}  // namespace colmat
