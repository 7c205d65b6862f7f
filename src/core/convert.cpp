#include <colmat/core/convert.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace colmat {

namespace {

auto strip_plus(std::string_view text) -> std::string_view {
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

template <typename T>
auto parse_floating(std::string_view text, std::string_view type_name)
    -> std::expected<T, std::string> {
    if (text == "NaN") {
        return std::numeric_limits<T>::quiet_NaN();
    }
    if (text == "Infinity" || text == "+Infinity") {
        return std::numeric_limits<T>::infinity();
    }
    if (text == "-Infinity") {
        return -std::numeric_limits<T>::infinity();
    }

    auto digits = strip_plus(text);
    T value{};
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    if (ptr != last || (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
        return std::unexpected(fmt::format("cannot parse '{}' as {}", text, type_name));
    }
    if (ec == std::errc::result_out_of_range) {
        // from_chars leaves the value untouched; strtod yields the IEEE result.
        std::string copy(digits);
        return static_cast<T>(std::strtod(copy.c_str(), nullptr));
    }
    return value;
}

template <typename T>
auto format_floating(T value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".e") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

constexpr auto hex_value(char ch) noexcept -> int {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

auto parse_int64(std::string_view text) -> std::expected<std::int64_t, std::string> {
    auto digits = strip_plus(text);
    std::int64_t value = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ptr == last && ec == std::errc{}) {
        return value;
    }
    if (ptr == last && ec == std::errc::result_out_of_range) {
        return std::unexpected(fmt::format("'{}' is out of range for INT64", text));
    }

    // Fall back to decimal text such as "12.7" or "1e3".
    auto decimal = Decimal::parse(text);
    if (!decimal) {
        return std::unexpected(fmt::format("cannot parse '{}' as INT64", text));
    }
    if (decimal->scale() < -std::numeric_limits<std::int64_t>::digits10 && decimal->unscaled() != 0) {
        return std::unexpected(fmt::format("'{}' is out of range for INT64", text));
    }
    auto integer = decimal->integer_part();
    if (integer > std::numeric_limits<std::int64_t>::max() ||
        integer < std::numeric_limits<std::int64_t>::min()) {
        return std::unexpected(fmt::format("'{}' is out of range for INT64", text));
    }
    return static_cast<std::int64_t>(integer);
}

auto parse_int32(std::string_view text) -> std::expected<std::int32_t, std::string> {
    auto wide = parse_int64(text);
    if (!wide) {
        return std::unexpected(fmt::format("cannot parse '{}' as INT32", text));
    }
    if (*wide > std::numeric_limits<std::int32_t>::max() ||
        *wide < std::numeric_limits<std::int32_t>::min()) {
        return std::unexpected(fmt::format("'{}' is out of range for INT32", text));
    }
    return static_cast<std::int32_t>(*wide);
}

auto parse_double(std::string_view text) -> std::expected<double, std::string> {
    return parse_floating<double>(text, "FLOAT64");
}

auto parse_float(std::string_view text) -> std::expected<float, std::string> {
    return parse_floating<float>(text, "FLOAT32");
}

auto format_double(double value) -> std::string {
    return format_floating(value);
}

auto format_float(float value) -> std::string {
    return format_floating(value);
}

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

auto parse_hex(std::string_view text) -> std::expected<Bytes, std::string> {
    if (text.size() % 2 != 0) {
        return std::unexpected(fmt::format("hex string '{}' has odd length", text));
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int high = hex_value(text[i]);
        int low = hex_value(text[i + 1]);
        if (high < 0 || low < 0) {
            return std::unexpected(fmt::format("invalid hex string '{}'", text));
        }
        out.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return out;
}

auto truncate_to_int64(double value) noexcept -> std::int64_t {
    if (std::isnan(value)) {
        return 0;
    }
    // 2^63 is exactly representable; anything at or beyond it saturates.
    constexpr double kTwo63 = 9223372036854775808.0;
    if (value >= kTwo63) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (value < -kTwo63) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return static_cast<std::int64_t>(value);
}

}  // namespace colmat
