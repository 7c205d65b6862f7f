#include <colmat/core/decimal.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iterator>
#include <limits>

namespace colmat {

namespace {

using boost::multiprecision::cpp_int;

auto pow10(std::int64_t exponent) -> cpp_int {
    return boost::multiprecision::pow(cpp_int(10), static_cast<unsigned>(exponent));
}

/// Two's-complement reduction of `value` to 64 bits.
auto low_64_bits(const cpp_int& value) -> std::int64_t {
    static const cpp_int kMask = (cpp_int(1) << 64) - 1;
    const bool negative = value < 0;
    cpp_int magnitude = negative ? cpp_int(-value) : value;
    auto low = static_cast<std::uint64_t>(magnitude & kMask);
    if (negative) {
        low = std::uint64_t{0} - low;
    }
    return static_cast<std::int64_t>(low);
}

}  // namespace

auto Decimal::from_int64(std::int64_t value) -> Decimal {
    return Decimal{cpp_int(value), 0};
}

auto Decimal::from_double(double value) -> std::expected<Decimal, std::string> {
    if (!std::isfinite(value)) {
        return std::unexpected(fmt::format("cannot represent {} as a decimal", value));
    }
    return parse(fmt::format("{}", value));
}

auto Decimal::parse(std::string_view text) -> std::expected<Decimal, std::string> {
    auto fail = [&]() -> std::expected<Decimal, std::string> {
        return std::unexpected(fmt::format("invalid decimal '{}'", text));
    };

    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    std::int64_t fraction_digits = 0;
    bool seen_point = false;
    for (; pos < text.size(); ++pos) {
        char ch = text[pos];
        if (ch >= '0' && ch <= '9') {
            digits.push_back(ch);
            if (seen_point) {
                ++fraction_digits;
            }
        } else if (ch == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }
    if (digits.empty()) {
        return fail();
    }

    std::int64_t exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && text[pos] == '+') {
            ++pos;
        }
        const char* first = text.data() + pos;
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, exponent);
        if (ec != std::errc{} || ptr == first) {
            return fail();
        }
        pos = static_cast<std::size_t>(ptr - text.data());
    }
    if (pos != text.size()) {
        return fail();
    }

    auto out_of_range = [&]() -> std::expected<Decimal, std::string> {
        return std::unexpected(fmt::format("decimal scale out of range in '{}'", text));
    };
    if (exponent < std::numeric_limits<std::int32_t>::min() ||
        exponent > std::numeric_limits<std::int32_t>::max()) {
        return out_of_range();
    }
    const std::int64_t scale = fraction_digits - exponent;
    if (scale < -Decimal::kMaxParsedScale || scale > Decimal::kMaxParsedScale) {
        return out_of_range();
    }

    auto first_non_zero = digits.find_first_not_of('0');
    cpp_int unscaled =
        first_non_zero == std::string::npos ? cpp_int(0) : cpp_int(digits.c_str() + first_non_zero);
    if (negative) {
        unscaled = -unscaled;
    }
    return Decimal{std::move(unscaled), static_cast<std::int32_t>(scale)};
}

auto Decimal::from_bytes(std::span<const std::uint8_t> bytes)
    -> std::expected<Decimal, std::string> {
    if (bytes.size() < 3) {
        return std::unexpected(
            fmt::format("serialized decimal needs at least 3 bytes, got {}", bytes.size()));
    }
    auto scale = static_cast<std::int16_t>(static_cast<std::uint16_t>(bytes[0] << 8) | bytes[1]);
    auto payload = bytes.subspan(2);

    cpp_int unscaled;
    boost::multiprecision::import_bits(unscaled, payload.begin(), payload.end(), 8);
    if ((payload.front() & 0x80U) != 0) {
        unscaled -= cpp_int(1) << (8 * payload.size());
    }
    return Decimal{std::move(unscaled), scale};
}

auto Decimal::to_string() const -> std::string {
    if (scale_ <= 0) {
        if (unscaled_ == 0) {
            return "0";
        }
        std::string text = unscaled_.str();
        text.append(static_cast<std::size_t>(-static_cast<std::int64_t>(scale_)), '0');
        return text;
    }

    const bool negative = unscaled_ < 0;
    std::string digits = negative ? cpp_int(-unscaled_).str() : unscaled_.str();
    auto scale = static_cast<std::size_t>(scale_);
    if (digits.size() <= scale) {
        digits.insert(0, scale - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - scale, 1, '.');
    if (negative) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

auto Decimal::to_bytes() const -> std::expected<std::vector<std::uint8_t>, std::string> {
    if (scale_ < std::numeric_limits<std::int16_t>::min() ||
        scale_ > std::numeric_limits<std::int16_t>::max()) {
        return std::unexpected(fmt::format("decimal scale {} does not fit in 16 bits", scale_));
    }

    std::vector<std::uint8_t> out;
    auto scale_bits = static_cast<std::uint16_t>(static_cast<std::int16_t>(scale_));
    out.push_back(static_cast<std::uint8_t>(scale_bits >> 8));
    out.push_back(static_cast<std::uint8_t>(scale_bits & 0xFFU));

    if (unscaled_ == 0) {
        out.push_back(0);
        return out;
    }

    std::vector<std::uint8_t> payload;
    if (unscaled_ > 0) {
        boost::multiprecision::export_bits(unscaled_, std::back_inserter(payload), 8);
        if ((payload.front() & 0x80U) != 0) {
            payload.insert(payload.begin(), 0);
        }
    } else {
        // Smallest width n with -2^(8n-1) <= value, then encode 2^(8n) + value.
        cpp_int magnitude = -unscaled_;
        std::size_t width = 1;
        while (magnitude > (cpp_int(1) << (8 * width - 1))) {
            ++width;
        }
        cpp_int encoded = (cpp_int(1) << (8 * width)) + unscaled_;
        boost::multiprecision::export_bits(encoded, std::back_inserter(payload), 8);
        payload.insert(payload.begin(), width - payload.size(), 0xFF);
    }
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

auto Decimal::integer_part() const -> Unscaled {
    if (scale_ == 0 || unscaled_ == 0) {
        return unscaled_;
    }
    if (scale_ > 0) {
        if (static_cast<std::size_t>(scale_) > unscaled_.str().size()) {
            return 0;
        }
        // cpp_int division truncates toward zero.
        return unscaled_ / pow10(scale_);
    }
    return unscaled_ * pow10(-static_cast<std::int64_t>(scale_));
}

auto Decimal::to_int64() const -> std::int64_t {
    if (scale_ <= -64) {
        // 10^64 is a multiple of 2^64: the low bits of the product are zero.
        return 0;
    }
    return low_64_bits(integer_part());
}

auto Decimal::to_double() const -> double {
    auto text = fmt::format("{}e{}", unscaled_.str(), -static_cast<std::int64_t>(scale_));
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        // from_chars leaves value untouched on overflow/underflow.
        bool tiny = -static_cast<std::int64_t>(scale_) < 0;
        if (tiny) {
            return unscaled_ < 0 ? -0.0 : 0.0;
        }
        return unscaled_ < 0 ? -std::numeric_limits<double>::infinity()
                             : std::numeric_limits<double>::infinity();
    }
    return value;
}

}  // namespace colmat
