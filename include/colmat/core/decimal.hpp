#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace colmat {

/// Arbitrary-precision decimal: value = unscaled * 10^(-scale).
///
/// Equality is representational, so 1.0 (10, scale 1) and 1.00 (100, scale 2)
/// are distinct values, matching how distinct sets key decimals.
class Decimal {
   public:
    using Unscaled = boost::multiprecision::cpp_int;

    Decimal() = default;
    Decimal(Unscaled unscaled, std::int32_t scale) : unscaled_(std::move(unscaled)), scale_(scale) {}

    [[nodiscard]] static auto from_int64(std::int64_t value) -> Decimal;

    /// Exact value of the shortest decimal text that round-trips `value`.
    /// NaN and infinities have no decimal representation.
    [[nodiscard]] static auto from_double(double value) -> std::expected<Decimal, std::string>;

    /// Largest scale magnitude parse() accepts; also the serialized range.
    static constexpr std::int32_t kMaxParsedScale = std::numeric_limits<std::int16_t>::max();

    /// Parse `[+-]digits[.digits][(e|E)[+-]digits]`. Text whose scale falls
    /// outside +/-kMaxParsedScale is rejected.
    [[nodiscard]] static auto parse(std::string_view text) -> std::expected<Decimal, std::string>;

    /// Decode the serialized form produced by to_bytes().
    [[nodiscard]] static auto from_bytes(std::span<const std::uint8_t> bytes)
        -> std::expected<Decimal, std::string>;

    [[nodiscard]] auto unscaled() const noexcept -> const Unscaled& { return unscaled_; }
    [[nodiscard]] auto scale() const noexcept -> std::int32_t { return scale_; }

    /// Plain (non-scientific) text, e.g. "-12.340".
    [[nodiscard]] auto to_string() const -> std::string;

    /// Two-byte big-endian scale followed by the minimal big-endian
    /// two's-complement encoding of the unscaled value.
    [[nodiscard]] auto to_bytes() const -> std::expected<std::vector<std::uint8_t>, std::string>;

    /// Integer part, truncated toward zero.
    [[nodiscard]] auto integer_part() const -> Unscaled;

    /// Integer part (truncated toward zero), reduced to its low 64 bits.
    [[nodiscard]] auto to_int64() const -> std::int64_t;

    /// Nearest double.
    [[nodiscard]] auto to_double() const -> double;

    auto operator==(const Decimal&) const -> bool = default;

   private:
    Unscaled unscaled_ = 0;
    std::int32_t scale_ = 0;
};

}  // namespace colmat

namespace std {

template <>
struct hash<colmat::Decimal> {
    auto operator()(const colmat::Decimal& d) const -> std::size_t {
        auto h = std::hash<std::string>{}(d.unscaled().str());
        return h ^ (std::hash<std::int32_t>{}(d.scale()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

}  // namespace std
