#pragma once

#include <colmat/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace colmat {

/// Id -> value table of a dictionary-encoded column.
///
/// Each read_values() overload decodes `ids` into the first ids.size() slots
/// of `out`, converting from the dictionary's value type when they differ.
/// Implementations never touch slots past ids.size().
class Dictionary {
   public:
    virtual ~Dictionary() = default;

    [[nodiscard]] virtual auto value_type() const noexcept -> DataType = 0;
    [[nodiscard]] virtual auto size() const noexcept -> std::size_t = 0;

    virtual void read_values(std::span<const std::int32_t> ids, std::span<std::int32_t> out) const = 0;
    virtual void read_values(std::span<const std::int32_t> ids, std::span<std::int64_t> out) const = 0;
    virtual void read_values(std::span<const std::int32_t> ids, std::span<float> out) const = 0;
    virtual void read_values(std::span<const std::int32_t> ids, std::span<double> out) const = 0;
    virtual void read_values(std::span<const std::int32_t> ids, std::span<Decimal> out) const = 0;
    virtual void read_values(std::span<const std::int32_t> ids, std::span<std::string> out) const = 0;
    virtual void read_values(std::span<const std::int32_t> ids, std::span<Bytes> out) const = 0;
};

}  // namespace colmat
