#pragma once

#include <colmat/core/convert.hpp>
#include <colmat/core/dictionary.hpp>
#include <colmat/core/error.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace colmat {

/// Dictionary backed by an in-memory vector of values of one stored type.
template <StoredValue T>
class MemoryDictionary final : public Dictionary {
   public:
    explicit MemoryDictionary(std::vector<T> values, DataType type = stored_type_of_v<T>)
        : values_(std::move(values)), type_(type) {
        if (stored_type(type_) != stored_type_of_v<T>) {
            throw std::invalid_argument(fmt::format("dictionary of {} cannot hold {} values",
                                                    data_type_name(type_),
                                                    data_type_name(stored_type_of_v<T>)));
        }
    }

    [[nodiscard]] auto value_type() const noexcept -> DataType override { return type_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t override { return values_.size(); }

    [[nodiscard]] auto values() const noexcept -> const std::vector<T>& { return values_; }

    void read_values(std::span<const std::int32_t> ids, std::span<std::int32_t> out) const override {
        decode(ids, out);
    }
    void read_values(std::span<const std::int32_t> ids, std::span<std::int64_t> out) const override {
        decode(ids, out);
    }
    void read_values(std::span<const std::int32_t> ids, std::span<float> out) const override {
        decode(ids, out);
    }
    void read_values(std::span<const std::int32_t> ids, std::span<double> out) const override {
        decode(ids, out);
    }
    void read_values(std::span<const std::int32_t> ids, std::span<Decimal> out) const override {
        decode(ids, out);
    }
    void read_values(std::span<const std::int32_t> ids, std::span<std::string> out) const override {
        decode(ids, out);
    }
    void read_values(std::span<const std::int32_t> ids, std::span<Bytes> out) const override {
        decode(ids, out);
    }

   private:
    template <StoredValue U>
    void decode(std::span<const std::int32_t> ids, std::span<U> out) const {
        if constexpr (is_convertible_v<T, U>) {
            for (std::size_t i = 0; i < ids.size(); ++i) {
                out[i] = convert_value<T, U>(values_.at(static_cast<std::size_t>(ids[i])));
            }
        } else {
            throw Error(ErrorCode::IllegalConversion,
                        fmt::format("cannot read {} dictionary as {}", data_type_name(type_),
                                    data_type_name(stored_type_of_v<U>)));
        }
    }

    std::vector<T> values_;
    DataType type_;
};

}  // namespace colmat
