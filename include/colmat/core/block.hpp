#pragma once

#include <colmat/core/dictionary.hpp>
#include <colmat/core/null_mask.hpp>
#include <colmat/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace colmat {

/// Read-only view of one batch of single-valued values, by stored type.
using SvView = std::variant<std::span<const std::int32_t>, std::span<const std::int64_t>,
                            std::span<const float>, std::span<const double>,
                            std::span<const Decimal>, std::span<const std::string>,
                            std::span<const Bytes>>;

/// Read-only view of one batch of multi-valued rows, by stored type.
using MvView = std::variant<std::span<const std::vector<std::int32_t>>,
                            std::span<const std::vector<std::int64_t>>,
                            std::span<const std::vector<float>>, std::span<const std::vector<double>>,
                            std::span<const std::vector<Decimal>>,
                            std::span<const std::vector<std::string>>,
                            std::span<const std::vector<Bytes>>>;

/// Values of one column for one batch, as supplied by the storage layer.
///
/// A value set is read in its own stored type only; conversion to other types
/// is the job of the transform layer.
class BlockValueSet {
   public:
    virtual ~BlockValueSet() = default;

    [[nodiscard]] virtual auto data_type() const noexcept -> DataType = 0;
    [[nodiscard]] virtual auto is_single_value() const noexcept -> bool = 0;

    /// Dictionary of a dictionary-encoded column, nullptr otherwise.
    [[nodiscard]] virtual auto dictionary() const noexcept -> const Dictionary* = 0;

    [[nodiscard]] virtual auto dictionary_ids_sv() const -> std::span<const std::int32_t> = 0;
    [[nodiscard]] virtual auto dictionary_ids_mv() const
        -> std::span<const std::vector<std::int32_t>> = 0;

    [[nodiscard]] virtual auto values_sv() const -> SvView = 0;
    [[nodiscard]] virtual auto values_mv() const -> MvView = 0;

    /// Rows of this batch that are null; absent when there are none.
    [[nodiscard]] virtual auto null_mask() const -> NullMask = 0;

    /// Typed access. Throws Error(UnsupportedOperation) when T is not the
    /// stored type of this value set.
    template <StoredValue T>
    [[nodiscard]] auto values_sv_as() const -> std::span<const T>;

    template <StoredValue T>
    [[nodiscard]] auto values_mv_as() const -> std::span<const std::vector<T>>;
};

/// A fixed window of rows plus the value sets of the columns it carries.
class ValueBlock {
   public:
    explicit ValueBlock(std::size_t rows) : rows_(rows) {}

    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return rows_; }

    void add_value_set(std::string column, std::shared_ptr<const BlockValueSet> values);

    /// Throws std::out_of_range when the block does not carry `column`.
    [[nodiscard]] auto value_set(const std::string& column) const -> const BlockValueSet&;

    [[nodiscard]] auto contains(const std::string& column) const -> bool {
        return value_sets_.contains(column);
    }

   private:
    std::size_t rows_;
    std::unordered_map<std::string, std::shared_ptr<const BlockValueSet>> value_sets_;
};

// ─── Template definitions ─────────────────────────────────────────────────────

namespace detail {

[[noreturn]] void throw_value_set_type_mismatch(DataType stored, DataType requested,
                                                bool single_value);

}  // namespace detail

template <StoredValue T>
auto BlockValueSet::values_sv_as() const -> std::span<const T> {
    auto view = values_sv();
    if (const auto* typed = std::get_if<std::span<const T>>(&view)) {
        return *typed;
    }
    detail::throw_value_set_type_mismatch(stored_type(data_type()), stored_type_of_v<T>, true);
}

template <StoredValue T>
auto BlockValueSet::values_mv_as() const -> std::span<const std::vector<T>> {
    auto view = values_mv();
    if (const auto* typed = std::get_if<std::span<const std::vector<T>>>(&view)) {
        return *typed;
    }
    detail::throw_value_set_type_mismatch(stored_type(data_type()), stored_type_of_v<T>, false);
}

}  // namespace colmat
