#pragma once

#include <colmat/core/block.hpp>
#include <colmat/core/types.hpp>
#include <colmat/transform/transform_function.hpp>

#include <robin_hood.h>

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <type_traits>

namespace colmat::distinct {

struct DistinctConfig {
    /// Number of distinct values after which processing stops. At least 1.
    std::size_t limit = 0;
    /// Track nulls separately; a null counts against the limit.
    bool null_handling_enabled = false;
};

/// Accumulates the distinct values of one expression, block by block.
class DistinctExecutor {
   public:
    virtual ~DistinctExecutor() = default;

    /// Feed one block. Returns true as soon as enough distinct values have
    /// been seen; the caller stops feeding blocks then.
    [[nodiscard]] virtual auto process(const ValueBlock& block) -> bool = 0;

    /// Stored type of the accumulated values.
    [[nodiscard]] virtual auto value_type() const noexcept -> DataType = 0;
    [[nodiscard]] virtual auto size() const noexcept -> std::size_t = 0;
    [[nodiscard]] virtual auto has_null() const noexcept -> bool = 0;
    [[nodiscard]] virtual auto limit() const noexcept -> std::size_t = 0;
};

// ─── Hashing ──────────────────────────────────────────────────────────────────
//  Floating-point values are keyed by their bit pattern with every NaN mapped
//  to one canonical pattern: NaNs share a slot, -0.0 and 0.0 do not.

template <typename F>
    requires std::is_floating_point_v<F>
auto distinct_bits(F value) noexcept {
    using Bits = std::conditional_t<sizeof(F) == sizeof(std::uint32_t), std::uint32_t, std::uint64_t>;
    if (std::isnan(value)) {
        return std::bit_cast<Bits>(std::numeric_limits<F>::quiet_NaN());
    }
    return std::bit_cast<Bits>(value);
}

template <StoredValue T>
struct DistinctHash {
    auto operator()(const T& value) const -> std::size_t {
        if constexpr (std::is_same_v<T, Bytes>) {
            return robin_hood::hash_bytes(value.data(), value.size());
        } else if constexpr (std::is_floating_point_v<T>) {
            return robin_hood::hash<std::uint64_t>{}(distinct_bits(value));
        } else {
            return robin_hood::hash<T>{}(value);
        }
    }
};

template <StoredValue T>
struct DistinctEqual {
    auto operator()(const T& lhs, const T& rhs) const noexcept -> bool {
        if constexpr (std::is_floating_point_v<T>) {
            return distinct_bits(lhs) == distinct_bits(rhs);
        } else {
            return lhs == rhs;
        }
    }
};

template <StoredValue T>
using DistinctSet = robin_hood::unordered_flat_set<T, DistinctHash<T>, DistinctEqual<T>>;

/// Distinct-only accumulator over the raw values of an expression, read
/// through the coercion engine as T.
template <StoredValue T>
class RawDistinctOnlyExecutor final : public DistinctExecutor {
   public:
    /// Throws std::invalid_argument for a null expression or a zero limit.
    RawDistinctOnlyExecutor(transform::TransformFunctionPtr expression, DistinctConfig config);

    [[nodiscard]] auto process(const ValueBlock& block) -> bool override;

    [[nodiscard]] auto value_type() const noexcept -> DataType override {
        return stored_type_of_v<T>;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t override { return values_.size(); }
    [[nodiscard]] auto has_null() const noexcept -> bool override { return has_null_; }
    [[nodiscard]] auto limit() const noexcept -> std::size_t override { return config_.limit; }

    [[nodiscard]] auto values() const noexcept -> const DistinctSet<T>& { return values_; }

   private:
    auto process_sv(const ValueBlock& block) -> bool;
    auto process_sv_with_null(const ValueBlock& block) -> bool;
    auto process_mv(const ValueBlock& block) -> bool;
    auto limit_reached(std::size_t target) -> bool;

    transform::TransformFunctionPtr expression_;
    DistinctConfig config_;
    DistinctSet<T> values_;
    bool has_null_ = false;
};

/// Executor matching the expression's stored type; Unknown reads as Int32.
[[nodiscard]] auto make_distinct_only_executor(transform::TransformFunctionPtr expression,
                                               DistinctConfig config)
    -> std::unique_ptr<DistinctExecutor>;

extern template class RawDistinctOnlyExecutor<std::int32_t>;
extern template class RawDistinctOnlyExecutor<std::int64_t>;
extern template class RawDistinctOnlyExecutor<float>;
extern template class RawDistinctOnlyExecutor<double>;
extern template class RawDistinctOnlyExecutor<Decimal>;
extern template class RawDistinctOnlyExecutor<std::string>;
extern template class RawDistinctOnlyExecutor<Bytes>;

}  // namespace colmat::distinct
