#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace colmat {

/// Which rows of a batch are semantically null.
///
/// A mask is either absent ("provably no nulls", the default and free to
/// pass around) or present (a bitmap, true = null). Absent and
/// present-but-empty are different states; operations that hand a mask back
/// to callers normalize an empty present mask to absent.
class NullMask {
   public:
    NullMask() = default;

    [[nodiscard]] static auto absent() -> NullMask { return NullMask{}; }

    /// Every one of `rows` rows is null.
    [[nodiscard]] static auto all_null(std::size_t rows) -> NullMask;

    /// Mask over `rows` rows with the listed rows null; normalized.
    [[nodiscard]] static auto from_rows(std::size_t rows, std::span<const std::uint32_t> null_rows)
        -> NullMask;

    [[nodiscard]] auto is_absent() const noexcept -> bool { return !bits_.has_value(); }
    [[nodiscard]] auto is_present() const noexcept -> bool { return bits_.has_value(); }

    /// Whether `row` is null. Always false for an absent mask.
    [[nodiscard]] auto contains(std::size_t row) const noexcept -> bool {
        return bits_.has_value() && row < bits_->size() && (*bits_)[row];
    }

    /// Number of null rows.
    [[nodiscard]] auto count() const noexcept -> std::size_t;

    /// Null row indices in increasing order.
    [[nodiscard]] auto null_rows() const -> std::vector<std::uint32_t>;

    /// Mark `row` null, making the mask present.
    void mark(std::size_t row);

    /// Add the null rows of `other`. An absent `other` changes nothing.
    auto union_with(const NullMask& other) -> NullMask&;

    /// Turn a present mask with no null rows into an absent one.
    void normalize();

    auto operator==(const NullMask& other) const -> bool;

   private:
    std::optional<std::vector<bool>> bits_;
};

}  // namespace colmat
