#include <colmat/core/null_mask.hpp>

#include <algorithm>

namespace colmat {

auto NullMask::all_null(std::size_t rows) -> NullMask {
    NullMask mask;
    mask.bits_.emplace(rows, true);
    return mask;
}

auto NullMask::from_rows(std::size_t rows, std::span<const std::uint32_t> null_rows) -> NullMask {
    NullMask mask;
    mask.bits_.emplace(rows, false);
    for (auto row : null_rows) {
        mask.mark(row);
    }
    mask.normalize();
    return mask;
}

auto NullMask::count() const noexcept -> std::size_t {
    if (!bits_.has_value()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count(bits_->begin(), bits_->end(), true));
}

auto NullMask::null_rows() const -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> rows;
    if (!bits_.has_value()) {
        return rows;
    }
    for (std::size_t i = 0; i < bits_->size(); ++i) {
        if ((*bits_)[i]) {
            rows.push_back(static_cast<std::uint32_t>(i));
        }
    }
    return rows;
}

void NullMask::mark(std::size_t row) {
    if (!bits_.has_value()) {
        bits_.emplace();
    }
    if (row >= bits_->size()) {
        bits_->resize(row + 1, false);
    }
    (*bits_)[row] = true;
}

auto NullMask::union_with(const NullMask& other) -> NullMask& {
    if (!other.bits_.has_value()) {
        return *this;
    }
    if (!bits_.has_value()) {
        bits_ = other.bits_;
        return *this;
    }
    if (bits_->size() < other.bits_->size()) {
        bits_->resize(other.bits_->size(), false);
    }
    for (std::size_t i = 0; i < other.bits_->size(); ++i) {
        if ((*other.bits_)[i]) {
            (*bits_)[i] = true;
        }
    }
    return *this;
}

void NullMask::normalize() {
    if (bits_.has_value() && std::find(bits_->begin(), bits_->end(), true) == bits_->end()) {
        bits_.reset();
    }
}

auto NullMask::operator==(const NullMask& other) const -> bool {
    if (is_absent() || other.is_absent()) {
        return is_absent() == other.is_absent();
    }
    return null_rows() == other.null_rows();
}

}  // namespace colmat
