#pragma once

#include <colmat/core/types.hpp>

#include <cstddef>
#include <span>
#include <tuple>
#include <vector>

namespace colmat::transform {

/// Output buffers of one transform: one per stored type and cardinality.
///
/// Buffers grow to the largest batch requested and never shrink; a request
/// that fits the current size reuses the same storage. Not thread-safe: the
/// arena belongs to exactly one transform, which belongs to one thread.
class ScratchArena {
   public:
    /// First `rows` slots of the single-valued buffer for T.
    template <StoredValue T>
    [[nodiscard]] auto sv(std::size_t rows) -> std::span<T> {
        auto& buffer = std::get<Slot<T>>(slots_).sv;
        if (buffer.size() < rows) {
            buffer.resize(rows);
        }
        return std::span<T>(buffer).first(rows);
    }

    /// First `rows` row slots of the multi-valued buffer for T.
    template <StoredValue T>
    [[nodiscard]] auto mv(std::size_t rows) -> std::span<std::vector<T>> {
        auto& buffer = std::get<Slot<T>>(slots_).mv;
        if (buffer.size() < rows) {
            buffer.resize(rows);
        }
        return std::span<std::vector<T>>(buffer).first(rows);
    }

    template <StoredValue T>
    [[nodiscard]] auto sv_capacity() const noexcept -> std::size_t {
        return std::get<Slot<T>>(slots_).sv.size();
    }

    template <StoredValue T>
    [[nodiscard]] auto mv_capacity() const noexcept -> std::size_t {
        return std::get<Slot<T>>(slots_).mv.size();
    }

   private:
    template <typename T>
    struct Slot {
        std::vector<T> sv;
        std::vector<std::vector<T>> mv;
    };

    std::tuple<Slot<std::int32_t>, Slot<std::int64_t>, Slot<float>, Slot<double>, Slot<Decimal>,
               Slot<std::string>, Slot<Bytes>>
        slots_;
};

}  // namespace colmat::transform
