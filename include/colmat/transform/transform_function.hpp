#pragma once

#include <colmat/core/block.hpp>
#include <colmat/core/dictionary.hpp>
#include <colmat/core/null_mask.hpp>
#include <colmat/core/types.hpp>
#include <colmat/transform/scratch_arena.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <tuple>
#include <vector>

namespace colmat::transform {

/// Values of one batch paired with the rows that are null.
template <typename Values>
struct WithNull {
    Values values;
    NullMask nulls;
};

template <StoredValue T>
using SvProducer = std::function<std::span<const T>(const ValueBlock&)>;

template <StoredValue T>
using MvProducer = std::function<std::span<const std::vector<T>>(const ValueBlock&)>;

using NullMaskProducer = std::function<NullMask(const ValueBlock&)>;
using DictionaryIdsSvProducer = std::function<std::span<const std::int32_t>(const ValueBlock&)>;
using DictionaryIdsMvProducer =
    std::function<std::span<const std::vector<std::int32_t>>(const ValueBlock&)>;

/// The functions an expression computes directly, keyed by stored type and
/// cardinality. Everything else is derived by TransformFunction.
class NativeProducers {
   public:
    template <StoredValue T>
    auto sv(SvProducer<T> fn) -> NativeProducers& {
        std::get<Slot<T>>(slots_).sv = std::move(fn);
        return *this;
    }

    template <StoredValue T>
    auto mv(MvProducer<T> fn) -> NativeProducers& {
        std::get<Slot<T>>(slots_).mv = std::move(fn);
        return *this;
    }

    /// Native null tracking; replaces the union of the argument masks.
    auto null_mask(NullMaskProducer fn) -> NativeProducers& {
        null_mask_ = std::move(fn);
        return *this;
    }

    auto dictionary_ids_sv(DictionaryIdsSvProducer fn) -> NativeProducers& {
        ids_sv_ = std::move(fn);
        return *this;
    }

    auto dictionary_ids_mv(DictionaryIdsMvProducer fn) -> NativeProducers& {
        ids_mv_ = std::move(fn);
        return *this;
    }

    template <StoredValue T>
    [[nodiscard]] auto find_sv() const -> const SvProducer<T>* {
        const auto& fn = std::get<Slot<T>>(slots_).sv;
        return fn ? &fn : nullptr;
    }

    template <StoredValue T>
    [[nodiscard]] auto find_mv() const -> const MvProducer<T>* {
        const auto& fn = std::get<Slot<T>>(slots_).mv;
        return fn ? &fn : nullptr;
    }

    [[nodiscard]] auto null_mask_producer() const -> const NullMaskProducer* {
        return null_mask_ ? &null_mask_ : nullptr;
    }

    [[nodiscard]] auto dictionary_ids_sv_producer() const -> const DictionaryIdsSvProducer* {
        return ids_sv_ ? &ids_sv_ : nullptr;
    }

    [[nodiscard]] auto dictionary_ids_mv_producer() const -> const DictionaryIdsMvProducer* {
        return ids_mv_ ? &ids_mv_ : nullptr;
    }

    /// Whether a value producer is registered for `stored` x `cardinality`.
    [[nodiscard]] auto has(DataType stored, Cardinality cardinality) const -> bool;

    /// Whether no value producer is registered at all.
    [[nodiscard]] auto empty() const -> bool;

   private:
    template <typename T>
    struct Slot {
        SvProducer<T> sv;
        MvProducer<T> mv;
    };

    std::tuple<Slot<std::int32_t>, Slot<std::int64_t>, Slot<float>, Slot<double>, Slot<Decimal>,
               Slot<std::string>, Slot<Bytes>>
        slots_;
    NullMaskProducer null_mask_;
    DictionaryIdsSvProducer ids_sv_;
    DictionaryIdsMvProducer ids_mv_;
};

class TransformFunction;
using TransformFunctionPtr = std::shared_ptr<TransformFunction>;

/// Everything needed to build a TransformFunction.
struct TransformDefinition {
    std::string name;
    ResultMetadata metadata;
    NativeProducers producers;
    /// Argument transforms; their null masks are unioned by default.
    std::vector<TransformFunctionPtr> arguments;
    /// Required when metadata.has_dictionary is set, forbidden otherwise.
    std::shared_ptr<const Dictionary> dictionary;
};

/// Materializes an expression's values for a batch in any stored type.
///
/// The expression computes its native type through the producers of its
/// definition; every other stored type is derived element-wise from the
/// native array (or decoded through the dictionary when the expression is
/// dictionary-encoded). Results are written into a grow-only ScratchArena
/// owned by this instance, so a returned span stays valid until the next
/// call for the same type and cardinality.
///
/// Construction throws Error(MissingNativeProducer) when the definition
/// cannot produce its own native type. Instances are confined to one thread.
class TransformFunction {
   public:
    explicit TransformFunction(TransformDefinition definition);

    TransformFunction(const TransformFunction&) = delete;
    auto operator=(const TransformFunction&) -> TransformFunction& = delete;

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto result_metadata() const noexcept -> const ResultMetadata& { return metadata_; }
    [[nodiscard]] auto dictionary() const noexcept -> const Dictionary* { return dictionary_.get(); }
    [[nodiscard]] auto arguments() const noexcept -> const std::vector<TransformFunctionPtr>& {
        return arguments_;
    }

    /// Dictionary ids, one per row. Throws Error(UnsupportedOperation) unless
    /// the transform is dictionary-encoded and single-valued.
    [[nodiscard]] auto dictionary_ids_sv(const ValueBlock& block) -> std::span<const std::int32_t>;

    /// Dictionary id sequences, one per row.
    [[nodiscard]] auto dictionary_ids_mv(const ValueBlock& block)
        -> std::span<const std::vector<std::int32_t>>;

    template <StoredValue T>
    [[nodiscard]] auto values_sv(const ValueBlock& block) -> std::span<const T>;

    template <StoredValue T>
    [[nodiscard]] auto values_mv(const ValueBlock& block) -> std::span<const std::vector<T>>;

    template <StoredValue T>
    [[nodiscard]] auto values_sv_with_null(const ValueBlock& block) -> WithNull<std::span<const T>>;

    template <StoredValue T>
    [[nodiscard]] auto values_mv_with_null(const ValueBlock& block)
        -> WithNull<std::span<const std::vector<T>>>;

    /// Null rows of the batch: the native mask when the expression tracks
    /// nulls itself, every row for Unknown, otherwise the union of the
    /// argument masks. Absent when there are no null rows.
    [[nodiscard]] auto null_mask(const ValueBlock& block) -> NullMask;

    [[nodiscard]] auto scratch() const noexcept -> const ScratchArena& { return scratch_; }

   private:
    void validate() const;
    void require_cardinality(Cardinality requested, DataType target) const;

    template <StoredValue T>
    void derive_sv(const ValueBlock& block, std::span<T> out);

    template <StoredValue T>
    void derive_mv(const ValueBlock& block, std::span<std::vector<T>> out);

    std::string name_;
    const ResultMetadata metadata_;
    NativeProducers producers_;
    std::vector<TransformFunctionPtr> arguments_;
    std::shared_ptr<const Dictionary> dictionary_;
    ScratchArena scratch_;
};

}  // namespace colmat::transform
