#include <colmat/core/convert.hpp>
#include <colmat/core/error.hpp>
#include <colmat/transform/transform_function.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace colmat::transform {

namespace {

template <typename T>
auto first_rows(std::span<const T> values, std::size_t rows, std::string_view what,
                const std::string& name) -> std::span<const T> {
    if (values.size() < rows) {
        throw std::out_of_range(fmt::format("transform '{}': {} has {} entries for a block of {} rows",
                                            name, what, values.size(), rows));
    }
    return values.first(rows);
}

[[noreturn]] void throw_illegal_conversion(const std::string& name, const ResultMetadata& metadata,
                                           DataType target, Cardinality cardinality) {
    throw Error(ErrorCode::IllegalConversion,
                fmt::format("transform '{}' of type {} {} cannot be read as {} {}", name,
                            data_type_name(metadata.data_type),
                            cardinality_name(metadata.cardinality), data_type_name(target),
                            cardinality_name(cardinality)));
}

[[noreturn]] void throw_missing_producer(const std::string& name, const ResultMetadata& metadata) {
    throw Error(ErrorCode::MissingNativeProducer,
                fmt::format("transform '{}' has no producer for its native type {} {}", name,
                            data_type_name(metadata.stored_type()),
                            cardinality_name(metadata.cardinality)));
}

}  // namespace

// ─── NativeProducers ──────────────────────────────────────────────────────────

auto NativeProducers::has(DataType stored, Cardinality cardinality) const -> bool {
    bool found = false;
    dispatch_stored_type(stored, [&](auto tag) {
        using T = typename decltype(tag)::type;
        found = cardinality == Cardinality::SingleValue ? find_sv<T>() != nullptr
                                                        : find_mv<T>() != nullptr;
    });
    return found;
}

auto NativeProducers::empty() const -> bool {
    return std::apply(
        [](const auto&... slot) { return ((!slot.sv && !slot.mv) && ...); }, slots_);
}

// ─── TransformFunction ────────────────────────────────────────────────────────

TransformFunction::TransformFunction(TransformDefinition definition)
    : name_(std::move(definition.name)),
      metadata_(definition.metadata),
      producers_(std::move(definition.producers)),
      arguments_(std::move(definition.arguments)),
      dictionary_(std::move(definition.dictionary)) {
    validate();
    spdlog::debug("transform '{}': {} {}{}, {} argument(s)", name_,
                  data_type_name(metadata_.data_type), cardinality_name(metadata_.cardinality),
                  metadata_.has_dictionary ? " dictionary-encoded" : "", arguments_.size());
}

void TransformFunction::validate() const {
    for (const auto& argument : arguments_) {
        if (argument == nullptr) {
            throw std::invalid_argument(fmt::format("transform '{}' has a null argument", name_));
        }
    }
    if (metadata_.has_dictionary) {
        if (dictionary_ == nullptr) {
            throw Error(ErrorCode::MissingNativeProducer,
                        fmt::format("dictionary-encoded transform '{}' has no dictionary", name_));
        }
        const bool has_ids = metadata_.is_single_value()
                                 ? producers_.dictionary_ids_sv_producer() != nullptr
                                 : producers_.dictionary_ids_mv_producer() != nullptr;
        if (!has_ids) {
            throw Error(ErrorCode::MissingNativeProducer,
                        fmt::format("dictionary-encoded transform '{}' has no {} id producer",
                                    name_, cardinality_name(metadata_.cardinality)));
        }
        return;
    }
    if (dictionary_ != nullptr) {
        throw std::invalid_argument(
            fmt::format("transform '{}' carries a dictionary but is not dictionary-encoded", name_));
    }
    if (metadata_.stored_type() == DataType::Unknown) {
        return;
    }
    if (!producers_.has(metadata_.stored_type(), metadata_.cardinality)) {
        throw_missing_producer(name_, metadata_);
    }
}

void TransformFunction::require_cardinality(Cardinality requested, DataType target) const {
    if (metadata_.cardinality != requested) {
        throw_illegal_conversion(name_, metadata_, target, requested);
    }
}

auto TransformFunction::dictionary_ids_sv(const ValueBlock& block) -> std::span<const std::int32_t> {
    const auto* producer = producers_.dictionary_ids_sv_producer();
    if (!metadata_.has_dictionary || producer == nullptr) {
        throw Error(ErrorCode::UnsupportedOperation,
                    fmt::format("transform '{}' has no single-valued dictionary ids", name_));
    }
    return (*producer)(block);
}

auto TransformFunction::dictionary_ids_mv(const ValueBlock& block)
    -> std::span<const std::vector<std::int32_t>> {
    const auto* producer = producers_.dictionary_ids_mv_producer();
    if (!metadata_.has_dictionary || producer == nullptr) {
        throw Error(ErrorCode::UnsupportedOperation,
                    fmt::format("transform '{}' has no multi-valued dictionary ids", name_));
    }
    return (*producer)(block);
}

auto TransformFunction::null_mask(const ValueBlock& block) -> NullMask {
    if (const auto* producer = producers_.null_mask_producer()) {
        auto mask = (*producer)(block);
        mask.normalize();
        return mask;
    }
    if (metadata_.stored_type() == DataType::Unknown) {
        return NullMask::all_null(block.row_count());
    }
    NullMask mask;
    for (const auto& argument : arguments_) {
        mask.union_with(argument->null_mask(block));
    }
    mask.normalize();
    return mask;
}

// ─── Unmasked reads ───────────────────────────────────────────────────────────

template <StoredValue T>
auto TransformFunction::values_sv(const ValueBlock& block) -> std::span<const T> {
    if (const auto* producer = producers_.find_sv<T>()) {
        return first_rows((*producer)(block), block.row_count(), "native values", name_);
    }
    const auto rows = block.row_count();
    if (metadata_.stored_type() == DataType::Unknown) {
        auto out = scratch_.sv<T>(rows);
        std::fill(out.begin(), out.end(), null_placeholder<T>());
        return out;
    }
    require_cardinality(Cardinality::SingleValue, stored_type_of_v<T>);
    auto out = scratch_.sv<T>(rows);
    if (metadata_.has_dictionary) {
        auto ids = first_rows(dictionary_ids_sv(block), rows, "dictionary ids", name_);
        dictionary_->read_values(ids, out);
        return out;
    }
    derive_sv<T>(block, out);
    return out;
}

template <StoredValue T>
auto TransformFunction::values_mv(const ValueBlock& block) -> std::span<const std::vector<T>> {
    if (const auto* producer = producers_.find_mv<T>()) {
        return first_rows((*producer)(block), block.row_count(), "native rows", name_);
    }
    const auto rows = block.row_count();
    if (metadata_.stored_type() == DataType::Unknown) {
        auto out = scratch_.mv<T>(rows);
        for (auto& row : out) {
            row.clear();
        }
        return out;
    }
    require_cardinality(Cardinality::MultiValue, stored_type_of_v<T>);
    auto out = scratch_.mv<T>(rows);
    if (metadata_.has_dictionary) {
        auto ids = first_rows(dictionary_ids_mv(block), rows, "dictionary ids", name_);
        for (std::size_t row = 0; row < rows; ++row) {
            out[row].resize(ids[row].size());
            dictionary_->read_values(ids[row], std::span<T>(out[row]));
        }
        return out;
    }
    derive_mv<T>(block, out);
    return out;
}

template <StoredValue T>
void TransformFunction::derive_sv(const ValueBlock& block, std::span<T> out) {
    const auto source = metadata_.stored_type();
    const bool stored = dispatch_stored_type(source, [&](auto tag) {
        using S = typename decltype(tag)::type;
        if constexpr (std::is_same_v<S, T>) {
            throw_missing_producer(name_, metadata_);
        } else if constexpr (is_convertible_v<S, T>) {
            auto values = first_rows(values_sv<S>(block), out.size(), "native values", name_);
            convert_values<S, T>(values, out);
        } else {
            throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>,
                                     Cardinality::SingleValue);
        }
    });
    if (!stored) {
        throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>, Cardinality::SingleValue);
    }
}

template <StoredValue T>
void TransformFunction::derive_mv(const ValueBlock& block, std::span<std::vector<T>> out) {
    const auto source = metadata_.stored_type();
    const bool stored = dispatch_stored_type(source, [&](auto tag) {
        using S = typename decltype(tag)::type;
        if constexpr (std::is_same_v<S, T>) {
            throw_missing_producer(name_, metadata_);
        } else if constexpr (is_convertible_v<S, T>) {
            auto rows = first_rows(values_mv<S>(block), out.size(), "native rows", name_);
            convert_rows<S, T>(rows, out);
        } else {
            throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>,
                                     Cardinality::MultiValue);
        }
    });
    if (!stored) {
        throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>, Cardinality::MultiValue);
    }
}

// ─── Masked reads ─────────────────────────────────────────────────────────────
//  The native type pairs its values with null_mask(). Any other type converts
//  the masked native array and forwards its mask unchanged; the placeholders
//  written for null rows are converted like every other value.

template <StoredValue T>
auto TransformFunction::values_sv_with_null(const ValueBlock& block)
    -> WithNull<std::span<const T>> {
    const auto rows = block.row_count();
    const auto source = metadata_.stored_type();
    if (source == DataType::Unknown) {
        auto out = scratch_.sv<T>(rows);
        std::fill(out.begin(), out.end(), null_placeholder<T>());
        return {out, NullMask::all_null(rows)};
    }
    if (source == stored_type_of_v<T>) {
        auto values = values_sv<T>(block);
        return {values, null_mask(block)};
    }
    require_cardinality(Cardinality::SingleValue, stored_type_of_v<T>);
    WithNull<std::span<const T>> result;
    const bool stored = dispatch_stored_type(source, [&](auto tag) {
        using S = typename decltype(tag)::type;
        if constexpr (!std::is_same_v<S, T> && is_convertible_v<S, T>) {
            auto native = values_sv_with_null<S>(block);
            auto out = scratch_.sv<T>(rows);
            convert_values<S, T>(first_rows(native.values, rows, "native values", name_), out);
            result = {out, std::move(native.nulls)};
        } else {
            throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>,
                                     Cardinality::SingleValue);
        }
    });
    if (!stored) {
        throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>, Cardinality::SingleValue);
    }
    return result;
}

template <StoredValue T>
auto TransformFunction::values_mv_with_null(const ValueBlock& block)
    -> WithNull<std::span<const std::vector<T>>> {
    const auto rows = block.row_count();
    const auto source = metadata_.stored_type();
    if (source == DataType::Unknown) {
        auto out = scratch_.mv<T>(rows);
        for (auto& row : out) {
            row.clear();
        }
        return {out, NullMask::all_null(rows)};
    }
    if (source == stored_type_of_v<T>) {
        auto values = values_mv<T>(block);
        return {values, null_mask(block)};
    }
    require_cardinality(Cardinality::MultiValue, stored_type_of_v<T>);
    WithNull<std::span<const std::vector<T>>> result;
    const bool stored = dispatch_stored_type(source, [&](auto tag) {
        using S = typename decltype(tag)::type;
        if constexpr (!std::is_same_v<S, T> && is_convertible_v<S, T>) {
            auto native = values_mv_with_null<S>(block);
            auto out = scratch_.mv<T>(rows);
            convert_rows<S, T>(first_rows(native.values, rows, "native rows", name_), out);
            result = {out, std::move(native.nulls)};
        } else {
            throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>,
                                     Cardinality::MultiValue);
        }
    });
    if (!stored) {
        throw_illegal_conversion(name_, metadata_, stored_type_of_v<T>, Cardinality::MultiValue);
    }
    return result;
}

// ─── Explicit instantiations ──────────────────────────────────────────────────

template auto TransformFunction::values_sv<std::int32_t>(const ValueBlock&)
    -> std::span<const std::int32_t>;
template auto TransformFunction::values_mv<std::int32_t>(const ValueBlock&)
    -> std::span<const std::vector<std::int32_t>>;
template auto TransformFunction::values_sv_with_null<std::int32_t>(const ValueBlock&)
    -> WithNull<std::span<const std::int32_t>>;
template auto TransformFunction::values_mv_with_null<std::int32_t>(const ValueBlock&)
    -> WithNull<std::span<const std::vector<std::int32_t>>>;

template auto TransformFunction::values_sv<std::int64_t>(const ValueBlock&)
    -> std::span<const std::int64_t>;
template auto TransformFunction::values_mv<std::int64_t>(const ValueBlock&)
    -> std::span<const std::vector<std::int64_t>>;
template auto TransformFunction::values_sv_with_null<std::int64_t>(const ValueBlock&)
    -> WithNull<std::span<const std::int64_t>>;
template auto TransformFunction::values_mv_with_null<std::int64_t>(const ValueBlock&)
    -> WithNull<std::span<const std::vector<std::int64_t>>>;

template auto TransformFunction::values_sv<float>(const ValueBlock&) -> std::span<const float>;
template auto TransformFunction::values_mv<float>(const ValueBlock&)
    -> std::span<const std::vector<float>>;
template auto TransformFunction::values_sv_with_null<float>(const ValueBlock&)
    -> WithNull<std::span<const float>>;
template auto TransformFunction::values_mv_with_null<float>(const ValueBlock&)
    -> WithNull<std::span<const std::vector<float>>>;

template auto TransformFunction::values_sv<double>(const ValueBlock&) -> std::span<const double>;
template auto TransformFunction::values_mv<double>(const ValueBlock&)
    -> std::span<const std::vector<double>>;
template auto TransformFunction::values_sv_with_null<double>(const ValueBlock&)
    -> WithNull<std::span<const double>>;
template auto TransformFunction::values_mv_with_null<double>(const ValueBlock&)
    -> WithNull<std::span<const std::vector<double>>>;

template auto TransformFunction::values_sv<Decimal>(const ValueBlock&) -> std::span<const Decimal>;
template auto TransformFunction::values_mv<Decimal>(const ValueBlock&)
    -> std::span<const std::vector<Decimal>>;
template auto TransformFunction::values_sv_with_null<Decimal>(const ValueBlock&)
    -> WithNull<std::span<const Decimal>>;
template auto TransformFunction::values_mv_with_null<Decimal>(const ValueBlock&)
    -> WithNull<std::span<const std::vector<Decimal>>>;

template auto TransformFunction::values_sv<std::string>(const ValueBlock&)
    -> std::span<const std::string>;
template auto TransformFunction::values_mv<std::string>(const ValueBlock&)
    -> std::span<const std::vector<std::string>>;
template auto TransformFunction::values_sv_with_null<std::string>(const ValueBlock&)
    -> WithNull<std::span<const std::string>>;
template auto TransformFunction::values_mv_with_null<std::string>(const ValueBlock&)
    -> WithNull<std::span<const std::vector<std::string>>>;

template auto TransformFunction::values_sv<Bytes>(const ValueBlock&) -> std::span<const Bytes>;
template auto TransformFunction::values_mv<Bytes>(const ValueBlock&)
    -> std::span<const std::vector<Bytes>>;
template auto TransformFunction::values_sv_with_null<Bytes>(const ValueBlock&)
    -> WithNull<std::span<const Bytes>>;
template auto TransformFunction::values_mv_with_null<Bytes>(const ValueBlock&)
    -> WithNull<std::span<const std::vector<Bytes>>>;

}  // namespace colmat::transform
