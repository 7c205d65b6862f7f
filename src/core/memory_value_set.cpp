#include <colmat/core/error.hpp>
#include <colmat/core/memory_value_set.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace colmat {

namespace {

auto require_dictionary(const std::shared_ptr<const Dictionary>& dictionary) -> DataType {
    if (dictionary == nullptr) {
        throw std::invalid_argument("dictionary-encoded value set needs a dictionary");
    }
    return dictionary->value_type();
}

}  // namespace

auto MemoryValueSet::dictionary_sv(std::shared_ptr<const Dictionary> dictionary,
                                   std::vector<std::int32_t> ids, NullMask nulls)
    -> std::shared_ptr<MemoryValueSet> {
    auto type = require_dictionary(dictionary);
    auto set = std::make_shared<MemoryValueSet>(Passkey{}, type, std::move(nulls));
    bool stored = dispatch_stored_type(stored_type(type), [&](auto tag) {
        using T = typename decltype(tag)::type;
        std::vector<T> values(ids.size());
        dictionary->read_values(ids, std::span<T>(values));
        set->sv_.emplace(std::move(values));
    });
    if (!stored) {
        throw std::invalid_argument(
            fmt::format("dictionary of {} values cannot be decoded", data_type_name(type)));
    }
    set->dictionary_ = std::move(dictionary);
    set->ids_sv_ = std::move(ids);
    return set;
}

auto MemoryValueSet::dictionary_mv(std::shared_ptr<const Dictionary> dictionary,
                                   std::vector<std::vector<std::int32_t>> ids, NullMask nulls)
    -> std::shared_ptr<MemoryValueSet> {
    auto type = require_dictionary(dictionary);
    auto set = std::make_shared<MemoryValueSet>(Passkey{}, type, std::move(nulls));
    bool stored = dispatch_stored_type(stored_type(type), [&](auto tag) {
        using T = typename decltype(tag)::type;
        std::vector<std::vector<T>> rows(ids.size());
        for (std::size_t row = 0; row < ids.size(); ++row) {
            rows[row].resize(ids[row].size());
            dictionary->read_values(ids[row], std::span<T>(rows[row]));
        }
        set->mv_.emplace(std::move(rows));
    });
    if (!stored) {
        throw std::invalid_argument(
            fmt::format("dictionary of {} values cannot be decoded", data_type_name(type)));
    }
    set->dictionary_ = std::move(dictionary);
    set->ids_mv_ = std::move(ids);
    return set;
}

auto MemoryValueSet::dictionary_ids_sv() const -> std::span<const std::int32_t> {
    if (dictionary_ == nullptr || !sv_.has_value()) {
        throw Error(ErrorCode::UnsupportedOperation,
                    fmt::format("{} value set has no single-valued dictionary ids",
                                data_type_name(type_)));
    }
    return ids_sv_;
}

auto MemoryValueSet::dictionary_ids_mv() const -> std::span<const std::vector<std::int32_t>> {
    if (dictionary_ == nullptr || !mv_.has_value()) {
        throw Error(ErrorCode::UnsupportedOperation,
                    fmt::format("{} value set has no multi-valued dictionary ids",
                                data_type_name(type_)));
    }
    return ids_mv_;
}

auto MemoryValueSet::values_sv() const -> SvView {
    if (!sv_.has_value()) {
        throw Error(ErrorCode::UnsupportedOperation,
                    fmt::format("cannot read MV {} value set as SV", data_type_name(type_)));
    }
    return std::visit(
        [](const auto& values) -> SvView {
            using T = typename std::decay_t<decltype(values)>::value_type;
            return std::span<const T>(values);
        },
        *sv_);
}

auto MemoryValueSet::values_mv() const -> MvView {
    if (!mv_.has_value()) {
        throw Error(ErrorCode::UnsupportedOperation,
                    fmt::format("cannot read SV {} value set as MV", data_type_name(type_)));
    }
    return std::visit(
        [](const auto& rows) -> MvView {
            using Row = typename std::decay_t<decltype(rows)>::value_type;
            return std::span<const Row>(rows);
        },
        *mv_);
}

void MemoryValueSet::check_type(DataType stored) const {
    if (stored_type(type_) != stored) {
        throw std::invalid_argument(fmt::format("{} value set cannot hold {} values",
                                                data_type_name(type_), data_type_name(stored)));
    }
}

}  // namespace colmat
