#include <colmat/core/block.hpp>
#include <colmat/core/error.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace colmat {

namespace detail {

void throw_value_set_type_mismatch(DataType stored, DataType requested, bool single_value) {
    throw Error(ErrorCode::UnsupportedOperation,
                fmt::format("cannot read {} {} value set as {}",
                            cardinality_name(single_value ? Cardinality::SingleValue
                                                          : Cardinality::MultiValue),
                            data_type_name(stored), data_type_name(requested)));
}

}  // namespace detail

void ValueBlock::add_value_set(std::string column, std::shared_ptr<const BlockValueSet> values) {
    value_sets_.insert_or_assign(std::move(column), std::move(values));
}

auto ValueBlock::value_set(const std::string& column) const -> const BlockValueSet& {
    auto it = value_sets_.find(column);
    if (it == value_sets_.end() || it->second == nullptr) {
        throw std::out_of_range(fmt::format("block has no column '{}'", column));
    }
    return *it->second;
}

}  // namespace colmat
