#pragma once

#include <colmat/core/convert.hpp>
#include <colmat/transform/transform_function.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace colmat::transform {

/// What the planner knows about a column before any block is read.
struct ColumnContext {
    DataType data_type = DataType::Unknown;
    bool single_value = true;
    /// Set for dictionary-encoded columns.
    std::shared_ptr<const Dictionary> dictionary;
};

/// Reads `column` from each block's value set.
///
/// Dictionary-encoded columns produce ids only and decode through the
/// dictionary; plain columns produce their stored type directly. The null
/// mask is the value set's own.
[[nodiscard]] auto make_column_transform(std::string column, ColumnContext context)
    -> TransformFunctionPtr;

/// Single-valued constant. `type` may be any logical type stored as T.
template <StoredValue T>
[[nodiscard]] auto make_literal_transform(T value, DataType type = stored_type_of_v<T>)
    -> TransformFunctionPtr {
    auto buffer = std::make_shared<std::vector<T>>();
    NativeProducers producers;
    producers.sv<T>([value, buffer](const ValueBlock& block) -> std::span<const T> {
        if (buffer->size() < block.row_count()) {
            buffer->resize(block.row_count(), value);
        }
        return std::span<const T>(*buffer).first(block.row_count());
    });
    return std::make_shared<TransformFunction>(TransformDefinition{
        .name = "literal(" + convert_value<T, std::string>(value) + ")",
        .metadata = result_metadata(type, true),
        .producers = std::move(producers),
        .arguments = {},
        .dictionary = nullptr,
    });
}

/// Untyped null constant: every row is null.
[[nodiscard]] auto make_null_literal_transform() -> TransformFunctionPtr;

}  // namespace colmat::transform
