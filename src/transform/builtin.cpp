#include <colmat/transform/builtin.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace colmat::transform {

auto make_column_transform(std::string column, ColumnContext context) -> TransformFunctionPtr {
    if (context.dictionary != nullptr &&
        stored_type(context.dictionary->value_type()) != stored_type(context.data_type)) {
        throw std::invalid_argument(fmt::format(
            "column '{}' of type {} has a dictionary of {}", column,
            data_type_name(context.data_type), data_type_name(context.dictionary->value_type())));
    }

    NativeProducers producers;
    producers.null_mask(
        [column](const ValueBlock& block) { return block.value_set(column).null_mask(); });

    const bool dictionary_encoded = context.dictionary != nullptr;
    if (dictionary_encoded) {
        if (context.single_value) {
            producers.dictionary_ids_sv(
                [column](const ValueBlock& block) { return block.value_set(column).dictionary_ids_sv(); });
        } else {
            producers.dictionary_ids_mv(
                [column](const ValueBlock& block) { return block.value_set(column).dictionary_ids_mv(); });
        }
    } else {
        dispatch_stored_type(stored_type(context.data_type), [&](auto tag) {
            using T = typename decltype(tag)::type;
            if (context.single_value) {
                producers.sv<T>([column](const ValueBlock& block) {
                    return block.value_set(column).values_sv_as<T>();
                });
            } else {
                producers.mv<T>([column](const ValueBlock& block) {
                    return block.value_set(column).values_mv_as<T>();
                });
            }
        });
    }

    return std::make_shared<TransformFunction>(TransformDefinition{
        .name = std::move(column),
        .metadata = result_metadata(context.data_type, context.single_value, dictionary_encoded),
        .producers = std::move(producers),
        .arguments = {},
        .dictionary = std::move(context.dictionary),
    });
}

auto make_null_literal_transform() -> TransformFunctionPtr {
    return std::make_shared<TransformFunction>(TransformDefinition{
        .name = "null",
        .metadata = result_metadata(DataType::Unknown, true),
        .producers = {},
        .arguments = {},
        .dictionary = nullptr,
    });
}

}  // namespace colmat::transform
