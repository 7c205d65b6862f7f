#include <colmat/core/memory_dictionary.hpp>
#include <colmat/core/memory_value_set.hpp>
#include <colmat/distinct/distinct_executor.hpp>
#include <colmat/transform/builtin.hpp>

#include <fmt/core.h>

#include <memory>
#include <string>
#include <vector>

auto main() -> int {
    // One block of five rows: a price column with a null, and a
    // dictionary-encoded symbol column.
    colmat::ValueBlock block(5);
    block.add_value_set("price", colmat::MemoryValueSet::single_value<double>(
                                     {100.5, 200.25, 0.0, 175.0, 100.5},
                                     colmat::NullMask::from_rows(5, std::vector<std::uint32_t>{2})));

    auto symbols = std::make_shared<colmat::MemoryDictionary<std::string>>(
        std::vector<std::string>{"AAPL", "MSFT", "NVDA"});
    block.add_value_set("symbol", colmat::MemoryValueSet::dictionary_sv(symbols, {0, 2, 1, 0, 2}));

    fmt::print("=== Coercion ===\n");

    auto price = colmat::transform::make_column_transform(
        "price", colmat::transform::ColumnContext{.data_type = colmat::DataType::Float64});

    auto as_int = price->values_sv<std::int64_t>(block);
    auto as_text = price->values_sv_with_null<std::string>(block);
    for (std::size_t row = 0; row < block.row_count(); ++row) {
        fmt::print("row {}: int64={} text={}{}\n", row, as_int[row], as_text.values[row],
                   as_text.nulls.contains(row) ? " (null)" : "");
    }

    auto symbol = colmat::transform::make_column_transform(
        "symbol", colmat::transform::ColumnContext{.data_type = colmat::DataType::String,
                                                   .dictionary = symbols});
    auto ids = symbol->dictionary_ids_sv(block);
    auto names = symbol->values_sv<std::string>(block);
    fmt::print("first symbol: id={} value={}\n", ids[0], names[0]);

    fmt::print("\n=== Distinct ===\n");

    auto executor = colmat::distinct::make_distinct_only_executor(
        price, colmat::distinct::DistinctConfig{.limit = 3, .null_handling_enabled = true});
    bool done = executor->process(block);
    fmt::print("limit reached: {}, values: {}, has null: {}\n", done, executor->size(),
               executor->has_null());

    return 0;
}
