#include <colmat/core/memory_value_set.hpp>
#include <colmat/distinct/distinct_executor.hpp>
#include <colmat/transform/builtin.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace {

struct BenchOptions {
    std::size_t rows = 1'000'000;
    std::size_t block_size = 10'000;
    std::int64_t cardinality = 1000;
    std::size_t null_every = 0;
    std::size_t limit = 100;
    std::size_t warmup_iters = 1;
    std::size_t iters = 5;
};

struct BenchCase {
    std::string name;
    std::function<std::size_t()> run;
};

/// Deterministic Int64 column split into blocks; every `null_every`-th row is null.
auto make_blocks(const BenchOptions& options) -> std::vector<colmat::ValueBlock> {
    std::vector<colmat::ValueBlock> blocks;
    for (std::size_t start = 0; start < options.rows; start += options.block_size) {
        auto rows = std::min(options.block_size, options.rows - start);
        std::vector<std::int64_t> values(rows);
        colmat::NullMask nulls;
        for (std::size_t i = 0; i < rows; ++i) {
            auto row = static_cast<std::uint64_t>(start + i);
            values[i] = static_cast<std::int64_t>((row * 2654435761ULL) %
                                                  static_cast<std::uint64_t>(options.cardinality));
            if (options.null_every != 0 && (start + i) % options.null_every == 0) {
                nulls.mark(i);
                values[i] = 0;
            }
        }
        colmat::ValueBlock block(rows);
        block.add_value_set(
            "value", colmat::MemoryValueSet::single_value<std::int64_t>(std::move(values),
                                                                        std::move(nulls)));
        blocks.push_back(std::move(block));
    }
    return blocks;
}

auto run_benchmark(const BenchCase& bench, std::size_t warmup_iters, std::size_t iters) -> int {
    try {
        for (std::size_t i = 0; i < warmup_iters; ++i) {
            (void)bench.run();
        }

        std::size_t last_rows = 0;
        auto start = std::chrono::steady_clock::now();
        for (std::size_t i = 0; i < iters; ++i) {
            last_rows = bench.run();
        }
        auto end = std::chrono::steady_clock::now();

        auto total_ms =
            std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start)
                .count();
        auto avg_ms = total_ms / static_cast<double>(iters);
        fmt::print("bench {}: iters={}, total_ms={:.3f}, avg_ms={:.3f}, rows={}\n", bench.name,
                   iters, total_ms, avg_ms, last_rows);
    } catch (const std::exception& e) {
        fmt::print("error: {} failed: {}\n", bench.name, e.what());
        return 1;
    }
    return 0;
}

template <colmat::StoredValue T>
auto materialize_case(std::string name, const colmat::transform::TransformFunctionPtr& column,
                      const std::vector<colmat::ValueBlock>& blocks) -> BenchCase {
    return BenchCase{
        std::move(name),
        [column, &blocks]() {
            std::size_t rows = 0;
            for (const auto& block : blocks) {
                rows += column->values_sv<T>(block).size();
            }
            return rows;
        },
    };
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"colmat materialization benchmark"};

    BenchOptions options;
    bool verbose = false;
    app.add_option("--rows", options.rows,
                   "Rows to generate. Defaults to COLMAT_BENCH_ROWS, then 1000000.")
        ->check(CLI::PositiveNumber);
    app.add_option("--block-size", options.block_size, "Rows per block")->check(CLI::PositiveNumber);
    app.add_option("--cardinality", options.cardinality, "Distinct values in the column")
        ->check(CLI::PositiveNumber);
    app.add_option("--null-every", options.null_every, "Mark every Nth row null (0: no nulls)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--limit", options.limit, "Distinct limit")->check(CLI::PositiveNumber);
    app.add_option("--warmup", options.warmup_iters, "Warmup iterations")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--iters", options.iters, "Measured iterations")->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (app.count("--rows") == 0) {
        const char* env = std::getenv("COLMAT_BENCH_ROWS");
        if (env != nullptr) {
            try {
                options.rows = std::stoull(env);
            } catch (const std::exception& e) {
                fmt::print("error: invalid COLMAT_BENCH_ROWS '{}': {}\n", env, e.what());
                return 1;
            }
        }
    }

    spdlog::info("generating {} rows in blocks of {}", options.rows, options.block_size);
    auto blocks = make_blocks(options);
    auto column = colmat::transform::make_column_transform(
        "value", colmat::transform::ColumnContext{.data_type = colmat::DataType::Int64});

    std::vector<BenchCase> benches;
    benches.push_back(materialize_case<std::int64_t>("native_int64", column, blocks));
    benches.push_back(materialize_case<std::int32_t>("int64_to_int32", column, blocks));
    benches.push_back(materialize_case<double>("int64_to_float64", column, blocks));
    benches.push_back(materialize_case<std::string>("int64_to_string", column, blocks));
    benches.push_back(materialize_case<colmat::Decimal>("int64_to_decimal", column, blocks));
    benches.push_back(BenchCase{
        "masked_int64_to_string",
        [column, &blocks]() {
            std::size_t nulls = 0;
            for (const auto& block : blocks) {
                nulls += column->values_sv_with_null<std::string>(block).nulls.count();
            }
            return nulls;
        },
    });
    benches.push_back(BenchCase{
        "distinct_int64",
        [column, &blocks, &options]() {
            auto executor = colmat::distinct::make_distinct_only_executor(
                column, colmat::distinct::DistinctConfig{.limit = options.limit,
                                                         .null_handling_enabled =
                                                             options.null_every != 0});
            std::size_t processed = 0;
            for (const auto& block : blocks) {
                processed += block.row_count();
                if (executor->process(block)) {
                    break;
                }
            }
            return processed;
        },
    });

    for (const auto& bench : benches) {
        if (run_benchmark(bench, options.warmup_iters, options.iters) != 0) {
            return 1;
        }
    }
    return 0;
}
