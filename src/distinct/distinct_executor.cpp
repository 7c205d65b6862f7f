#include <colmat/distinct/distinct_executor.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace colmat::distinct {

namespace {

constexpr std::size_t kMaxInitialCapacity = 10000;

}  // namespace

template <StoredValue T>
RawDistinctOnlyExecutor<T>::RawDistinctOnlyExecutor(transform::TransformFunctionPtr expression,
                                                    DistinctConfig config)
    : expression_(std::move(expression)), config_(config) {
    if (expression_ == nullptr) {
        throw std::invalid_argument("distinct executor needs an expression");
    }
    if (config_.limit < 1) {
        throw std::invalid_argument(
            fmt::format("distinct limit must be at least 1, got {}", config_.limit));
    }
    values_.reserve(std::min(config_.limit, kMaxInitialCapacity));
}

template <StoredValue T>
auto RawDistinctOnlyExecutor<T>::process(const ValueBlock& block) -> bool {
    if (!expression_->result_metadata().is_single_value()) {
        return process_mv(block);
    }
    if (config_.null_handling_enabled) {
        return process_sv_with_null(block);
    }
    return process_sv(block);
}

template <StoredValue T>
auto RawDistinctOnlyExecutor<T>::process_sv(const ValueBlock& block) -> bool {
    auto values = expression_->values_sv<T>(block);
    const auto rows = std::min(block.row_count(), values.size());
    for (std::size_t row = 0; row < rows; ++row) {
        values_.insert(values[row]);
        if (limit_reached(config_.limit)) {
            return true;
        }
    }
    return false;
}

template <StoredValue T>
auto RawDistinctOnlyExecutor<T>::process_sv_with_null(const ValueBlock& block) -> bool {
    auto [values, nulls] = expression_->values_sv_with_null<T>(block);
    const auto rows = std::min(block.row_count(), values.size());
    for (std::size_t row = 0; row < rows; ++row) {
        if (nulls.contains(row)) {
            has_null_ = true;
            continue;
        }
        values_.insert(values[row]);
        if (limit_reached(config_.limit - (has_null_ ? 1 : 0))) {
            return true;
        }
    }
    return false;
}

// Multi-valued rows do not track nulls; every element counts.
template <StoredValue T>
auto RawDistinctOnlyExecutor<T>::process_mv(const ValueBlock& block) -> bool {
    auto rows = expression_->values_mv<T>(block);
    const auto count = std::min(block.row_count(), rows.size());
    for (std::size_t row = 0; row < count; ++row) {
        for (const auto& value : rows[row]) {
            values_.insert(value);
            if (limit_reached(config_.limit)) {
                return true;
            }
        }
    }
    return false;
}

template <StoredValue T>
auto RawDistinctOnlyExecutor<T>::limit_reached(std::size_t target) -> bool {
    if (values_.size() < target) {
        return false;
    }
    spdlog::debug("distinct over '{}': {} values reached limit {}{}", expression_->name(),
                  values_.size(), config_.limit, has_null_ ? " (with null)" : "");
    return true;
}

auto make_distinct_only_executor(transform::TransformFunctionPtr expression, DistinctConfig config)
    -> std::unique_ptr<DistinctExecutor> {
    if (expression == nullptr) {
        throw std::invalid_argument("distinct executor needs an expression");
    }
    auto stored = expression->result_metadata().stored_type();
    if (stored == DataType::Unknown) {
        stored = DataType::Int32;
    }
    std::unique_ptr<DistinctExecutor> executor;
    const bool dispatched = dispatch_stored_type(stored, [&](auto tag) {
        using T = typename decltype(tag)::type;
        executor = std::make_unique<RawDistinctOnlyExecutor<T>>(std::move(expression), config);
    });
    if (!dispatched) {
        throw std::invalid_argument(
            fmt::format("no distinct executor for {} values", data_type_name(stored)));
    }
    spdlog::debug("distinct executor for {}: limit {}, null handling {}", data_type_name(stored),
                  config.limit, config.null_handling_enabled ? "on" : "off");
    return executor;
}

template class RawDistinctOnlyExecutor<std::int32_t>;
template class RawDistinctOnlyExecutor<std::int64_t>;
template class RawDistinctOnlyExecutor<float>;
template class RawDistinctOnlyExecutor<double>;
template class RawDistinctOnlyExecutor<Decimal>;
template class RawDistinctOnlyExecutor<std::string>;
template class RawDistinctOnlyExecutor<Bytes>;

}  // namespace colmat::distinct
