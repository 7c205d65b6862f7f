#pragma once

#include <colmat/core/decimal.hpp>

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace colmat {

/// Variable-length binary value.
using Bytes = std::vector<std::uint8_t>;

/// Logical types a transform can produce.
///
/// Every logical type is stored as one of the seven stored types
/// (Int32, Int64, Float32, Float64, Decimal, String, Bytes); see stored_type().
/// Unknown marks a column whose type could not be determined, such as an
/// all-null literal.
enum class DataType : std::uint8_t {
    Int32,
    Int64,
    Float32,
    Float64,
    Decimal,
    Boolean,
    Timestamp,
    String,
    Json,
    Bytes,
    Unknown,
};

enum class Cardinality : std::uint8_t {
    SingleValue,
    MultiValue,
};

/// Physical representation used for conversion dispatch.
[[nodiscard]] constexpr auto stored_type(DataType type) noexcept -> DataType {
    switch (type) {
        case DataType::Boolean:
            return DataType::Int32;
        case DataType::Timestamp:
            return DataType::Int64;
        case DataType::Json:
            return DataType::String;
        default:
            return type;
    }
}

[[nodiscard]] auto data_type_name(DataType type) noexcept -> std::string_view;

[[nodiscard]] auto cardinality_name(Cardinality cardinality) noexcept -> std::string_view;

/// Shape of a transform's result. Fixed for the lifetime of the transform.
struct ResultMetadata {
    DataType data_type = DataType::Unknown;
    Cardinality cardinality = Cardinality::SingleValue;
    bool has_dictionary = false;

    [[nodiscard]] constexpr auto is_single_value() const noexcept -> bool {
        return cardinality == Cardinality::SingleValue;
    }

    [[nodiscard]] constexpr auto stored_type() const noexcept -> DataType {
        return colmat::stored_type(data_type);
    }

    auto operator==(const ResultMetadata&) const -> bool = default;
};

[[nodiscard]] constexpr auto result_metadata(DataType type, bool single_value,
                                             bool has_dictionary = false) noexcept
    -> ResultMetadata {
    return ResultMetadata{
        .data_type = type,
        .cardinality = single_value ? Cardinality::SingleValue : Cardinality::MultiValue,
        .has_dictionary = has_dictionary,
    };
}

// ─── Stored value types ───────────────────────────────────────────────────────

template <typename T>
struct StoredTypeOf;

template <>
struct StoredTypeOf<std::int32_t> {
    static constexpr DataType value = DataType::Int32;
};

template <>
struct StoredTypeOf<std::int64_t> {
    static constexpr DataType value = DataType::Int64;
};

template <>
struct StoredTypeOf<float> {
    static constexpr DataType value = DataType::Float32;
};

template <>
struct StoredTypeOf<double> {
    static constexpr DataType value = DataType::Float64;
};

template <>
struct StoredTypeOf<Decimal> {
    static constexpr DataType value = DataType::Decimal;
};

template <>
struct StoredTypeOf<std::string> {
    static constexpr DataType value = DataType::String;
};

template <>
struct StoredTypeOf<Bytes> {
    static constexpr DataType value = DataType::Bytes;
};

/// Concept satisfied by the C++ value type of each stored type.
template <typename T>
concept StoredValue = requires {
    { StoredTypeOf<T>::value } -> std::convertible_to<DataType>;
};

template <StoredValue T>
inline constexpr DataType stored_type_of_v = StoredTypeOf<T>::value;

/// Value written in place of an unknown (null) value.
template <StoredValue T>
[[nodiscard]] auto null_placeholder() -> T {
    return T{};
}

/// Invoke `fn(std::type_identity<T>{})` with the C++ type of a stored type.
/// Returns false (without calling `fn`) when `stored` is not a stored type.
template <typename F>
auto dispatch_stored_type(DataType stored, F&& fn) -> bool {
    switch (stored) {
        case DataType::Int32:
            fn(std::type_identity<std::int32_t>{});
            return true;
        case DataType::Int64:
            fn(std::type_identity<std::int64_t>{});
            return true;
        case DataType::Float32:
            fn(std::type_identity<float>{});
            return true;
        case DataType::Float64:
            fn(std::type_identity<double>{});
            return true;
        case DataType::Decimal:
            fn(std::type_identity<Decimal>{});
            return true;
        case DataType::String:
            fn(std::type_identity<std::string>{});
            return true;
        case DataType::Bytes:
            fn(std::type_identity<Bytes>{});
            return true;
        default:
            return false;
    }
}

}  // namespace colmat
