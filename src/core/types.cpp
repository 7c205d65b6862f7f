#include <colmat/core/types.hpp>

namespace colmat {

auto data_type_name(DataType type) noexcept -> std::string_view {
    switch (type) {
        case DataType::Int32:
            return "INT32";
        case DataType::Int64:
            return "INT64";
        case DataType::Float32:
            return "FLOAT32";
        case DataType::Float64:
            return "FLOAT64";
        case DataType::Decimal:
            return "DECIMAL";
        case DataType::Boolean:
            return "BOOLEAN";
        case DataType::Timestamp:
            return "TIMESTAMP";
        case DataType::String:
            return "STRING";
        case DataType::Json:
            return "JSON";
        case DataType::Bytes:
            return "BYTES";
        case DataType::Unknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

auto cardinality_name(Cardinality cardinality) noexcept -> std::string_view {
    return cardinality == Cardinality::SingleValue ? "SV" : "MV";
}

}  // namespace colmat
