#include <colmat/core/error.hpp>
#include <colmat/core/types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace colmat;

TEST_CASE("Stored type of each logical type", "[core][types]") {
    REQUIRE(stored_type(DataType::Int32) == DataType::Int32);
    REQUIRE(stored_type(DataType::Int64) == DataType::Int64);
    REQUIRE(stored_type(DataType::Float32) == DataType::Float32);
    REQUIRE(stored_type(DataType::Float64) == DataType::Float64);
    REQUIRE(stored_type(DataType::Decimal) == DataType::Decimal);
    REQUIRE(stored_type(DataType::String) == DataType::String);
    REQUIRE(stored_type(DataType::Bytes) == DataType::Bytes);
    REQUIRE(stored_type(DataType::Unknown) == DataType::Unknown);

    SECTION("logical types map onto a physical representation") {
        REQUIRE(stored_type(DataType::Boolean) == DataType::Int32);
        REQUIRE(stored_type(DataType::Timestamp) == DataType::Int64);
        REQUIRE(stored_type(DataType::Json) == DataType::String);
    }
}

TEST_CASE("Result metadata", "[core][types]") {
    constexpr auto metadata = result_metadata(DataType::Timestamp, false);
    static_assert(metadata.stored_type() == DataType::Int64);
    static_assert(!metadata.is_single_value());

    REQUIRE(metadata.cardinality == Cardinality::MultiValue);
    REQUIRE_FALSE(metadata.has_dictionary);
    REQUIRE(result_metadata(DataType::String, true, true).has_dictionary);
    REQUIRE(result_metadata(DataType::Int32, true) == result_metadata(DataType::Int32, true));
    REQUIRE_FALSE(result_metadata(DataType::Int32, true) == result_metadata(DataType::Int32, false));
}

TEST_CASE("Type names", "[core][types]") {
    REQUIRE(data_type_name(DataType::Float64) == "FLOAT64");
    REQUIRE(data_type_name(DataType::Json) == "JSON");
    REQUIRE(data_type_name(DataType::Unknown) == "UNKNOWN");
    REQUIRE(cardinality_name(Cardinality::SingleValue) == "SV");
    REQUIRE(cardinality_name(Cardinality::MultiValue) == "MV");
    REQUIRE(error_code_name(ErrorCode::IllegalConversion) == "IllegalConversion");
}

TEST_CASE("Dispatch on stored type", "[core][types]") {
    DataType seen = DataType::Unknown;
    auto record = [&](auto tag) {
        using T = typename decltype(tag)::type;
        seen = stored_type_of_v<T>;
    };

    REQUIRE(dispatch_stored_type(DataType::Decimal, record));
    REQUIRE(seen == DataType::Decimal);
    REQUIRE(dispatch_stored_type(DataType::Bytes, record));
    REQUIRE(seen == DataType::Bytes);

    SECTION("non-stored types are rejected") {
        seen = DataType::Unknown;
        REQUIRE_FALSE(dispatch_stored_type(DataType::Boolean, record));
        REQUIRE_FALSE(dispatch_stored_type(DataType::Unknown, record));
        REQUIRE(seen == DataType::Unknown);
    }
}

TEST_CASE("Null placeholders", "[core][types]") {
    REQUIRE(null_placeholder<std::int32_t>() == 0);
    REQUIRE(null_placeholder<double>() == 0.0);
    REQUIRE(null_placeholder<Decimal>() == Decimal::from_int64(0));
    REQUIRE(null_placeholder<std::string>().empty());
    REQUIRE(null_placeholder<Bytes>().empty());
}
