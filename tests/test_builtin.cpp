#include <colmat/core/error.hpp>
#include <colmat/core/memory_dictionary.hpp>
#include <colmat/core/memory_value_set.hpp>
#include <colmat/transform/builtin.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace colmat;
using namespace colmat::transform;

TEST_CASE("Column transform reads its value set", "[transform][builtin]") {
    ValueBlock block(3);
    block.add_value_set("qty", MemoryValueSet::single_value<std::int32_t>(
                                   {4, 5, 6}, NullMask::from_rows(3, std::vector<std::uint32_t>{2})));

    auto column = make_column_transform("qty", ColumnContext{.data_type = DataType::Int32});
    REQUIRE(column->name() == "qty");
    REQUIRE(column->result_metadata() == result_metadata(DataType::Int32, true));

    auto values = column->values_sv<std::int32_t>(block);
    REQUIRE(values.data() == block.value_set("qty").values_sv_as<std::int32_t>().data());

    auto text = column->values_sv_with_null<std::string>(block);
    REQUIRE(text.values[0] == "4");
    REQUIRE(text.nulls.null_rows() == std::vector<std::uint32_t>{2});

    SECTION("missing column") {
        ValueBlock empty(3);
        REQUIRE_THROWS_AS(column->values_sv<std::int32_t>(empty), std::out_of_range);
    }

    SECTION("declared type must match the value set") {
        auto wrong = make_column_transform("qty", ColumnContext{.data_type = DataType::Float64});
        REQUIRE_THROWS_AS(wrong->values_sv<double>(block), Error);
    }
}

TEST_CASE("Multi-valued column", "[transform][builtin]") {
    ValueBlock block(2);
    block.add_value_set("tags", MemoryValueSet::multi_value<std::string>({{"1", "2"}, {"3"}}));

    auto column = make_column_transform(
        "tags", ColumnContext{.data_type = DataType::String, .single_value = false});
    auto rows = column->values_mv<std::int64_t>(block);
    REQUIRE(rows[0] == std::vector<std::int64_t>{1, 2});
    REQUIRE(rows[1] == std::vector<std::int64_t>{3});
    REQUIRE(column->null_mask(block).is_absent());
}

TEST_CASE("Dictionary-encoded column", "[transform][builtin][dictionary]") {
    auto dictionary = std::make_shared<MemoryDictionary<double>>(std::vector<double>{0.5, 1.25});
    ValueBlock block(3);
    block.add_value_set("price", MemoryValueSet::dictionary_sv(dictionary, {1, 1, 0}));

    auto column = make_column_transform(
        "price", ColumnContext{.data_type = DataType::Float64, .dictionary = dictionary});
    REQUIRE(column->result_metadata().has_dictionary);
    REQUIRE(column->dictionary() == dictionary.get());
    REQUIRE(column->dictionary_ids_sv(block)[2] == 0);

    auto native = column->values_sv<double>(block);
    REQUIRE(native[0] == 1.25);

    auto text = column->values_sv<std::string>(block);
    REQUIRE(text[2] == "0.5");

    SECTION("dictionary type must match the column type") {
        REQUIRE_THROWS_AS(make_column_transform("price", ColumnContext{.data_type = DataType::String,
                                                                       .dictionary = dictionary}),
                          std::invalid_argument);
    }
}

TEST_CASE("Literal transform", "[transform][builtin]") {
    auto literal = make_literal_transform<std::string>("7");
    REQUIRE(literal->name() == "literal(7)");

    auto ints = literal->values_sv<std::int32_t>(ValueBlock(4));
    REQUIRE(ints.size() == 4);
    REQUIRE(ints[3] == 7);
    REQUIRE(literal->null_mask(ValueBlock(4)).is_absent());

    SECTION("the constant buffer follows the batch size") {
        auto small = literal->values_sv<std::string>(ValueBlock(2));
        REQUIRE(small.size() == 2);
        auto large = literal->values_sv<std::string>(ValueBlock(6));
        REQUIRE(large.size() == 6);
        REQUIRE(large[5] == "7");
    }

    SECTION("logical type") {
        auto flag = make_literal_transform<std::int32_t>(1, DataType::Boolean);
        REQUIRE(flag->result_metadata().data_type == DataType::Boolean);
        REQUIRE(flag->values_sv<double>(ValueBlock(1))[0] == 1.0);
    }
}

TEST_CASE("Null literal", "[transform][builtin]") {
    auto null = make_null_literal_transform();
    REQUIRE(null->result_metadata().data_type == DataType::Unknown);

    auto masked = null->values_sv_with_null<Decimal>(ValueBlock(2));
    REQUIRE(masked.values[1] == Decimal::from_int64(0));
    REQUIRE(masked.nulls.count() == 2);
}
