#include <colmat/core/null_mask.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

using colmat::NullMask;

TEST_CASE("Absent mask", "[core][null_mask]") {
    NullMask mask;
    REQUIRE(mask.is_absent());
    REQUIRE(mask.count() == 0);
    REQUIRE_FALSE(mask.contains(0));
    REQUIRE(mask.null_rows().empty());
    REQUIRE(mask == NullMask::absent());
}

TEST_CASE("Mask from rows", "[core][null_mask]") {
    std::vector<std::uint32_t> rows{1, 3};
    auto mask = NullMask::from_rows(5, rows);
    REQUIRE(mask.is_present());
    REQUIRE(mask.count() == 2);
    REQUIRE(mask.contains(1));
    REQUIRE_FALSE(mask.contains(2));
    REQUIRE_FALSE(mask.contains(99));
    REQUIRE(mask.null_rows() == rows);

    SECTION("no null rows normalizes to absent") {
        REQUIRE(NullMask::from_rows(5, {}).is_absent());
    }
}

TEST_CASE("All-null mask", "[core][null_mask]") {
    auto mask = NullMask::all_null(3);
    REQUIRE(mask.count() == 3);
    REQUIRE(mask.null_rows() == std::vector<std::uint32_t>{0, 1, 2});
    REQUIRE(NullMask::all_null(0).is_present());
}

TEST_CASE("Mask union", "[core][null_mask]") {
    NullMask lhs;
    lhs.mark(0);
    NullMask rhs;
    rhs.mark(4);

    SECTION("absent operand changes nothing") {
        NullMask copy = lhs;
        copy.union_with(NullMask::absent());
        REQUIRE(copy == lhs);

        NullMask empty;
        empty.union_with(NullMask::absent());
        REQUIRE(empty.is_absent());
    }

    SECTION("rows of both operands") {
        lhs.union_with(rhs);
        REQUIRE(lhs.null_rows() == std::vector<std::uint32_t>{0, 4});
    }

    SECTION("absent receiver takes the other mask") {
        NullMask target;
        target.union_with(rhs);
        REQUIRE(target == rhs);
    }
}

TEST_CASE("Normalize", "[core][null_mask]") {
    auto mask = NullMask::all_null(0);
    REQUIRE(mask.is_present());
    mask.normalize();
    REQUIRE(mask.is_absent());

    auto kept = NullMask::all_null(2);
    kept.normalize();
    REQUIRE(kept.is_present());
}
