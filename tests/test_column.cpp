#include <tbl/core/column.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

TEST_CASE("Column stores cells by row number", "[core][column]") {
    tbl::Column col{3};
    col.set(1, "a");
    col.set(4, "d");

    SECTION("declared number and size") {
        REQUIRE(col.number() == 3);
        REQUIRE(col.size() == 2);
        REQUIRE_FALSE(col.empty());
    }

    SECTION("present and absent cells") {
        REQUIRE(col.find(1) == "a");
        REQUIRE(col.find(4) == "d");
        REQUIRE_FALSE(col.find(2).has_value());
        REQUIRE(col.contains(4));
        REQUIRE_FALSE(col.contains(3));
    }

    SECTION("value_or_empty reads absent cells as empty") {
        REQUIRE(col.value_or_empty(1) == "a");
        REQUIRE(col.value_or_empty(2).empty());
    }

    SECTION("overwrite keeps a single entry") {
        col.set(1, "z");
        REQUIRE(col.size() == 2);
        REQUIRE(col.find(1) == "z");
    }
}

TEST_CASE("Column records empty text as absent", "[core][column]") {
    tbl::Column col{1};
    col.set(2, "");
    REQUIRE(col.empty());

    col.set(2, "x");
    col.set(2, "");
    REQUIRE_FALSE(col.contains(2));
}

TEST_CASE("Column iterates in ascending row order", "[core][column]") {
    tbl::Column col{1};
    col.set(9, "nine");
    col.set(2, "two");
    col.set(5, "five");

    std::vector<tbl::RowNumber> rows;
    for (const auto& [row, value] : col) {
        rows.push_back(row);
    }
    REQUIRE(rows == std::vector<tbl::RowNumber>{2, 5, 9});
}

TEST_CASE("Column clear keeps the declared number", "[core][column]") {
    tbl::Column col{7};
    col.set(1, "a");
    col.clear();
    REQUIRE(col.empty());
    REQUIRE(col.number() == 7);
}
