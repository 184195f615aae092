#include <tbl/core/registry.hpp>
#include <tbl/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

auto make_table() -> tbl::Table {
    auto registry = tbl::build_registry(tbl::names_generator({"_A", "_B", "_C", "_D"}));
    REQUIRE(registry.has_value());
    tbl::Table table(std::move(*registry));
    const std::vector<std::string> lines = {"a1|b1|c1|d1", "a2|b2|c2|d2", "a3|b3|c3|d3",
                                            "a4|b4|c4|d4", "a5|b5|c5|d5"};
    REQUIRE(table.load(lines, "|").has_value());
    return table;
}

auto rows(const tbl::Table& table) -> tbl::RowSet {
    return table.get_active_range().value().rows();
}

auto columns(const tbl::Table& table) -> tbl::ColumnSet {
    return table.get_active_range().value().columns();
}

}  // namespace

TEST_CASE("Slice adds and removes rows", "[table][slice]") {
    auto table = make_table();

    REQUIRE(table.slice("-2 -4").has_value());
    REQUIRE(rows(table) == tbl::RowSet{1, 3, 5});

    REQUIRE(table.slice("4 -1").has_value());
    REQUIRE(rows(table) == tbl::RowSet{3, 4, 5});

    REQUIRE(table.slice(std::vector<std::string>{"+2", "-5"}).has_value());
    REQUIRE(rows(table) == tbl::RowSet{2, 3, 4});
}

TEST_CASE("Slice star tokens are applied in order", "[table][slice]") {
    auto table = make_table();

    SECTION("'-* *' yields every row") {
        REQUIRE(table.slice("-3").has_value());
        REQUIRE(table.slice("-* *").has_value());
        REQUIRE(rows(table) == tbl::RowSet{1, 2, 3, 4, 5});
    }

    SECTION("'* -*' yields no rows") {
        REQUIRE(table.slice("* -*").has_value());
        REQUIRE(rows(table).empty());
    }

    SECTION("'-* 3' keeps a single row") {
        REQUIRE(table.slice("-* 3").has_value());
        REQUIRE(rows(table) == tbl::RowSet{3});
    }

    SECTION("'*' restores rows removed by filter") {
        REQUIRE(table.filter("_A == a2").has_value());
        REQUIRE(table.slice("*").has_value());
        REQUIRE(rows(table).size() == 5);
    }
}

TEST_CASE("Slice ignores numbers outside the loaded rows", "[table][slice]") {
    auto table = make_table();
    REQUIRE(table.slice("-* 99 0 2").has_value());
    REQUIRE(rows(table) == tbl::RowSet{2});
}

TEST_CASE("Slice rejects malformed tokens atomically", "[table][slice]") {
    auto table = make_table();
    auto result = table.slice("-1 two");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == tbl::ErrorKind::InvalidArgument);
    REQUIRE(rows(table) == tbl::RowSet{1, 2, 3, 4, 5});
}

TEST_CASE("Slice on an empty active range is a no-op", "[table][slice]") {
    auto table = make_table();
    REQUIRE(table.select("-*").has_value());
    REQUIRE(table.slice("-1").has_value());
    REQUIRE(rows(table) == tbl::RowSet{1, 2, 3, 4, 5});
}

TEST_CASE("Select by identifier and by number", "[table][select]") {
    auto table = make_table();

    REQUIRE(table.select("-* _B _D").has_value());
    REQUIRE(columns(table) == tbl::ColumnSet{2, 4});

    REQUIRE(table.select("-_D 1").has_value());
    REQUIRE(columns(table) == tbl::ColumnSet{1, 2});

    REQUIRE(table.select(std::vector<std::string>{"+_C", "-2"}).has_value());
    REQUIRE(columns(table) == tbl::ColumnSet{1, 3});

    REQUIRE(table.render().value() == "a1|c1\na2|c2\na3|c3\na4|c4\na5|c5\n");
}

TEST_CASE("Select star tokens", "[table][select]") {
    auto table = make_table();

    REQUIRE(table.select("* -*").has_value());
    REQUIRE(columns(table).empty());

    REQUIRE(table.select("-* *").has_value());
    REQUIRE(columns(table) == tbl::ColumnSet{1, 2, 3, 4});
}

TEST_CASE("Select errors leave the columns unchanged", "[table][select]") {
    auto table = make_table();

    SECTION("unknown identifier") {
        auto result = table.select("-_A _Q");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tbl::ErrorKind::InvalidArgument);
    }

    SECTION("malformed token") {
        auto result = table.select("-_A B");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tbl::ErrorKind::InvalidArgument);
    }

    SECTION("substitution budget") {
        auto over = table.select("-_A -_B -_C", 2);
        REQUIRE_FALSE(over.has_value());
        REQUIRE(over.error().kind == tbl::ErrorKind::SubstitutionLimitExceeded);
    }

    REQUIRE(columns(table) == tbl::ColumnSet{1, 2, 3, 4});
}

TEST_CASE("Select within budget", "[table][select]") {
    auto table = make_table();
    REQUIRE(table.select("-_A -_B 3", 2).has_value());
    REQUIRE(columns(table) == tbl::ColumnSet{3, 4});
}
