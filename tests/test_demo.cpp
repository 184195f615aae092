#include <tbl/core/registry.hpp>
#include <tbl/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

auto data_path(const char* name) -> std::filesystem::path {
    return std::filesystem::path(TBL_SOURCE_DIR) / "tests" / "data" / name;
}

auto load_demo() -> tbl::Table {
    ::setenv("tbl_demo_label__E", "demo:ee", 1);

    std::ifstream names(data_path("demo_names.txt"));
    REQUIRE(names.good());
    auto registry = tbl::build_registry(tbl::names_generator(tbl::read_names(names)),
                                        tbl::env_label_lookup("tbl_demo_label_"));
    REQUIRE(registry.has_value());

    tbl::Table table(std::move(*registry));
    std::ifstream input(data_path("demo.tbl"));
    REQUIRE(input.good());
    REQUIRE(table.load(input, "|").has_value());
    return table;
}

auto render(const tbl::Table& table) -> std::string {
    auto text = table.render();
    REQUIRE(text.has_value());
    return *text;
}

}  // namespace

TEST_CASE("Demo table loads with headers as rows 1 and 2", "[demo]") {
    auto table = load_demo();
    REQUIRE(table.row_count() == 9);
    REQUIRE(table.column_count() == 11);
    REQUIRE(table.cell(1, "_J").value() == "_J");
    REQUIRE(table.cell(2, "_Z").value() == "z");
    REQUIRE(table.registry().label_of(5) == "ee");
    REQUIRE(table.registry().label_of(1).empty());
}

TEST_CASE("Demo walkthrough", "[demo]") {
    auto table = load_demo();
    auto initial = table.get_active_range();
    REQUIRE(initial.has_value());
    const auto full = render(table);

    REQUIRE(table.filter("-n _J || _D == ddd").has_value());
    REQUIRE(table.get_active_range()->rows() == tbl::RowSet{1, 2, 3, 6, 7, 8});

    REQUIRE(table.slice("-2 -7").has_value());
    REQUIRE(table.get_active_range()->rows() == tbl::RowSet{1, 3, 6, 8});

    REQUIRE(table.slice("2 -1").has_value());
    REQUIRE(table.get_active_range()->rows() == tbl::RowSet{2, 3, 6, 8});

    REQUIRE(table.select("-* _B _E _J").has_value());
    REQUIRE(render(table) == "b|e|j\n3:2|3 ee|\n6:2||\n8:2|8 eee|j\n");

    REQUIRE(table.select("-_J -_E 7").has_value());
    REQUIRE(render(table) == "b|g\n3:2|\n6:2|6:7\n8:2|\n");

    auto inactive = table.get_inactive_range();
    REQUIRE(inactive.has_value());
    REQUIRE(inactive->to_string() == "1 4 5 7 9:1 3 4 5 6 8 9 10 11");
    REQUIRE(table.set_active_range(*inactive).has_value());
    REQUIRE(render(table) ==
            "_A|_C|_D|_E|_F|_H|_I|_J|_Z\n"
            "4:1|4:3||4 ee|||i4||\n"
            "5:1|5:3|||||i5||\n"
            "7:1|7:3|ddd||||7:9||\n"
            "9:1|9:3||9 ee|||||z\n");

    REQUIRE(table.set_active_range(*initial).has_value());
    REQUIRE(render(table) == full);

    REQUIRE(table.slice("-*").has_value());
    REQUIRE(render(table).empty());
}

TEST_CASE("Demo cell, column and row traversal", "[demo]") {
    using Cells = std::vector<std::optional<std::string>>;
    auto table = load_demo();

    REQUIRE(table.cell(7, "_I").value() == "7:9");

    REQUIRE(table.column_cells(5).value() == Cells{"_E", "e", "3 ee", "4 ee", std::nullopt,
                                                   std::nullopt, std::nullopt, "8 eee", "9 ee"});

    REQUIRE(table.row_cells(9).value() ==
            Cells{"9:1", "9:2", "9:3", std::nullopt, "9 ee", std::nullopt, std::nullopt,
                  std::nullopt, std::nullopt, std::nullopt, "z"});
}

TEST_CASE("Demo integer filter skips header and non-numeric rows", "[demo][filter]") {
    auto table = load_demo();
    REQUIRE(table.filter("_G -eq 1").has_value());
    REQUIRE(table.get_active_range()->rows() == tbl::RowSet{5});

    auto numeric = load_demo();
    REQUIRE(numeric.filter("_G -ge 0 && -n _G").has_value());
    REQUIRE(numeric.get_active_range()->rows() == tbl::RowSet{5});
}
