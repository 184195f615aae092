#include <tbl/core/registry.hpp>
#include <tbl/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

using Cells = std::vector<std::optional<std::string>>;

auto make_table(std::vector<std::string> names, const std::vector<std::string>& lines)
    -> tbl::Table {
    auto registry = tbl::build_registry(tbl::names_generator(std::move(names)));
    REQUIRE(registry.has_value());
    tbl::Table table(std::move(*registry));
    REQUIRE(table.load(lines, "|").has_value());
    return table;
}

auto scenario_table() -> tbl::Table {
    return make_table({"_A", "_B"}, {"1|x", "2|", "|y"});
}

auto render(const tbl::Table& table, const tbl::PrintOptions& options = {}) -> std::string {
    auto text = table.render(options);
    REQUIRE(text.has_value());
    return *text;
}

auto na_options() -> tbl::PrintOptions {
    tbl::PrintOptions options;
    options.na_fill = "NA";
    return options;
}

}  // namespace

TEST_CASE("Load 3 rows x 2 columns", "[table][load]") {
    auto table = scenario_table();

    REQUIRE(table.is_loaded());
    REQUIRE(table.row_count() == 3);
    REQUIRE(table.column_count() == 2);

    REQUIRE(table.cell(1, "_A").value() == "1");
    REQUIRE(table.cell(1, "_B").value() == "x");
    REQUIRE(table.cell(2, "_A").value() == "2");
    REQUIRE_FALSE(table.cell(2, "_B").value().has_value());
    REQUIRE_FALSE(table.cell(3, "_A").value().has_value());
    REQUIRE(table.cell(3, "_B").value() == "y");
}

TEST_CASE("Print, slice and select on the 3 x 2 table", "[table][print]") {
    auto table = scenario_table();

    REQUIRE(render(table, na_options()) == "1|x\n2|NA\nNA|y\n");

    REQUIRE(table.slice("-2").has_value());
    REQUIRE(render(table, na_options()) == "1|x\nNA|y\n");

    REQUIRE(table.select("-_A").has_value());
    REQUIRE(render(table, na_options()) == "x\ny\n");
}

TEST_CASE("Print options", "[table][print]") {
    auto table = scenario_table();

    SECTION("absent cells print empty by default") {
        REQUIRE(render(table) == "1|x\n2|\n|y\n");
    }

    SECTION("output delimiter") {
        tbl::PrintOptions options;
        options.delimiter = ", ";
        REQUIRE(render(table, options) == "1, x\n2, \n, y\n");
    }

    SECTION("row numbers are immutable") {
        tbl::PrintOptions options = na_options();
        options.show_row_number = true;
        REQUIRE(table.slice("-1").has_value());
        REQUIRE(render(table, options) == "2|2|NA\n3|NA|y\n");
    }

    SECTION("columns print in ascending number order") {
        REQUIRE(table.select("-* 2 1").has_value());
        REQUIRE(render(table) == "1|x\n2|\n|y\n");
    }

    SECTION("empty active range prints nothing") {
        REQUIRE(table.select("-*").has_value());
        REQUIRE(render(table).empty());
    }

    SECTION("print writes to a stream") {
        std::ostringstream out;
        REQUIRE(table.print(out, na_options()).has_value());
        REQUIRE(out.str() == "1|x\n2|NA\nNA|y\n");
    }
}

TEST_CASE("Load pads short records and drops extra fields", "[table][load]") {
    auto table = make_table({"_A", "_B", "_C"}, {"1", "1|2|3|4|5", "||"});

    REQUIRE(table.row_count() == 3);
    REQUIRE(table.row_cells(1).value() == Cells{"1", std::nullopt, std::nullopt});
    REQUIRE(table.row_cells(2).value() == Cells{"1", "2", "3"});
    REQUIRE(table.row_cells(3).value() == Cells{std::nullopt, std::nullopt, std::nullopt});
}

TEST_CASE("Load from a stream with a multi-character delimiter", "[table][load]") {
    auto registry = tbl::build_registry(tbl::names_generator({"_A", "_B"}));
    REQUIRE(registry.has_value());
    tbl::Table table(std::move(*registry));

    std::istringstream input("a::b\r\nc::\r\n");
    REQUIRE(table.load(input, "::").has_value());
    REQUIRE(table.row_count() == 2);
    REQUIRE(table.cell(1, 2).value() == "b");
    REQUIRE_FALSE(table.cell(2, 2).value().has_value());
}

TEST_CASE("Load with no lines yields an empty active range", "[table][load]") {
    auto table = make_table({"_A"}, {});
    REQUIRE(table.is_loaded());
    REQUIRE(table.row_count() == 0);
    REQUIRE(table.get_active_range().value().empty());
    REQUIRE(render(table).empty());
}

TEST_CASE("Loading again starts from a fresh table", "[table][load]") {
    auto table = scenario_table();
    REQUIRE(table.slice("-1").has_value());

    std::vector<std::string> lines = {"9|z"};
    REQUIRE(table.load(lines, "|").has_value());
    REQUIRE(table.row_count() == 1);
    REQUIRE(render(table) == "9|z\n");
}

TEST_CASE("Load rejects an empty delimiter", "[table][load]") {
    auto registry = tbl::build_registry(tbl::names_generator({"_A"}));
    REQUIRE(registry.has_value());
    tbl::Table table(std::move(*registry));
    std::vector<std::string> lines = {"x"};

    auto result = table.load(lines, "");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == tbl::ErrorKind::InvalidArgument);
    REQUIRE_FALSE(table.is_loaded());
}

TEST_CASE("Operations without a loaded table report corrupted state", "[table][errors]") {
    SECTION("no registry") {
        tbl::Table table;
        std::vector<std::string> lines = {"x"};
        auto load = table.load(lines, "|");
        REQUIRE_FALSE(load.has_value());
        REQUIRE(load.error().kind == tbl::ErrorKind::CorruptedState);
    }

    SECTION("registry but nothing loaded") {
        auto registry = tbl::build_registry(tbl::names_generator({"_A"}));
        REQUIRE(registry.has_value());
        tbl::Table table(std::move(*registry));

        REQUIRE(table.get_active_range().error().kind == tbl::ErrorKind::CorruptedState);
        REQUIRE(table.get_inactive_range().error().kind == tbl::ErrorKind::CorruptedState);
        REQUIRE(table.set_active_range({}).error().kind == tbl::ErrorKind::CorruptedState);
        REQUIRE(table.filter("-n _A").error().kind == tbl::ErrorKind::CorruptedState);
        REQUIRE(table.slice("1").error().kind == tbl::ErrorKind::CorruptedState);
        REQUIRE(table.select("_A").error().kind == tbl::ErrorKind::CorruptedState);
        REQUIRE(table.render().error().kind == tbl::ErrorKind::CorruptedState);
    }
}

TEST_CASE("Active range round-trips", "[table][range]") {
    auto table = scenario_table();
    REQUIRE(table.slice("-2").has_value());
    REQUIRE(table.select("-_B").has_value());

    auto token = table.get_active_range();
    REQUIRE(token.has_value());
    const auto before = render(table);

    REQUIRE(table.set_active_range(*token).has_value());
    REQUIRE(render(table) == before);

    auto inactive = table.get_inactive_range();
    REQUIRE(inactive.has_value());
    REQUIRE(table.set_active_range(*inactive).has_value());
    REQUIRE(render(table, na_options()) == "NA\n");

    REQUIRE(table.set_active_range(*token).has_value());
    REQUIRE(render(table) == before);
}

TEST_CASE("Active and inactive ranges partition the universe", "[table][range]") {
    auto table = make_table({"_A", "_B", "_C"}, {"1", "2", "3", "4", "5"});
    REQUIRE(table.slice("-2 -5").has_value());
    REQUIRE(table.select("-_B").has_value());

    auto active = table.get_active_range().value();
    auto inactive = table.get_inactive_range().value();

    tbl::RowSet rows = active.rows();
    for (auto row : inactive.rows()) {
        REQUIRE_FALSE(active.rows().contains(row));
        rows.insert(row);
    }
    REQUIRE(rows == tbl::RowSet{1, 2, 3, 4, 5});

    tbl::ColumnSet columns = active.columns();
    for (auto column : inactive.columns()) {
        REQUIRE_FALSE(active.columns().contains(column));
        columns.insert(column);
    }
    REQUIRE(columns == tbl::ColumnSet{1, 2, 3});
}

TEST_CASE("set_active_range installs tokens verbatim", "[table][range]") {
    auto table = scenario_table();
    tbl::RangeToken token{{3, 42}, {2, 9}};
    REQUIRE(table.set_active_range(token).has_value());
    REQUIRE(table.get_active_range().value() == token);
}

TEST_CASE("Print fails on a column outside the registry", "[table][errors]") {
    auto table = scenario_table();
    REQUIRE(table.set_active_range(tbl::RangeToken{{1}, {1, 9}}).has_value());

    auto text = table.render();
    REQUIRE_FALSE(text.has_value());
    REQUIRE(text.error().kind == tbl::ErrorKind::CorruptedState);
}

TEST_CASE("Print reads rows outside the universe as absent", "[table][print]") {
    auto table = scenario_table();
    REQUIRE(table.set_active_range(tbl::RangeToken{{1, 7}, {1, 2}}).has_value());
    REQUIRE(render(table, na_options()) == "1|x\nNA|NA\n");
}

TEST_CASE("Numbering never changes", "[table][range]") {
    auto table = scenario_table();
    REQUIRE(table.slice("-1").has_value());
    REQUIRE(table.select("-_A").has_value());
    REQUIRE(table.filter("-n _B").has_value());
    REQUIRE(table.set_active_range(tbl::RangeToken{{3}, {2}}).has_value());

    REQUIRE(table.registry().number_of("_B") == 2);
    REQUIRE(table.cell(3, 2).value() == "y");
    REQUIRE(table.cell(1, 1).value() == "1");

    tbl::PrintOptions options;
    options.show_row_number = true;
    REQUIRE(render(table, options) == "3|y\n");
}

TEST_CASE("Cell accessors", "[table][cells]") {
    auto table = scenario_table();

    SECTION("column traversal covers every row") {
        REQUIRE(table.column_cells(2).value() == Cells{"x", std::nullopt, "y"});
    }

    SECTION("row traversal covers every column") {
        REQUIRE(table.row_cells(2).value() == Cells{"2", std::nullopt});
    }

    SECTION("out-of-universe addresses are invalid") {
        REQUIRE(table.cell(4, 1).error().kind == tbl::ErrorKind::InvalidArgument);
        REQUIRE(table.cell(1, 3).error().kind == tbl::ErrorKind::InvalidArgument);
        REQUIRE(table.cell(0, 1).error().kind == tbl::ErrorKind::InvalidArgument);
        REQUIRE(table.cell(1, "_C").error().kind == tbl::ErrorKind::InvalidArgument);
        REQUIRE(table.column_cells(3).error().kind == tbl::ErrorKind::InvalidArgument);
        REQUIRE(table.row_cells(4).error().kind == tbl::ErrorKind::InvalidArgument);
    }

    SECTION("cells ignore the active range") {
        REQUIRE(table.slice("-*").has_value());
        REQUIRE(table.cell(1, "_B").value() == "x");
    }
}

TEST_CASE("Active names and labels follow the active columns", "[table][cells]") {
    tbl::LabelLookup labels = [](std::string_view name) -> std::optional<std::string> {
        return name == "_A" ? std::optional<std::string>("ns:Alpha") : std::nullopt;
    };
    auto registry = tbl::build_registry(tbl::names_generator({"_A", "_B"}), labels);
    REQUIRE(registry.has_value());
    tbl::Table table(std::move(*registry));
    std::vector<std::string> lines = {"1|2"};
    REQUIRE(table.load(lines, "|").has_value());

    REQUIRE(table.active_names().value() == std::vector<std::string>{"_A", "_B"});
    REQUIRE(table.active_labels().value() == std::vector<std::string>{"Alpha", ""});

    REQUIRE(table.select("-_A").has_value());
    REQUIRE(table.active_names().value() == std::vector<std::string>{"_B"});
}

TEST_CASE("Copies are independent snapshots", "[table]") {
    auto table = scenario_table();
    auto copy = table;
    REQUIRE(copy.slice("-*").has_value());
    REQUIRE(render(copy).empty());
    REQUIRE(render(table) == "1|x\n2|\n|y\n");
}
