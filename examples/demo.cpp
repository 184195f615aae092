#include <tbl/tbl.hpp>

#include <fmt/core.h>

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

const std::vector<std::string> kColumns = {"_A", "_B", "_C", "_D", "_E", "_F",
                                           "_G", "_H", "_I", "_J", "_Z"};

// Cells generated by the application. Rows 1 and 2 repeat the column
// identifiers and labels so they get the immutable row numbers 1 and 2.
const std::vector<std::string> kLines = {
    "_A|_B|_C|_D|_E|_F|_G|_H|_I|_J|_Z|",
    "a|b|c|d|e|f|g|h|i|j|z|",
    "3:1|3:2|3:3|ddd|3 ee||||||",
    "4:1|4:2|4:3||4 ee||||i4||",
    "5:1|5:2|5:3||||1||i5||",
    "6:1|6:2|6:3|ddd||6:6|6:7||||",
    "7:1|7:2|7:3|ddd|||7:7||7:9||",
    "8:1|8:2|8:3||8 eee|||||j|",
    "9:1|9:2|9:3||9 ee||||||z",
};

void section(std::string_view title) {
    fmt::print("\n=== {} ===\n", title);
}

void cmd(std::string_view text) {
    fmt::print("> {}\n", text);
}

auto show(const tbl::Table& table) -> bool {
    tbl::PrintOptions options;
    options.show_row_number = true;
    auto text = table.render(options);
    if (!text) {
        fmt::print(stderr, "error: {}\n", text.error().format());
        return false;
    }
    fmt::print("{}", *text);
    return true;
}

auto check(const tbl::Result<void>& result) -> bool {
    if (!result) {
        fmt::print(stderr, "error: {}\n", result.error().format());
        return false;
    }
    return true;
}

auto format_cell(const std::optional<std::string>& cell) -> std::string {
    return cell.has_value() ? *cell : std::string{};
}

}  // namespace

auto main() -> int {
    // Labels are looked up by identifier; lower-case the identifier here.
    tbl::LabelLookup labels = [](std::string_view name) -> std::optional<std::string> {
        std::string label = "demo:";
        for (char ch : name.substr(1)) {
            label.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return label;
    };

    auto registry = tbl::build_registry(tbl::names_generator(kColumns), labels);
    if (!registry) {
        fmt::print(stderr, "error: {}\n", registry.error().format());
        return EXIT_FAILURE;
    }
    tbl::Table table(std::move(*registry));

    section("Load the application-generated table");
    cmd("load '|'");
    if (!check(table.load(kLines, "|"))) {
        return EXIT_FAILURE;
    }
    auto initial = table.get_active_range();
    if (!initial || !show(table)) {
        return EXIT_FAILURE;
    }

    section("Filter rows using a conditional expression");
    cmd("filter '-n _J || _D == ddd'");
    if (!check(table.filter("-n _J || _D == ddd")) || !show(table)) {
        return EXIT_FAILURE;
    }

    section("Filter rows using the immutable row numbers");
    cmd("slice '-2 -7'");
    if (!check(table.slice("-2 -7")) || !show(table)) {
        return EXIT_FAILURE;
    }
    cmd("slice '2 -1'");
    if (!check(table.slice("2 -1")) || !show(table)) {
        return EXIT_FAILURE;
    }

    section("Select columns");
    cmd("select '-* _B _E _J'");
    if (!check(table.select("-* _B _E _J")) || !show(table)) {
        return EXIT_FAILURE;
    }
    cmd("select '-_J -_E 7'");
    if (!check(table.select("-_J -_E 7")) || !show(table)) {
        return EXIT_FAILURE;
    }

    section("Show the table complement");
    auto inactive = table.get_inactive_range();
    if (!inactive) {
        fmt::print(stderr, "error: {}\n", inactive.error().format());
        return EXIT_FAILURE;
    }
    cmd(fmt::format("set_active_range {}", inactive->to_string()));
    if (!check(table.set_active_range(*inactive)) || !show(table)) {
        return EXIT_FAILURE;
    }

    section("Restore the initial table");
    if (!check(table.set_active_range(*initial)) || !show(table)) {
        return EXIT_FAILURE;
    }

    section("Single cell <7,_I>");
    auto cell = table.cell(7, "_I");
    if (!cell) {
        fmt::print(stderr, "error: {}\n", cell.error().format());
        return EXIT_FAILURE;
    }
    fmt::print("{}\n", format_cell(*cell));

    section("Traverse column _E");
    auto column = table.column_cells(5);
    if (!column) {
        fmt::print(stderr, "error: {}\n", column.error().format());
        return EXIT_FAILURE;
    }
    for (const auto& value : *column) {
        fmt::print("| {:>5} |\n", format_cell(value));
    }

    section("Traverse row 9");
    auto row = table.row_cells(9);
    if (!row) {
        fmt::print(stderr, "error: {}\n", row.error().format());
        return EXIT_FAILURE;
    }
    for (const auto& value : *row) {
        fmt::print(" | {}", format_cell(value));
    }
    fmt::print("\n");

    section("Fin");
    if (!check(table.slice("-*")) || !show(table)) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
