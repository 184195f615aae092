#include <tbl/core/registry.hpp>
#include <tbl/table/table.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <utility>
#include <string>
#include <vector>

namespace {

auto fail(const tbl::Error& error) -> int {
    spdlog::error("{}", error.format());
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tbl_query - filter, slice and select a delimited table"};
    app.set_version_flag("--version", "tbl_query 0.1.0");
    app.footer(
        "Operations run in a fixed order, whatever their order on the command line:\n"
        "  every --filter, then every --slice, then every --select.\n"
        "Within each kind they run in the order given. A '*' in a --slice list\n"
        "therefore also undoes the filters.");

    std::string names_path;
    std::string input_path;
    std::string label_prefix;
    std::string delimiter = "|";
    std::string out_delimiter;
    std::vector<std::string> filters;
    std::vector<std::string> slices;
    std::vector<std::string> selects;
    std::string na_fill;
    bool row_numbers = false;
    bool header = false;
    bool verbose = false;
    std::size_t max_substitutions = tbl::expr::kDefaultMaxSubstitutions;

    app.add_option("--names", names_path, "File listing the column identifiers, one per line")
        ->required();
    app.add_option("input", input_path, "Input table (default: stdin)");
    app.add_option("--labels-prefix", label_prefix,
                   "Prefix of the environment variables holding column labels "
                   "(default: TBL_LABEL_PREFIX, then i18n_col_)");
    app.add_option("-d,--delimiter", delimiter, "Input field delimiter")->capture_default_str();
    app.add_option("-o,--output-delimiter", out_delimiter,
                   "Output field delimiter (default: the input delimiter)");
    // One value per occurrence; write --filter='-n _A' when the value starts with '-'.
    app.add_option("--filter", filters, "Keep rows matching the expression (repeatable)")
        ->allow_extra_args(false);
    app.add_option("--slice", slices, "Row list to apply, e.g. --slice='-2 7' (repeatable)")
        ->allow_extra_args(false);
    app.add_option("--select", selects,
                   "Column list to apply, e.g. --select='-* _B 3' (repeatable)")
        ->allow_extra_args(false);
    auto* na = app.add_option("--na", na_fill, "Text printed for absent cells");
    app.add_flag("--row-numbers", row_numbers, "Prefix every line with its row number");
    app.add_flag("--header", header, "Print the active column labels first");
    auto* budget = app.add_option("--max-subst", max_substitutions,
                                  "Substitution budget (default: TBL_MAX_SUBST, then 100)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Standard output carries the table; diagnostics go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("tbl_query"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    if (label_prefix.empty()) {
        const char* env = std::getenv("TBL_LABEL_PREFIX");
        label_prefix = env != nullptr ? env : "i18n_col_";
    }
    if (budget->count() == 0) {
        if (const char* env = std::getenv("TBL_MAX_SUBST"); env != nullptr) {
            try {
                max_substitutions = std::stoul(env);
            } catch (const std::exception& e) {
                spdlog::warn("ignoring TBL_MAX_SUBST='{}': {}", env, e.what());
            }
        }
    }

    std::ifstream names_file(names_path);
    if (!names_file) {
        spdlog::error("cannot open '{}'", names_path);
        return 1;
    }
    auto registry = tbl::build_registry(tbl::names_generator(tbl::read_names(names_file)),
                                        tbl::env_label_lookup(label_prefix));
    if (!registry) {
        return fail(registry.error());
    }

    tbl::Table table(std::move(*registry));
    if (input_path.empty() || input_path == "-") {
        if (auto ok = table.load(std::cin, delimiter); !ok) {
            return fail(ok.error());
        }
    } else {
        std::ifstream input(input_path);
        if (!input) {
            spdlog::error("cannot open '{}'", input_path);
            return 1;
        }
        if (auto ok = table.load(input, delimiter); !ok) {
            return fail(ok.error());
        }
    }

    for (const auto& expression : filters) {
        if (auto ok = table.filter(expression, max_substitutions); !ok) {
            return fail(ok.error());
        }
    }
    for (const auto& list : slices) {
        if (auto ok = table.slice(list); !ok) {
            return fail(ok.error());
        }
    }
    for (const auto& list : selects) {
        if (auto ok = table.select(list, max_substitutions); !ok) {
            return fail(ok.error());
        }
    }

    tbl::PrintOptions options;
    options.delimiter = out_delimiter.empty() ? delimiter : out_delimiter;
    options.show_row_number = row_numbers;
    if (na->count() > 0) {
        options.na_fill = na_fill;
    }

    if (header) {
        auto labels = table.active_labels();
        if (!labels) {
            return fail(labels.error());
        }
        auto names = table.active_names();
        if (!names) {
            return fail(names.error());
        }
        std::string line = row_numbers ? options.delimiter : std::string{};
        for (std::size_t i = 0; i < labels->size(); ++i) {
            if (i > 0) {
                line += options.delimiter;
            }
            // Unlabelled columns fall back to their identifier.
            line += (*labels)[i].empty() ? (*names)[i] : (*labels)[i];
        }
        fmt::print("{}\n", line);
    }

    std::fflush(stdout);
    if (auto ok = table.print(std::cout, options); !ok) {
        return fail(ok.error());
    }
    return 0;
}
