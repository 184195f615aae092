#include <tbl/core/range.hpp>
#include <tbl/core/registry.hpp>
#include <tbl/repl/repl.hpp>
#include <tbl/table/table.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#ifdef TBL_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace tbl::repl {

namespace {

#ifdef TBL_HAS_READLINE
constexpr std::array<std::string_view, 16> kColonCommands = {
    ":q",      ":quit",  ":exit",  ":names",    ":load", ":na",     ":rownum", ":save",
    ":restore", ":range", ":setrange", ":inactive", ":labels", ":cell", ":budget", ":help",
};

auto colon_command_generator(const char* text, int state) -> char* {
    static std::size_t index = 0;
    static std::string prefix;
    if (state == 0) {
        index = 0;
        prefix = text != nullptr ? text : "";
    }
    while (index < kColonCommands.size()) {
        const auto command = kColonCommands[index++];
        if (command.starts_with(prefix)) {
            return ::strdup(std::string(command).c_str());
        }
    }
    return nullptr;
}

auto repl_completion(const char* text, int start, int /*end*/) -> char** {
    if (start != 0 || text == nullptr || text[0] != ':') {
        return nullptr;
    }
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, colon_command_generator);
}

void configure_line_editing() {
    rl_attempted_completion_function = repl_completion;
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!out.empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
void configure_line_editing() {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    std::fflush(stdout);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

std::string_view trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool starts_with_command(std::string_view text, std::string_view command) {
    if (!text.starts_with(command)) {
        return false;
    }
    if (text.size() == command.size()) {
        return true;
    }
    auto next = static_cast<unsigned char>(text[command.size()]);
    return std::isspace(next) != 0;
}

auto command_argument(std::string_view line, std::string_view command) -> std::string_view {
    return trim(line.substr(command.size()));
}

/// Split off the first blank-separated word.
auto split_first(std::string_view text) -> std::pair<std::string_view, std::string_view> {
    text = trim(text);
    auto space = text.find_first_of(" \t");
    if (space == std::string_view::npos) {
        return {text, {}};
    }
    return {text.substr(0, space), trim(text.substr(space + 1))};
}

std::string parse_path(std::string_view text) {
    std::string_view view = trim(text);
    if (view.empty()) {
        return {};
    }
    if (view.front() == '"' || view.front() == '\'') {
        char quote = view.front();
        auto end = view.find(quote, 1);
        if (end != std::string_view::npos) {
            return std::string(view.substr(1, end - 1));
        }
    }
    return std::string(view);
}

auto parse_size(std::string_view text) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

constexpr std::string_view kHelp =
    "commands:\n"
    "  :names <file>            build the column registry from a name list\n"
    "  :load <file> [delim]     load a delimited table\n"
    "  filter <expr>            keep active rows matching <expr>\n"
    "  slice <list>             add/remove active rows (N -N * -*)\n"
    "  select <list>            add/remove active columns (_ID -_ID N * -*)\n"
    "  print [delim]            print the active range\n"
    "  :na <text>|off           fill text for absent cells\n"
    "  :rownum on|off           prefix printed lines with the row number\n"
    "  :range | :inactive       show the active / inactive range token\n"
    "  :setrange <token>        install a range token\n"
    "  :save <name>             remember the active range\n"
    "  :restore <name>          reinstall a remembered range\n"
    "  :labels                  list active column identifiers and labels\n"
    "  :cell <row> <col>        show one cell\n"
    "  :budget [n]              show or set the substitution budget\n"
    "  :q                       quit\n";

/// State of one REPL session: the table, print settings and saved ranges.
class Session {
   public:
    explicit Session(const ReplConfig& config, std::ostream& out)
        : config_(config), out_(out), max_substitutions_(config.max_substitutions) {}

    [[nodiscard]] auto quit_requested() const noexcept -> bool { return quit_; }

    /// Execute one command line. Returns false when the command failed.
    auto execute(std::string_view line) -> bool {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            return true;
        }

        if (line == ":q" || line == ":quit" || line == ":exit") {
            quit_ = true;
            return true;
        }
        if (line == ":help") {
            out_ << kHelp;
            return true;
        }
        if (starts_with_command(line, ":names")) {
            return names(command_argument(line, ":names"));
        }
        if (starts_with_command(line, ":load")) {
            return load(command_argument(line, ":load"));
        }
        if (starts_with_command(line, "filter")) {
            auto expression = command_argument(line, "filter");
            if (expression.empty()) {
                return usage("filter <expr>");
            }
            return report(table_.filter(expression, max_substitutions_));
        }
        if (starts_with_command(line, "slice")) {
            return report(table_.slice(command_argument(line, "slice")));
        }
        if (starts_with_command(line, "select")) {
            return report(table_.select(command_argument(line, "select"), max_substitutions_));
        }
        if (starts_with_command(line, "print")) {
            auto options = print_options_;
            if (auto delimiter = command_argument(line, "print"); !delimiter.empty()) {
                options.delimiter = parse_path(delimiter);
            }
            return report(table_.print(out_, options));
        }
        if (starts_with_command(line, ":na")) {
            auto arg = command_argument(line, ":na");
            if (arg.empty()) {
                return usage(":na <text>|off");
            }
            if (arg == "off") {
                print_options_.na_fill.reset();
            } else {
                print_options_.na_fill = parse_path(arg);
            }
            return true;
        }
        if (starts_with_command(line, ":rownum")) {
            auto arg = command_argument(line, ":rownum");
            if (arg.empty()) {
                print_options_.show_row_number = !print_options_.show_row_number;
            } else if (arg == "on") {
                print_options_.show_row_number = true;
            } else if (arg == "off") {
                print_options_.show_row_number = false;
            } else {
                return usage(":rownum [on|off]");
            }
            out_ << fmt::format("row numbers: {}\n", print_options_.show_row_number ? "on" : "off");
            return true;
        }
        if (line == ":range") {
            return show_token(table_.get_active_range());
        }
        if (line == ":inactive") {
            return show_token(table_.get_inactive_range());
        }
        if (starts_with_command(line, ":setrange")) {
            auto token = RangeToken::parse(command_argument(line, ":setrange"));
            if (!token) {
                return fail(token.error());
            }
            return report(table_.set_active_range(*token));
        }
        if (starts_with_command(line, ":save")) {
            auto name = command_argument(line, ":save");
            if (name.empty()) {
                return usage(":save <name>");
            }
            auto token = table_.get_active_range();
            if (!token) {
                return fail(token.error());
            }
            saved_.insert_or_assign(std::string(name), std::move(*token));
            return true;
        }
        if (starts_with_command(line, ":restore")) {
            auto name = command_argument(line, ":restore");
            auto it = saved_.find(std::string(name));
            if (it == saved_.end()) {
                out_ << fmt::format("error: no saved range '{}'\n", name);
                return false;
            }
            return report(table_.set_active_range(it->second));
        }
        if (line == ":labels") {
            return labels();
        }
        if (starts_with_command(line, ":cell")) {
            return cell(command_argument(line, ":cell"));
        }
        if (starts_with_command(line, ":budget")) {
            auto arg = command_argument(line, ":budget");
            if (!arg.empty()) {
                auto value = parse_size(arg);
                if (!value.has_value()) {
                    return usage(":budget [n]");
                }
                max_substitutions_ = *value;
            }
            out_ << fmt::format("substitution budget: {}\n", max_substitutions_);
            return true;
        }

        out_ << fmt::format("error: unknown command '{}' (try :help)\n", split_first(line).first);
        return false;
    }

   private:
    auto names(std::string_view arg) -> bool {
        std::string path = parse_path(arg);
        if (path.empty()) {
            return usage(":names <file>");
        }
        std::ifstream input{path};
        if (!input) {
            out_ << fmt::format("error: failed to open '{}'\n", path);
            return false;
        }
        auto registry = build_registry(names_generator(read_names(input)),
                                       env_label_lookup(config_.label_prefix));
        if (!registry) {
            return fail(registry.error());
        }
        out_ << fmt::format("{} columns\n", registry->size());
        table_ = Table(std::move(*registry));
        saved_.clear();
        return true;
    }

    auto load(std::string_view arg) -> bool {
        auto [file, rest] = split_first(arg);
        std::string path = parse_path(file);
        if (path.empty()) {
            return usage(":load <file> [delim]");
        }
        std::string delimiter = rest.empty() ? config_.delimiter : parse_path(rest);
        std::ifstream input{path};
        if (!input) {
            out_ << fmt::format("error: failed to open '{}'\n", path);
            return false;
        }
        if (auto ok = table_.load(input, delimiter); !ok) {
            return fail(ok.error());
        }
        saved_.clear();
        out_ << fmt::format("{} rows x {} columns\n", table_.row_count(), table_.column_count());
        return true;
    }

    auto labels() -> bool {
        auto names = table_.active_names();
        if (!names) {
            return fail(names.error());
        }
        auto labels = table_.active_labels();
        if (!labels) {
            return fail(labels.error());
        }
        for (std::size_t i = 0; i < names->size(); ++i) {
            out_ << fmt::format("{}\t{}\n", (*names)[i], (*labels)[i]);
        }
        return true;
    }

    auto cell(std::string_view arg) -> bool {
        auto [row_text, column_text] = split_first(arg);
        auto row = parse_size(row_text);
        if (!row.has_value() || column_text.empty()) {
            return usage(":cell <row> <column>");
        }
        auto value = [&]() -> Result<std::optional<std::string>> {
            if (auto number = parse_size(column_text); number.has_value()) {
                return table_.cell(*row, *number);
            }
            return table_.cell(*row, column_text);
        }();
        if (!value) {
            return fail(value.error());
        }
        out_ << fmt::format("{}\n", value->value_or(print_options_.na_fill.value_or("")));
        return true;
    }

    auto show_token(const Result<RangeToken>& token) -> bool {
        if (!token) {
            return fail(token.error());
        }
        out_ << fmt::format("{}\n", token->to_string());
        return true;
    }

    auto report(const Result<void>& result) -> bool {
        if (!result) {
            return fail(result.error());
        }
        return true;
    }

    auto fail(const Error& error) -> bool {
        out_ << fmt::format("error: {}\n", error.format());
        return false;
    }

    auto usage(std::string_view text) -> bool {
        out_ << fmt::format("usage: {}\n", text);
        return false;
    }

    const ReplConfig& config_;
    std::ostream& out_;
    Table table_;
    PrintOptions print_options_;
    std::map<std::string, RangeToken> saved_;
    std::size_t max_substitutions_;
    bool quit_ = false;
};

}  // namespace

auto execute_script(std::string_view source, std::ostream& out, const ReplConfig& config)
    -> bool {
    Session session(config, out);
    std::size_t line_number = 0;
    std::size_t pos = 0;
    while (pos <= source.size() && !session.quit_requested()) {
        auto end = source.find('\n', pos);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        ++line_number;
        if (!session.execute(source.substr(pos, end - pos))) {
            spdlog::debug("script stopped at line {}", line_number);
            return false;
        }
        pos = end + 1;
    }
    return true;
}

void run(const ReplConfig& config) {
    if (config.verbose) {
        spdlog::info("tbl REPL started (verbose={})", config.verbose);
    }

    Session session(config, std::cout);
    configure_line_editing();

    std::string line;
    while (!session.quit_requested()) {
        if (!read_repl_line(config.prompt, line)) {
            fmt::print("\n");
            break;
        }
        // Failures are already reported; the session carries on.
        (void)session.execute(line);
        std::cout.flush();
    }

    spdlog::info("tbl REPL exiting");
}

}  // namespace tbl::repl
