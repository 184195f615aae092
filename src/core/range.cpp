#include <tbl/core/range.hpp>

#include <fmt/core.h>

#include <charconv>
#include <optional>

namespace tbl {

namespace {

auto parse_number(std::string_view text) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

template <typename Set>
auto join_numbers(const Set& set) -> std::string {
    std::string out;
    for (auto value : set) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += fmt::format("{}", value);
    }
    return out;
}

auto parse_number_set(std::string_view text) -> Result<std::set<std::size_t>> {
    std::set<std::size_t> numbers;
    for (const auto& word : split_list(text)) {
        auto value = parse_number(word);
        if (!value.has_value() || *value == 0) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("invalid range token: bad number '{}'", word));
        }
        numbers.insert(*value);
    }
    return numbers;
}

}  // namespace

auto RangeToken::to_string() const -> std::string {
    return fmt::format("{}:{}", join_numbers(rows_), join_numbers(columns_));
}

auto RangeToken::parse(std::string_view text) -> Result<RangeToken> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || text.find(':', colon + 1) != std::string_view::npos) {
        return make_error(ErrorKind::InvalidArgument,
                          "invalid range token: expected exactly one ':'");
    }
    auto rows = parse_number_set(text.substr(0, colon));
    if (!rows) {
        return std::unexpected(rows.error());
    }
    auto columns = parse_number_set(text.substr(colon + 1));
    if (!columns) {
        return std::unexpected(columns.error());
    }
    return RangeToken{std::move(*rows), std::move(*columns)};
}

auto ActiveRange::all(std::size_t row_count, std::size_t column_count) -> ActiveRange {
    ActiveRange range;
    for (RowNumber r = 1; r <= row_count; ++r) {
        range.rows_.insert(range.rows_.end(), r);
    }
    for (ColumnNumber c = 1; c <= column_count; ++c) {
        range.columns_.insert(range.columns_.end(), c);
    }
    return range;
}

void ActiveRange::restore(const RangeToken& token) {
    rows_ = token.rows();
    columns_ = token.columns();
}

auto ActiveRange::complement(std::size_t row_count, std::size_t column_count) const
    -> RangeToken {
    RowSet rows;
    for (RowNumber r = 1; r <= row_count; ++r) {
        if (!rows_.contains(r)) {
            rows.insert(rows.end(), r);
        }
    }
    ColumnSet columns;
    for (ColumnNumber c = 1; c <= column_count; ++c) {
        if (!columns_.contains(c)) {
            columns.insert(columns.end(), c);
        }
    }
    return RangeToken{std::move(rows), std::move(columns)};
}

auto apply_number_list(std::set<std::size_t>& set, const std::vector<std::string>& tokens,
                       std::size_t universe) -> Result<void> {
    std::set<std::size_t> working = set;
    for (const auto& token : tokens) {
        if (token == "-*") {
            working.clear();
            continue;
        }
        if (token == "*") {
            working.clear();
            for (std::size_t n = 1; n <= universe; ++n) {
                working.insert(working.end(), n);
            }
            continue;
        }
        std::string_view digits = token;
        bool remove = false;
        if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
            remove = digits.front() == '-';
            digits.remove_prefix(1);
        }
        auto value = parse_number(digits);
        if (!value.has_value()) {
            return make_error(ErrorKind::InvalidArgument,
                              fmt::format("invalid list element '{}': expected a signed "
                                          "number, '*' or '-*'",
                                          token));
        }
        if (*value == 0 || *value > universe) {
            continue;
        }
        if (remove) {
            working.erase(*value);
        } else {
            working.insert(*value);
        }
    }
    set = std::move(working);
    return {};
}

auto split_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto begin = text.find_first_not_of(" \t\r\n", pos);
        if (begin == std::string_view::npos) {
            break;
        }
        auto end = text.find_first_of(" \t\r\n", begin);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        words.emplace_back(text.substr(begin, end - begin));
        pos = end;
    }
    return words;
}

}  // namespace tbl
