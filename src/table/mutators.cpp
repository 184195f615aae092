#include <tbl/expr/predicate.hpp>
#include <tbl/expr/substitute.hpp>
#include <tbl/table/table.hpp>

#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>
#include <vector>

namespace tbl {

auto Table::filter(std::string_view expression, std::size_t max_substitutions) -> Result<void> {
    if (auto ok = require_loaded(); !ok) {
        return ok;
    }
    if (range_.empty()) {
        return {};
    }

    auto predicate = expr::compile(expression, *registry_, max_substitutions);
    if (!predicate) {
        return std::unexpected(predicate.error());
    }

    std::vector<std::pair<ColumnNumber, const Column*>> active;
    active.reserve(range_.columns().size());
    for (ColumnNumber c : range_.columns()) {
        auto column = checked_column(c);
        if (!column) {
            return std::unexpected(column.error());
        }
        active.emplace_back(c, *column);
    }

    // Slot 0 unused; inactive columns stay empty.
    std::vector<std::string_view> values(columns_.size() + 1);
    const expr::RowView row_view(values);

    RowSet kept;
    for (RowNumber r : range_.rows()) {
        for (const auto& [number, column] : active) {
            values[number] = column->value_or_empty(r);
        }
        if (predicate->evaluate(row_view)) {
            kept.insert(kept.end(), r);
        }
    }

    spdlog::debug("filter kept {} of {} rows ({} substitutions)", kept.size(),
                  range_.rows().size(), predicate->substitutions());
    range_.set_rows(std::move(kept));
    return {};
}

auto Table::slice(std::string_view row_list) -> Result<void> {
    return slice(split_list(row_list));
}

auto Table::slice(const std::vector<std::string>& tokens) -> Result<void> {
    if (auto ok = require_loaded(); !ok) {
        return ok;
    }
    if (range_.empty()) {
        return {};
    }
    RowSet rows = range_.rows();
    if (auto ok = apply_number_list(rows, tokens, row_count_); !ok) {
        return ok;
    }
    spdlog::debug("slice: {} active rows", rows.size());
    range_.set_rows(std::move(rows));
    return {};
}

auto Table::select(std::string_view column_list, std::size_t max_substitutions) -> Result<void> {
    return select(split_list(column_list), max_substitutions);
}

auto Table::select(const std::vector<std::string>& tokens, std::size_t max_substitutions)
    -> Result<void> {
    if (auto ok = require_loaded(); !ok) {
        return ok;
    }
    if (range_.empty()) {
        return {};
    }
    auto resolved = expr::substitute_list(tokens, *registry_, max_substitutions);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    ColumnSet columns = range_.columns();
    if (auto ok = apply_number_list(columns, *resolved, columns_.size()); !ok) {
        return ok;
    }
    spdlog::debug("select: {} active columns", columns.size());
    range_.set_columns(std::move(columns));
    return {};
}

}  // namespace tbl
