#include <tbl/io/reader.hpp>
#include <tbl/table/table.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <utility>

namespace tbl {

Table::Table(ColumnRegistry registry)
    : registry_(std::make_shared<const ColumnRegistry>(std::move(registry))) {}

auto Table::require_loaded() const -> Result<void> {
    if (registry_ == nullptr) {
        return make_error(ErrorKind::CorruptedState, "no column registry: build one before loading");
    }
    if (!loaded_) {
        return make_error(ErrorKind::CorruptedState, "no table loaded");
    }
    return {};
}

auto Table::checked_column(ColumnNumber number) const -> Result<const Column*> {
    if (registry_ == nullptr || columns_.size() != registry_->size()) {
        return make_error(ErrorKind::CorruptedState,
                          "column store does not match the column registry");
    }
    if (number == 0 || number > columns_.size()) {
        return make_error(ErrorKind::CorruptedState,
                          fmt::format("column {} is not registered", number));
    }
    const Column& column = columns_[number - 1];
    if (column.number() != number) {
        return make_error(ErrorKind::CorruptedState,
                          fmt::format("column '{}' is stored as column {} but registered as {}",
                                      registry_->name_of(number), column.number(), number));
    }
    return &column;
}

// ─── Load ─────────────────────────────────────────────────────────────────────

auto Table::load(std::span<const std::string> lines, std::string_view delimiter) -> Result<void> {
    if (registry_ == nullptr) {
        return make_error(ErrorKind::CorruptedState, "no column registry: build one before loading");
    }
    if (delimiter.empty()) {
        return make_error(ErrorKind::InvalidArgument, "field delimiter must not be empty");
    }

    // A second load starts from a fresh table.
    loaded_ = false;
    row_count_ = 0;
    range_ = ActiveRange{};
    columns_.clear();
    columns_.reserve(registry_->size());
    for (ColumnNumber c = 1; c <= registry_->size(); ++c) {
        columns_.emplace_back(c);
    }

    std::vector<Column*> storage;
    storage.reserve(columns_.size());
    for (ColumnNumber c = 1; c <= columns_.size(); ++c) {
        auto column = checked_column(c);
        if (!column) {
            return std::unexpected(column.error());
        }
        storage.push_back(&columns_[c - 1]);
    }

    RowNumber row = 0;
    for (const auto& line : lines) {
        ++row;
        auto fields = io::split_fields(line, delimiter);
        const std::size_t count = std::min(fields.size(), storage.size());
        for (std::size_t i = 0; i < count; ++i) {
            storage[i]->set(row, std::move(fields[i]));
        }
    }

    row_count_ = row;
    range_ = ActiveRange::all(row_count_, columns_.size());
    loaded_ = true;
    spdlog::debug("loaded table: {} rows x {} columns", row_count_, columns_.size());
    return {};
}

auto Table::load(std::istream& input, std::string_view delimiter) -> Result<void> {
    auto lines = io::read_lines(input);
    return load(std::span<const std::string>(lines), delimiter);
}

// ─── Active range ─────────────────────────────────────────────────────────────

auto Table::get_active_range() const -> Result<RangeToken> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    return range_.token();
}

auto Table::set_active_range(const RangeToken& token) -> Result<void> {
    if (auto ok = require_loaded(); !ok) {
        return ok;
    }
    range_.restore(token);
    return {};
}

auto Table::get_inactive_range() const -> Result<RangeToken> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    return range_.complement(row_count_, columns_.size());
}

// ─── Projection ───────────────────────────────────────────────────────────────

auto Table::print(std::ostream& out, const PrintOptions& options) const -> Result<void> {
    if (auto ok = require_loaded(); !ok) {
        return ok;
    }
    if (range_.empty()) {
        return {};
    }

    std::vector<const Column*> active;
    active.reserve(range_.columns().size());
    for (ColumnNumber c : range_.columns()) {
        auto column = checked_column(c);
        if (!column) {
            return std::unexpected(column.error());
        }
        active.push_back(*column);
    }

    std::string line;
    for (RowNumber r : range_.rows()) {
        line.clear();
        if (options.show_row_number) {
            line += fmt::format("{}{}", r, options.delimiter);
        }
        bool first = true;
        for (const Column* column : active) {
            if (!first) {
                line += options.delimiter;
            }
            first = false;
            auto value = column->find(r);
            if (value.has_value()) {
                line += *value;
            } else if (options.na_fill.has_value()) {
                line += *options.na_fill;
            }
        }
        line.push_back('\n');
        out << line;
    }
    return {};
}

auto Table::render(const PrintOptions& options) const -> Result<std::string> {
    std::ostringstream out;
    if (auto ok = print(out, options); !ok) {
        return std::unexpected(ok.error());
    }
    return out.str();
}

// ─── Cell access ──────────────────────────────────────────────────────────────

auto Table::cell(RowNumber row, ColumnNumber column) const -> Result<std::optional<std::string>> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    if (row == 0 || row > row_count_) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("row {} is outside 1..{}", row, row_count_));
    }
    if (column == 0 || column > columns_.size()) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("column {} is outside 1..{}", column, columns_.size()));
    }
    auto storage = checked_column(column);
    if (!storage) {
        return std::unexpected(storage.error());
    }
    auto value = (*storage)->find(row);
    if (!value.has_value()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::string(*value)};
}

auto Table::cell(RowNumber row, std::string_view identifier) const
    -> Result<std::optional<std::string>> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    auto number = registry_->number_of(identifier);
    if (!number.has_value()) {
        return make_error(ErrorKind::InvalidArgument, fmt::format("unknown column '{}'", identifier));
    }
    return cell(row, *number);
}

auto Table::column_cells(ColumnNumber column) const
    -> Result<std::vector<std::optional<std::string>>> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    if (column == 0 || column > columns_.size()) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("column {} is outside 1..{}", column, columns_.size()));
    }
    auto storage = checked_column(column);
    if (!storage) {
        return std::unexpected(storage.error());
    }
    std::vector<std::optional<std::string>> cells(row_count_);
    for (const auto& [row, value] : **storage) {
        if (row >= 1 && row <= row_count_) {
            cells[row - 1] = value;
        }
    }
    return cells;
}

auto Table::row_cells(RowNumber row) const -> Result<std::vector<std::optional<std::string>>> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    if (row == 0 || row > row_count_) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("row {} is outside 1..{}", row, row_count_));
    }
    std::vector<std::optional<std::string>> cells;
    cells.reserve(columns_.size());
    for (ColumnNumber c = 1; c <= columns_.size(); ++c) {
        auto storage = checked_column(c);
        if (!storage) {
            return std::unexpected(storage.error());
        }
        auto value = (*storage)->find(row);
        cells.push_back(value.has_value() ? std::optional<std::string>{std::string(*value)}
                                          : std::nullopt);
    }
    return cells;
}

auto Table::active_names() const -> Result<std::vector<std::string>> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    std::vector<std::string> names;
    for (ColumnNumber c : range_.columns()) {
        auto storage = checked_column(c);
        if (!storage) {
            return std::unexpected(storage.error());
        }
        names.push_back(registry_->name_of(c));
    }
    return names;
}

auto Table::active_labels() const -> Result<std::vector<std::string>> {
    if (auto ok = require_loaded(); !ok) {
        return std::unexpected(ok.error());
    }
    std::vector<std::string> labels;
    for (ColumnNumber c : range_.columns()) {
        auto storage = checked_column(c);
        if (!storage) {
            return std::unexpected(storage.error());
        }
        labels.push_back(registry_->label_of(c));
    }
    return labels;
}

}  // namespace tbl
