#pragma once

#include <tbl/core/column.hpp>
#include <tbl/core/error.hpp>

#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tbl {

using RowSet = std::set<RowNumber>;
using ColumnSet = std::set<ColumnNumber>;

/// Snapshot of an active (or inactive) range.
///
/// Tokens are exchanged through Table::get_active_range,
/// Table::set_active_range and Table::get_inactive_range and round-trip
/// exactly. The textual form produced by to_string() exists for tools that
/// need to persist a token between invocations; library callers should treat
/// it as opaque.
class RangeToken {
   public:
    RangeToken() = default;
    RangeToken(RowSet rows, ColumnSet columns)
        : rows_(std::move(rows)), columns_(std::move(columns)) {}

    [[nodiscard]] auto rows() const noexcept -> const RowSet& { return rows_; }
    [[nodiscard]] auto columns() const noexcept -> const ColumnSet& { return columns_; }

    [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty() || columns_.empty(); }

    [[nodiscard]] auto to_string() const -> std::string;

    /// Parse the textual form produced by to_string().
    [[nodiscard]] static auto parse(std::string_view text) -> Result<RangeToken>;

    auto operator==(const RangeToken&) const -> bool = default;

   private:
    RowSet rows_;
    ColumnSet columns_;
};

/// The mutable view over a loaded table: which rows and columns are visible.
///
/// Both sets iterate in ascending order, which is the display and
/// evaluation order.
class ActiveRange {
   public:
    ActiveRange() = default;

    /// Range covering rows 1..row_count and columns 1..column_count.
    [[nodiscard]] static auto all(std::size_t row_count, std::size_t column_count) -> ActiveRange;

    [[nodiscard]] auto rows() const noexcept -> const RowSet& { return rows_; }
    [[nodiscard]] auto columns() const noexcept -> const ColumnSet& { return columns_; }

    [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty() || columns_.empty(); }

    void set_rows(RowSet rows) { rows_ = std::move(rows); }
    void set_columns(ColumnSet columns) { columns_ = std::move(columns); }

    [[nodiscard]] auto token() const -> RangeToken { return RangeToken{rows_, columns_}; }
    void restore(const RangeToken& token);

    /// Complement within rows 1..row_count and columns 1..column_count.
    [[nodiscard]] auto complement(std::size_t row_count, std::size_t column_count) const
        -> RangeToken;

   private:
    RowSet rows_;
    ColumnSet columns_;
};

/// Apply a signed number list to a working set, left to right.
///
/// `N` / `+N` adds N, `-N` removes N, `*` resets to 1..universe, `-*` clears.
/// Numbers outside 1..universe are ignored. Fails with InvalidArgument on a
/// token of any other shape; `set` is unchanged in that case.
[[nodiscard]] auto apply_number_list(std::set<std::size_t>& set,
                                     const std::vector<std::string>& tokens,
                                     std::size_t universe) -> Result<void>;

/// Split on blanks (spaces, tabs, newlines).
[[nodiscard]] auto split_list(std::string_view text) -> std::vector<std::string>;

}  // namespace tbl
