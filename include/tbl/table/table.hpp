#pragma once

#include <tbl/core/column.hpp>
#include <tbl/core/error.hpp>
#include <tbl/core/range.hpp>
#include <tbl/core/registry.hpp>
#include <tbl/expr/substitute.hpp>

#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tbl {

/// Options for Table::print.
struct PrintOptions {
    std::string delimiter = "|";
    /// Text emitted in place of absent cells.
    std::optional<std::string> na_fill;
    /// Prefix every line with the immutable row number and the delimiter.
    bool show_row_number = false;
};

/// An in-memory table: a column registry, column-oriented cell storage and
/// the active range.
///
/// Row and column numbers are assigned once (registry build, load) and never
/// change. Filter, slice and select only rewrite the active range; the cells
/// themselves are never modified after load. A Table is not safe for
/// concurrent use; copy it to hand a snapshot to another reader.
class Table {
   public:
    /// A table with no registry. Every operation fails with CorruptedState.
    Table() = default;

    explicit Table(ColumnRegistry registry);

    [[nodiscard]] auto has_registry() const noexcept -> bool { return registry_ != nullptr; }
    [[nodiscard]] auto is_loaded() const noexcept -> bool { return loaded_; }

    /// Requires has_registry().
    [[nodiscard]] auto registry() const -> const ColumnRegistry& { return *registry_; }

    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return row_count_; }
    [[nodiscard]] auto column_count() const noexcept -> std::size_t { return columns_.size(); }

    // ─── Load ────────────────────────────────────────────────────────────────

    /// Load records, one per line, splitting fields on `delimiter`.
    ///
    /// Rows are numbered from 1 in input order. Loading an already loaded
    /// table discards its previous contents first.
    [[nodiscard]] auto load(std::span<const std::string> lines, std::string_view delimiter)
        -> Result<void>;
    [[nodiscard]] auto load(std::istream& input, std::string_view delimiter) -> Result<void>;

    // ─── Active range ────────────────────────────────────────────────────────

    [[nodiscard]] auto get_active_range() const -> Result<RangeToken>;

    /// Install `token` verbatim. No validation against the row/column universe.
    [[nodiscard]] auto set_active_range(const RangeToken& token) -> Result<void>;

    /// Rows 1..row_count and columns 1..column_count not in the active range.
    [[nodiscard]] auto get_inactive_range() const -> Result<RangeToken>;

    // ─── Range mutators ──────────────────────────────────────────────────────

    /// Keep the active rows for which `expression` holds.
    ///
    /// Column identifiers in `expression` are rewritten to column numbers
    /// before evaluation; more than `max_substitutions` identifiers fails
    /// with SubstitutionLimitExceeded. Rows are evaluated in ascending order.
    /// On any error the active range is left unchanged.
    [[nodiscard]] auto filter(std::string_view expression,
                              std::size_t max_substitutions = expr::kDefaultMaxSubstitutions)
        -> Result<void>;

    /// Add (`N`), remove (`-N`), reset to all (`*`) or clear (`-*`) active rows.
    [[nodiscard]] auto slice(std::string_view row_list) -> Result<void>;
    [[nodiscard]] auto slice(const std::vector<std::string>& tokens) -> Result<void>;

    /// Column counterpart of slice(). Column identifiers (optionally signed)
    /// are replaced by their column numbers first.
    [[nodiscard]] auto select(std::string_view column_list,
                              std::size_t max_substitutions = expr::kDefaultMaxSubstitutions)
        -> Result<void>;
    [[nodiscard]] auto select(const std::vector<std::string>& tokens,
                              std::size_t max_substitutions = expr::kDefaultMaxSubstitutions)
        -> Result<void>;

    // ─── Projection ──────────────────────────────────────────────────────────

    /// Write the active rows x active columns, one line per row.
    [[nodiscard]] auto print(std::ostream& out, const PrintOptions& options = {}) const
        -> Result<void>;
    [[nodiscard]] auto render(const PrintOptions& options = {}) const -> Result<std::string>;

    // ─── Cell access ─────────────────────────────────────────────────────────

    [[nodiscard]] auto cell(RowNumber row, ColumnNumber column) const
        -> Result<std::optional<std::string>>;
    [[nodiscard]] auto cell(RowNumber row, std::string_view identifier) const
        -> Result<std::optional<std::string>>;

    /// All cells of one column, rows 1..row_count.
    [[nodiscard]] auto column_cells(ColumnNumber column) const
        -> Result<std::vector<std::optional<std::string>>>;

    /// All cells of one row, columns 1..column_count.
    [[nodiscard]] auto row_cells(RowNumber row) const
        -> Result<std::vector<std::optional<std::string>>>;

    /// Identifiers of the active columns, in display order.
    [[nodiscard]] auto active_names() const -> Result<std::vector<std::string>>;

    /// Header labels of the active columns, in display order.
    [[nodiscard]] auto active_labels() const -> Result<std::vector<std::string>>;

   private:
    [[nodiscard]] auto require_loaded() const -> Result<void>;

    /// Column storage for `number` after checking it against the registry.
    [[nodiscard]] auto checked_column(ColumnNumber number) const -> Result<const Column*>;

    std::shared_ptr<const ColumnRegistry> registry_;
    std::vector<Column> columns_;
    std::size_t row_count_ = 0;
    ActiveRange range_;
    bool loaded_ = false;
};

}  // namespace tbl
