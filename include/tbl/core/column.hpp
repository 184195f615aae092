#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tbl {

/// Immutable 1-based row identity assigned at load time.
using RowNumber = std::size_t;

/// Immutable 1-based column identity assigned when the registry is built.
using ColumnNumber = std::size_t;

/// Column-oriented cell storage for a single column.
///
/// A Column carries the column number it was declared with and an ordered
/// mapping from row number to cell text. Rows whose cell is absent have no
/// entry. The declared number lets the owning table verify, before every
/// access, that the store still lines up with the registry.
class Column {
   public:
    using size_type = std::size_t;
    using storage_type = std::map<RowNumber, std::string>;

    Column() = default;

    explicit Column(ColumnNumber number) : number_(number) {}

    /// Column number this storage was declared for.
    [[nodiscard]] auto number() const noexcept -> ColumnNumber { return number_; }

    /// Number of present (non-absent) cells.
    [[nodiscard]] auto size() const noexcept -> size_type { return cells_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return cells_.empty(); }

    /// Cell text, or nullopt when the cell is absent.
    [[nodiscard]] auto find(RowNumber row) const -> std::optional<std::string_view>;

    /// Cell text, empty for absent cells.
    [[nodiscard]] auto value_or_empty(RowNumber row) const -> std::string_view;

    [[nodiscard]] auto contains(RowNumber row) const -> bool { return cells_.contains(row); }

    /// Store a cell. Empty text is recorded as absent.
    void set(RowNumber row, std::string value);

    /// Remove all cells (the declared number is kept).
    void clear() noexcept { cells_.clear(); }

    // Iteration in ascending row order over present cells.
    [[nodiscard]] auto begin() const noexcept { return cells_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return cells_.cend(); }

   private:
    ColumnNumber number_ = 0;
    storage_type cells_;
};

}  // namespace tbl
