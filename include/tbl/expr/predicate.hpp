#pragma once

#include <tbl/core/column.hpp>
#include <tbl/core/error.hpp>
#include <tbl/core/registry.hpp>
#include <tbl/expr/ast.hpp>
#include <tbl/expr/substitute.hpp>

#include <span>
#include <string_view>
#include <utility>

namespace tbl::expr {

/// Values of the row under evaluation, indexed by column number.
///
/// Slot 0 is unused. Columns outside the span, and inactive columns left
/// empty by the caller, read as "".
class RowView {
   public:
    RowView() = default;
    explicit RowView(std::span<const std::string_view> values) : values_(values) {}

    [[nodiscard]] auto value(ColumnNumber column) const noexcept -> std::string_view {
        return column < values_.size() ? values_[column] : std::string_view{};
    }

   private:
    std::span<const std::string_view> values_;
};

/// A predicate whose column identifiers have been resolved to column numbers.
class Predicate {
   public:
    explicit Predicate(ExprPtr root, std::size_t substitutions = 0)
        : root_(std::move(root)), substitutions_(substitutions) {}

    [[nodiscard]] auto root() const noexcept -> const Expr& { return *root_; }

    /// Number of identifier rewrites spent when compiling.
    [[nodiscard]] auto substitutions() const noexcept -> std::size_t { return substitutions_; }

    /// Evaluate against one row. An integer comparison with a non-integer
    /// operand is false.
    [[nodiscard]] auto evaluate(const RowView& row) const -> bool;

   private:
    ExprPtr root_;
    std::size_t substitutions_ = 0;
};

/// Tokenize, substitute column identifiers (bounded by `max_substitutions`)
/// and parse a predicate.
[[nodiscard]] auto compile(std::string_view source, const ColumnRegistry& registry,
                           std::size_t max_substitutions = kDefaultMaxSubstitutions)
    -> Result<Predicate>;

/// Shell-style glob match (`*`, `?`, `[...]`).
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view text) -> bool;

}  // namespace tbl::expr
