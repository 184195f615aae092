#pragma once

#include <tbl/core/column.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace tbl::expr {

/// The current row's value in a column.
struct ColumnOperand {
    ColumnNumber number = 0;
    /// Identifier or `$N` text as written, for diagnostics.
    std::string spelling;
};

/// Constant text. Unquoted text on the right of `==`/`!=` is a glob pattern.
struct LiteralOperand {
    std::string text;
    bool quoted = false;
};

using Operand = std::variant<ColumnOperand, LiteralOperand>;

enum class UnaryTestOp : std::uint8_t {
    NonEmpty,  // -n
    Empty,     // -z
};

enum class CompareOp : std::uint8_t {
    // String comparison
    Match,     // ==, =
    NotMatch,  // !=
    Less,      // <
    Greater,   // >
    // Integer comparison
    IntEq,
    IntNe,
    IntLt,
    IntLe,
    IntGt,
    IntGe,
};

enum class LogicalOp : std::uint8_t {
    And,
    Or,
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

/// A lone operand: true when its text is non-empty.
struct OperandExpr {
    Operand operand;
};

struct UnaryTestExpr {
    UnaryTestOp op = UnaryTestOp::NonEmpty;
    Operand operand;
};

struct CompareExpr {
    CompareOp op = CompareOp::Match;
    Operand left;
    Operand right;
};

struct NotExpr {
    ExprPtr expr;
};

struct LogicalExpr {
    LogicalOp op = LogicalOp::And;
    ExprPtr left;
    ExprPtr right;
};

struct Expr {
    std::variant<OperandExpr, UnaryTestExpr, CompareExpr, NotExpr, LogicalExpr> node;
};

}  // namespace tbl::expr
