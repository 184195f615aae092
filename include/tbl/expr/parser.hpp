#pragma once

#include <tbl/core/error.hpp>
#include <tbl/expr/ast.hpp>
#include <tbl/expr/lexer.hpp>

#include <string>
#include <vector>

namespace tbl::expr {

/// Parse error with location information.
struct ParseError {
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// Parse a token stream into a predicate tree.
///
/// Identifier tokens must have been rewritten by substitute() first; a
/// leftover Identifier is reported as a parse error.
[[nodiscard]] auto parse(std::vector<Token> tokens) -> std::expected<ExprPtr, ParseError>;

}  // namespace tbl::expr
