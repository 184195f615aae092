#pragma once

#include <tbl/core/column.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tbl::expr {

/// Token types for filter predicates.
enum class TokenKind : std::uint8_t {
    // Operands
    Word,           // bare word: number, glob pattern or plain text
    StringLiteral,  // "..." or '...'
    Identifier,     // sentinel-prefixed column identifier, e.g. _PRICE
    ColumnRef,      // resolved column number: `$3`, or an Identifier after substitution

    // Unary tests
    TestNonEmpty,  // -n
    TestEmpty,     // -z

    // String comparison
    EqEq,   // == or =
    BangEq,  // !=
    Lt,      // <
    Gt,      // >

    // Integer comparison
    IntEq,  // -eq
    IntNe,  // -ne
    IntLt,  // -lt
    IntLe,  // -le
    IntGt,  // -gt
    IntGe,  // -ge

    // Logical operators
    AmpAmp,    // &&
    PipePipe,  // ||
    Bang,      // !

    // Delimiters
    LParen,  // (
    RParen,  // )

    // Special
    Eof,
    Error,
};

/// A single token with source location.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t line = 0;
    std::size_t column = 0;
    /// Set for ColumnRef tokens.
    ColumnNumber column_number = 0;
};

/// Tokenize a predicate. Words of the form `<sentinel>[A-Za-z0-9_]+` become
/// Identifier tokens; `$N` becomes a ColumnRef token.
[[nodiscard]] auto tokenize(std::string_view source, char sentinel = '_') -> std::vector<Token>;

[[nodiscard]] auto token_kind_name(TokenKind kind) -> std::string_view;

}  // namespace tbl::expr
