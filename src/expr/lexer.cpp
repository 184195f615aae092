#include <tbl/core/registry.hpp>
#include <tbl/expr/lexer.hpp>

#include <cctype>
#include <charconv>
#include <unordered_map>

namespace tbl::expr {

auto tokenize(std::string_view source, char sentinel) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length,
                               std::size_t line, std::size_t column) -> Token& {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .line = line,
            .column = column,
        });
        return tokens.back();
    };

    const std::unordered_map<std::string_view, TokenKind> test_operators = {
        {"-n", TokenKind::TestNonEmpty},
        {"-z", TokenKind::TestEmpty},
        {"-eq", TokenKind::IntEq},
        {"-ne", TokenKind::IntNe},
        {"-lt", TokenKind::IntLt},
        {"-le", TokenKind::IntLe},
        {"-gt", TokenKind::IntGt},
        {"-ge", TokenKind::IntGe},
    };

    const auto is_word_char = [](char ch) -> bool {
        switch (ch) {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
            case '(':
            case ')':
            case '<':
            case '>':
            case '=':
            case '!':
            case '&':
            case '|':
            case '"':
            case '\'':
            case '\0':
                return false;
            default:
                return true;
        }
    };

    std::size_t i = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    const auto at_end = [&]() -> bool {
        return i >= source.size();
    };
    const auto peek = [&](std::size_t offset = 0) -> char {
        if (i + offset >= source.size()) {
            return '\0';
        }
        return source[i + offset];
    };
    const auto advance = [&]() -> char {
        if (at_end()) {
            return '\0';
        }
        char ch = source[i++];
        if (ch == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
        return ch;
    };
    const auto match = [&](char expected) -> bool {
        if (peek() != expected) {
            return false;
        }
        advance();
        return true;
    };

    while (!at_end()) {
        char next = peek();
        if (next == ' ' || next == '\t' || next == '\r' || next == '\n') {
            advance();
            continue;
        }

        std::size_t token_start = i;
        std::size_t token_line = line;
        std::size_t token_column = column;
        char ch = advance();

        switch (ch) {
            case '"':
            case '\'': {
                while (!at_end() && peek() != ch) {
                    if (ch == '"' && peek() == '\\' && peek(1) != '\0') {
                        advance();
                    }
                    advance();
                }
                if (at_end()) {
                    add_token(TokenKind::Error, token_start, i - token_start, token_line,
                              token_column);
                    continue;
                }
                advance();
                add_token(TokenKind::StringLiteral, token_start, i - token_start, token_line,
                          token_column);
                continue;
            }
            case '(':
                add_token(TokenKind::LParen, token_start, 1, token_line, token_column);
                continue;
            case ')':
                add_token(TokenKind::RParen, token_start, 1, token_line, token_column);
                continue;
            case '<':
                add_token(TokenKind::Lt, token_start, 1, token_line, token_column);
                continue;
            case '>':
                add_token(TokenKind::Gt, token_start, 1, token_line, token_column);
                continue;
            case '=':
                if (match('=')) {
                    add_token(TokenKind::EqEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::EqEq, token_start, 1, token_line, token_column);
                }
                continue;
            case '!':
                if (match('=')) {
                    add_token(TokenKind::BangEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Bang, token_start, 1, token_line, token_column);
                }
                continue;
            case '&':
                if (match('&')) {
                    add_token(TokenKind::AmpAmp, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '|':
                if (match('|')) {
                    add_token(TokenKind::PipePipe, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '$': {
                if (std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                    continue;
                }
                while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                    advance();
                }
                std::string_view digits = source.substr(token_start + 1, i - token_start - 1);
                ColumnNumber number = 0;
                auto result = std::from_chars(digits.data(), digits.data() + digits.size(), number);
                if (result.ec != std::errc() || number == 0) {
                    add_token(TokenKind::Error, token_start, i - token_start, token_line,
                              token_column);
                    continue;
                }
                add_token(TokenKind::ColumnRef, token_start, i - token_start, token_line,
                          token_column)
                    .column_number = number;
                continue;
            }
            default:
                break;
        }

        while (is_word_char(peek())) {
            advance();
        }
        std::string_view text = source.substr(token_start, i - token_start);
        if (auto it = test_operators.find(text); it != test_operators.end()) {
            add_token(it->second, token_start, i - token_start, token_line, token_column);
            continue;
        }
        if (is_identifier(text, sentinel)) {
            add_token(TokenKind::Identifier, token_start, i - token_start, token_line,
                      token_column);
            continue;
        }
        add_token(TokenKind::Word, token_start, i - token_start, token_line, token_column);
    }

    tokens.push_back(Token{
        .kind = TokenKind::Eof,
        .lexeme = source.substr(source.size(), 0),
        .line = line,
        .column = column,
    });
    return tokens;
}

auto token_kind_name(TokenKind kind) -> std::string_view {
    switch (kind) {
        case TokenKind::Word:
            return "word";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::ColumnRef:
            return "column reference";
        case TokenKind::TestNonEmpty:
        case TokenKind::TestEmpty:
            return "unary test";
        case TokenKind::EqEq:
        case TokenKind::BangEq:
        case TokenKind::Lt:
        case TokenKind::Gt:
        case TokenKind::IntEq:
        case TokenKind::IntNe:
        case TokenKind::IntLt:
        case TokenKind::IntLe:
        case TokenKind::IntGt:
        case TokenKind::IntGe:
            return "comparison";
        case TokenKind::AmpAmp:
        case TokenKind::PipePipe:
        case TokenKind::Bang:
            return "logical operator";
        case TokenKind::LParen:
        case TokenKind::RParen:
            return "parenthesis";
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "invalid token";
    }
    return "token";
}

}  // namespace tbl::expr
