#include <tbl/expr/parser.hpp>

#include <fmt/core.h>

#include <optional>
#include <utility>

namespace tbl::expr {

namespace {

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_predicate() -> std::expected<ExprPtr, ParseError> {
        if (is_at_end()) {
            return std::unexpected(make_error(peek(), "empty expression"));
        }
        auto expr = parse_or();
        if (!expr) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            return std::unexpected(make_error(
                peek(), fmt::format("unexpected {} after expression", format_token(peek()))));
        }
        return expr;
    }

   private:
    auto parse_or() -> ExprPtr {
        auto expr = parse_and();
        if (!expr) {
            return nullptr;
        }
        while (match(TokenKind::PipePipe)) {
            auto right = parse_and();
            if (!right) {
                return nullptr;
            }
            expr = make_logical(LogicalOp::Or, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_and() -> ExprPtr {
        auto expr = parse_unary();
        if (!expr) {
            return nullptr;
        }
        while (match(TokenKind::AmpAmp)) {
            auto right = parse_unary();
            if (!right) {
                return nullptr;
            }
            expr = make_logical(LogicalOp::And, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_unary() -> ExprPtr {
        if (match(TokenKind::Bang)) {
            auto operand = parse_unary();
            if (!operand) {
                return nullptr;
            }
            auto node = std::make_unique<Expr>();
            node->node = NotExpr{.expr = std::move(operand)};
            return node;
        }
        return parse_test();
    }

    auto parse_test() -> ExprPtr {
        if (match(TokenKind::LParen)) {
            auto expr = parse_or();
            if (!expr) {
                return nullptr;
            }
            if (!consume(TokenKind::RParen, "expected ')' after expression")) {
                return nullptr;
            }
            return expr;
        }
        if (match(TokenKind::TestNonEmpty) || match(TokenKind::TestEmpty)) {
            auto op = previous().kind == TokenKind::TestNonEmpty ? UnaryTestOp::NonEmpty
                                                                  : UnaryTestOp::Empty;
            auto operand = parse_operand(fmt::format("expected operand after '{}'",
                                                     previous().lexeme));
            if (!operand.has_value()) {
                return nullptr;
            }
            auto node = std::make_unique<Expr>();
            node->node = UnaryTestExpr{.op = op, .operand = std::move(*operand)};
            return node;
        }

        auto left = parse_operand("expected expression");
        if (!left.has_value()) {
            return nullptr;
        }
        auto op = match_compare_op();
        if (!op.has_value()) {
            auto node = std::make_unique<Expr>();
            node->node = OperandExpr{.operand = std::move(*left)};
            return node;
        }
        auto right = parse_operand(
            fmt::format("expected operand after '{}'", previous().lexeme));
        if (!right.has_value()) {
            return nullptr;
        }
        auto node = std::make_unique<Expr>();
        node->node = CompareExpr{
            .op = *op,
            .left = std::move(*left),
            .right = std::move(*right),
        };
        return node;
    }

    auto match_compare_op() -> std::optional<CompareOp> {
        switch (peek().kind) {
            case TokenKind::EqEq:
                advance();
                return CompareOp::Match;
            case TokenKind::BangEq:
                advance();
                return CompareOp::NotMatch;
            case TokenKind::Lt:
                advance();
                return CompareOp::Less;
            case TokenKind::Gt:
                advance();
                return CompareOp::Greater;
            case TokenKind::IntEq:
                advance();
                return CompareOp::IntEq;
            case TokenKind::IntNe:
                advance();
                return CompareOp::IntNe;
            case TokenKind::IntLt:
                advance();
                return CompareOp::IntLt;
            case TokenKind::IntLe:
                advance();
                return CompareOp::IntLe;
            case TokenKind::IntGt:
                advance();
                return CompareOp::IntGt;
            case TokenKind::IntGe:
                advance();
                return CompareOp::IntGe;
            default:
                return std::nullopt;
        }
    }

    auto parse_operand(std::string_view message) -> std::optional<Operand> {
        if (match(TokenKind::ColumnRef)) {
            return Operand{ColumnOperand{
                .number = previous().column_number,
                .spelling = std::string(previous().lexeme),
            }};
        }
        if (match(TokenKind::Word)) {
            return Operand{LiteralOperand{.text = std::string(previous().lexeme), .quoted = false}};
        }
        if (match(TokenKind::StringLiteral)) {
            return Operand{
                LiteralOperand{.text = unescape_string(previous().lexeme), .quoted = true}};
        }
        if (check(TokenKind::Identifier)) {
            error_ = make_error(peek(), fmt::format("unresolved column identifier '{}'",
                                                    peek().lexeme));
            return std::nullopt;
        }
        if (check(TokenKind::Error)) {
            error_ = make_error(peek(), fmt::format("invalid token {}", format_token(peek())));
            return std::nullopt;
        }
        error_ = make_error(peek(), fmt::format("{}, found {}", message, format_token(peek())));
        return std::nullopt;
    }

    auto consume(TokenKind kind, std::string_view message) -> bool {
        if (check(kind)) {
            advance();
            return true;
        }
        error_ = make_error(peek(), fmt::format("{}, found {}", message, format_token(peek())));
        return false;
    }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto check(TokenKind kind) const -> bool { return peek().kind == kind; }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            current_ += 1;
        }
        return previous();
    }

    auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    static auto make_error(const Token& token, std::string_view message) -> ParseError {
        return ParseError{
            .message = std::string(message),
            .line = token.line,
            .column = token.column,
        };
    }

    static auto format_token(const Token& token) -> std::string {
        if (token.kind == TokenKind::Eof || token.lexeme.empty()) {
            return "'<eof>'";
        }
        return fmt::format("'{}'", token.lexeme);
    }

    static auto unescape_string(std::string_view text) -> std::string {
        if (text.size() < 2) {
            return std::string(text);
        }
        // Single quotes are literal, as in the shell.
        if (text.front() == '\'') {
            return std::string(text.substr(1, text.size() - 2));
        }
        std::string result;
        result.reserve(text.size() - 2);
        for (std::size_t idx = 1; idx + 1 < text.size(); ++idx) {
            char ch = text[idx];
            if (ch == '\\' && idx + 1 < text.size() - 1) {
                char next = text[idx + 1];
                switch (next) {
                    case 'n':
                        result.push_back('\n');
                        break;
                    case 't':
                        result.push_back('\t');
                        break;
                    default:
                        result.push_back(next);
                        break;
                }
                idx += 1;
                continue;
            }
            result.push_back(ch);
        }
        return result;
    }

    static auto make_logical(LogicalOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->node = LogicalExpr{
            .op = op,
            .left = std::move(left),
            .right = std::move(right),
        };
        return node;
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    ParseError error_{};
};

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("{}:{}: {}", line, column, message);
}

auto parse(std::vector<Token> tokens) -> std::expected<ExprPtr, ParseError> {
    if (tokens.empty() || tokens.back().kind != TokenKind::Eof) {
        tokens.push_back(Token{.kind = TokenKind::Eof});
    }
    Parser parser(std::move(tokens));
    return parser.parse_predicate();
}

}  // namespace tbl::expr
