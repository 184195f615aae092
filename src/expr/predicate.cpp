#include <tbl/expr/lexer.hpp>
#include <tbl/expr/parser.hpp>
#include <tbl/expr/predicate.hpp>

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <fnmatch.h>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tbl::expr {

namespace {

struct OperandValue {
    std::string_view text;
    /// Only unquoted literal words act as patterns. A column value on the
    /// right of `==`/`!=` always compares literally, even when it holds
    /// glob characters.
    bool is_pattern = false;
};

auto resolve(const Operand& operand, const RowView& row) -> OperandValue {
    if (const auto* column = std::get_if<ColumnOperand>(&operand)) {
        return OperandValue{.text = row.value(column->number), .is_pattern = false};
    }
    const auto& literal = std::get<LiteralOperand>(operand);
    return OperandValue{.text = literal.text, .is_pattern = !literal.quoted};
}

/// Empty (or blank) text reads as 0. Anything else that is not a signed
/// 64-bit integer yields nullopt.
auto parse_integer(std::string_view text) -> std::optional<std::int64_t> {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return std::int64_t{0};
    }
    auto end = text.find_last_not_of(" \t");
    std::string_view digits = text.substr(begin, end - begin + 1);
    if (digits.front() == '+') {
        digits.remove_prefix(1);
    }
    std::int64_t value = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc() || result.ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

auto compare(const CompareExpr& node, const RowView& row) -> bool {
    auto left = resolve(node.left, row);
    auto right = resolve(node.right, row);
    switch (node.op) {
        case CompareOp::Match:
            return right.is_pattern ? glob_match(right.text, left.text) : left.text == right.text;
        case CompareOp::NotMatch:
            return right.is_pattern ? !glob_match(right.text, left.text) : left.text != right.text;
        case CompareOp::Less:
            return left.text < right.text;
        case CompareOp::Greater:
            return left.text > right.text;
        default:
            break;
    }

    // Non-integer text fails the comparison, whatever the operator.
    auto lhs = parse_integer(left.text);
    auto rhs = parse_integer(right.text);
    if (!lhs || !rhs) {
        return false;
    }
    switch (node.op) {
        case CompareOp::IntEq:
            return *lhs == *rhs;
        case CompareOp::IntNe:
            return *lhs != *rhs;
        case CompareOp::IntLt:
            return *lhs < *rhs;
        case CompareOp::IntLe:
            return *lhs <= *rhs;
        case CompareOp::IntGt:
            return *lhs > *rhs;
        case CompareOp::IntGe:
            return *lhs >= *rhs;
        default:
            return false;
    }
}

auto eval(const Expr& expr, const RowView& row) -> bool {
    return std::visit(
        [&](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, OperandExpr>) {
                return !resolve(node.operand, row).text.empty();
            } else if constexpr (std::is_same_v<T, UnaryTestExpr>) {
                bool empty = resolve(node.operand, row).text.empty();
                return node.op == UnaryTestOp::Empty ? empty : !empty;
            } else if constexpr (std::is_same_v<T, CompareExpr>) {
                return compare(node, row);
            } else if constexpr (std::is_same_v<T, NotExpr>) {
                return !eval(*node.expr, row);
            } else {
                // Short-circuit like the shell's [[ ]].
                if (node.op == LogicalOp::And) {
                    return eval(*node.left, row) && eval(*node.right, row);
                }
                return eval(*node.left, row) || eval(*node.right, row);
            }
        },
        expr.node);
}

}  // namespace

auto glob_match(std::string_view pattern, std::string_view text) -> bool {
    std::string pattern_str(pattern);
    std::string text_str(text);
    return ::fnmatch(pattern_str.c_str(), text_str.c_str(), 0) == 0;
}

auto Predicate::evaluate(const RowView& row) const -> bool {
    return eval(*root_, row);
}

auto compile(std::string_view source, const ColumnRegistry& registry,
             std::size_t max_substitutions) -> Result<Predicate> {
    auto tokens = tokenize(source, registry.sentinel());
    auto substitutions = substitute(tokens, registry, max_substitutions);
    if (!substitutions) {
        return std::unexpected(substitutions.error());
    }
    auto root = parse(std::move(tokens));
    if (!root) {
        return make_error(ErrorKind::InvalidArgument,
                          fmt::format("filter expression: {}", root.error().format()));
    }
    return Predicate{std::move(*root), *substitutions};
}

}  // namespace tbl::expr
