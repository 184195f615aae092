#include <tbl/expr/substitute.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>

namespace tbl::expr {

namespace {

auto budget_exceeded(std::size_t needed, std::size_t max_substitutions) -> std::unexpected<Error> {
    spdlog::debug("substitution budget exceeded: {} identifiers, limit {}", needed,
                  max_substitutions);
    return make_error(ErrorKind::SubstitutionLimitExceeded,
                      fmt::format("{} column identifiers need rewriting but the limit is {}",
                                  needed, max_substitutions));
}

auto unknown_identifier(std::string_view name) -> std::unexpected<Error> {
    return make_error(ErrorKind::InvalidArgument, fmt::format("unknown column '{}'", name));
}

}  // namespace

auto substitute(std::vector<Token>& tokens, const ColumnRegistry& registry,
                std::size_t max_substitutions) -> Result<std::size_t> {
    std::size_t needed = 0;
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::Identifier) {
            ++needed;
        }
    }
    if (needed > max_substitutions) {
        return budget_exceeded(needed, max_substitutions);
    }

    std::vector<ColumnNumber> numbers;
    numbers.reserve(needed);
    for (const auto& token : tokens) {
        if (token.kind != TokenKind::Identifier) {
            continue;
        }
        auto number = registry.number_of(token.lexeme);
        if (!number.has_value()) {
            return unknown_identifier(token.lexeme);
        }
        numbers.push_back(*number);
    }

    auto next = numbers.begin();
    for (auto& token : tokens) {
        if (token.kind == TokenKind::Identifier) {
            token.kind = TokenKind::ColumnRef;
            token.column_number = *next++;
        }
    }
    return needed;
}

auto substitute_list(const std::vector<std::string>& words, const ColumnRegistry& registry,
                     std::size_t max_substitutions) -> Result<std::vector<std::string>> {
    const auto split_sign = [](std::string_view word) -> std::pair<std::string_view, std::string_view> {
        if (!word.empty() && (word.front() == '-' || word.front() == '+')) {
            return {word.substr(0, 1), word.substr(1)};
        }
        return {std::string_view{}, word};
    };

    std::size_t needed = 0;
    for (const auto& word : words) {
        if (registry.is_identifier(split_sign(word).second)) {
            ++needed;
        }
    }
    if (needed > max_substitutions) {
        return budget_exceeded(needed, max_substitutions);
    }

    std::vector<std::string> resolved;
    resolved.reserve(words.size());
    for (const auto& word : words) {
        auto [sign, body] = split_sign(word);
        if (!registry.is_identifier(body)) {
            resolved.push_back(word);
            continue;
        }
        auto number = registry.number_of(body);
        if (!number.has_value()) {
            return unknown_identifier(body);
        }
        resolved.push_back(fmt::format("{}{}", sign, *number));
    }
    return resolved;
}

}  // namespace tbl::expr
