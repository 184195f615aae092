#pragma once

#include <tbl/core/error.hpp>
#include <tbl/core/registry.hpp>
#include <tbl/expr/lexer.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace tbl::expr {

/// Default cap on identifier rewrites for filter expressions and column lists.
inline constexpr std::size_t kDefaultMaxSubstitutions = 100;

/// Rewrite every Identifier token into a ColumnRef token carrying the
/// identifier's column number, in a single pass.
///
/// Each rewritten identifier counts as one substitution; ColumnRef tokens
/// written as `$N` are already resolved and cost nothing. Rewritten tokens
/// are never rescanned. Fails with SubstitutionLimitExceeded when more than
/// `max_substitutions` rewrites are needed (exactly `max_substitutions`
/// succeeds) and with InvalidArgument on an identifier the registry does not
/// know. On failure `tokens` is unchanged.
///
/// Returns the number of substitutions performed.
[[nodiscard]] auto substitute(std::vector<Token>& tokens, const ColumnRegistry& registry,
                              std::size_t max_substitutions = kDefaultMaxSubstitutions)
    -> Result<std::size_t>;

/// Resolve a column list (`_A -_B 3 -* ...`) into signed column numbers.
///
/// Words of the form `[+-]?<identifier>` are replaced by `[+-]?<number>`;
/// every other word is passed through untouched. Counting and failure rules
/// match substitute().
[[nodiscard]] auto substitute_list(const std::vector<std::string>& words,
                                   const ColumnRegistry& registry,
                                   std::size_t max_substitutions = kDefaultMaxSubstitutions)
    -> Result<std::vector<std::string>>;

}  // namespace tbl::expr
