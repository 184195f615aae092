#pragma once

#include <tbl/expr/substitute.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace tbl::repl {

/// Configuration for the REPL session.
struct ReplConfig {
    bool verbose = false;
    std::string prompt = "tbl> ";
    /// Field delimiter used by `:load` when none is given.
    std::string delimiter = "|";
    /// Initial substitution budget for `filter` and `select` (see `:budget`).
    std::size_t max_substitutions = expr::kDefaultMaxSubstitutions;
    /// Prefix of the environment variables holding column labels
    /// (`<prefix><identifier>=namespace:label`).
    std::string label_prefix = "i18n_col_";
};

/// Run the interactive REPL loop.
///
/// Reads commands from stdin until `:q` or end of input. Errors are reported
/// as `error: <message>` and the session continues.
void run(const ReplConfig& config);

/// Execute a script in a fresh session, writing all output to `out`.
///
/// Blank lines and lines starting with '#' are skipped. Stops at the first
/// failing command and returns false.
[[nodiscard]] auto execute_script(std::string_view source, std::ostream& out,
                                  const ReplConfig& config = {}) -> bool;

}  // namespace tbl::repl
