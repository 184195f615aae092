#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace tbl::io {

/// Split a record on every occurrence of `delimiter`.
///
/// The result always holds one more field than there are delimiter
/// occurrences, so trailing empty fields (`"a||"` -> `a`, ``, ``) are kept.
/// `delimiter` must not be empty.
[[nodiscard]] auto split_fields(std::string_view line, std::string_view delimiter)
    -> std::vector<std::string>;

/// Read all records from `input`, one per line, stripping a trailing '\r'.
[[nodiscard]] auto read_lines(std::istream& input) -> std::vector<std::string>;

}  // namespace tbl::io
