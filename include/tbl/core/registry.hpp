#pragma once

#include <tbl/core/column.hpp>
#include <tbl/core/error.hpp>

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tbl {

/// Hash for identifier lookups by `std::string_view` without a temporary string.
struct NameHash {
    using is_transparent = void;
    auto operator()(std::string_view name) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(name);
    }
};

/// Produces the ordered list of column identifiers, one per column.
using NameGenerator = std::function<std::vector<std::string>()>;

/// Maps a column identifier to its raw label text (`namespace:label`).
using LabelLookup = std::function<std::optional<std::string>(std::string_view)>;

struct RegistryOptions {
    /// Leading character that marks a word as a column identifier.
    char sentinel = '_';
};

class ColumnRegistry;

/// Build a registry from the name generator's output.
///
/// Fails with ErrorKind::Configuration when the generator is unset, yields no
/// names, or yields a duplicate or malformed identifier.
[[nodiscard]] auto build_registry(const NameGenerator& generator, const LabelLookup& labels = {},
                                  RegistryOptions options = {}) -> Result<ColumnRegistry>;

/// Immutable mapping between column identifiers, column numbers and labels.
///
/// Column numbers are 1-based and follow the generator's enumeration order.
class ColumnRegistry {
   public:
    ColumnRegistry() = default;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return names_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return names_.empty(); }
    [[nodiscard]] auto sentinel() const noexcept -> char { return sentinel_; }

    [[nodiscard]] auto number_of(std::string_view name) const -> std::optional<ColumnNumber>;

    /// Identifier of column `number`. Requires 1 <= number <= size().
    [[nodiscard]] auto name_of(ColumnNumber number) const -> const std::string&;

    /// Label of column `number` (possibly empty). Requires 1 <= number <= size().
    [[nodiscard]] auto label_of(ColumnNumber number) const -> const std::string&;

    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& { return names_; }
    [[nodiscard]] auto labels() const noexcept -> const std::vector<std::string>& {
        return labels_;
    }

    /// Whether `text` has the shape of a column identifier under this
    /// registry's sentinel (it need not be registered).
    [[nodiscard]] auto is_identifier(std::string_view text) const noexcept -> bool;

   private:
    friend auto build_registry(const NameGenerator& generator, const LabelLookup& labels,
                               RegistryOptions options) -> Result<ColumnRegistry>;

    char sentinel_ = '_';
    std::vector<std::string> names_;
    std::vector<std::string> labels_;
    std::unordered_map<std::string, ColumnNumber, NameHash, std::equal_to<>> index_;
};

/// Identifier shape check: sentinel followed by one or more [A-Za-z0-9_].
[[nodiscard]] auto is_identifier(std::string_view text, char sentinel) noexcept -> bool;

/// Strip the namespace prefix (everything up to and including the first ':').
[[nodiscard]] auto strip_label_namespace(std::string_view raw) -> std::string;

/// Generator that yields a fixed list.
[[nodiscard]] auto names_generator(std::vector<std::string> names) -> NameGenerator;

/// Read a newline-separated identifier list. Blank lines are skipped and
/// surrounding whitespace is trimmed.
[[nodiscard]] auto read_names(std::istream& input) -> std::vector<std::string>;

/// Label lookup backed by environment variables named `<prefix><identifier>`.
[[nodiscard]] auto env_label_lookup(std::string prefix = "i18n_col_") -> LabelLookup;

}  // namespace tbl
