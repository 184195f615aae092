#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tbl {

/// Error taxonomy shared by every table operation.
enum class ErrorKind : std::uint8_t {
    /// A required collaborator (name generator, label lookup) is missing or
    /// produced unusable output.
    Configuration,
    /// No table is loaded, or the registry and the column store disagree.
    CorruptedState,
    /// A filter expression or column list needed more identifier rewrites
    /// than the caller allowed. Recoverable: retry with a larger budget.
    SubstitutionLimitExceeded,
    /// Malformed caller input (range list token, expression syntax, unknown
    /// column identifier, out-of-universe cell address).
    InvalidArgument,
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error>;

}  // namespace tbl
