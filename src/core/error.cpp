#include <tbl/core/error.hpp>

#include <fmt/core.h>

#include <utility>

namespace tbl {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Configuration:
            return "configuration error";
        case ErrorKind::CorruptedState:
            return "corrupted state";
        case ErrorKind::SubstitutionLimitExceeded:
            return "substitution limit exceeded";
        case ErrorKind::InvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace tbl
