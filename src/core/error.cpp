#include <recon/core/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace recon {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::MalformedInput:
            return "MalformedInput";
        case ErrorKind::KeyColumnNotFound:
            return "KeyColumnNotFound";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

auto malformed_input(std::string message) -> Error {
    return Error{.kind = ErrorKind::MalformedInput, .message = std::move(message)};
}

auto key_column_not_found(std::string message) -> Error {
    return Error{.kind = ErrorKind::KeyColumnNotFound, .message = std::move(message)};
}

}  // namespace recon
