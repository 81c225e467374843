#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace recon {

enum class ErrorKind : std::uint8_t {
    MalformedInput,
    KeyColumnNotFound,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Failure of a single compare/split call. Both kinds are terminal: there is
/// no partial output and retrying the same request yields the same error.
struct Error {
    ErrorKind kind = ErrorKind::MalformedInput;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto malformed_input(std::string message) -> Error;
[[nodiscard]] auto key_column_not_found(std::string message) -> Error;

}  // namespace recon
