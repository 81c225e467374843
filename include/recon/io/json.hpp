#pragma once

#include <recon/core/error.hpp>
#include <recon/runtime/compare.hpp>
#include <recon/runtime/split.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace recon::io {

/// Decode a compare request:
///   {"left_headers": [..], "left_rows": [[..]], "right_headers": [..],
///    "right_rows": [[..]], "key": "..", "options": {"trim": b, "case_insensitive": b}}
///
/// Every field is required and every cell must be a JSON string. Unknown
/// fields are ignored. Failures are ErrorKind::MalformedInput.
[[nodiscard]] auto decode_compare_input(std::string_view text)
    -> std::expected<runtime::CompareInput, Error>;

/// Decode a split request: {"headers": [..], "rows": [[..]], "key": ".."}.
[[nodiscard]] auto decode_split_input(std::string_view text)
    -> std::expected<runtime::SplitInput, Error>;

/// {"result": T, "left_only": T, "right_only": T, "duplicates": T, "log": [[label, value]]}
/// with T = {"headers": [..], "rows": [[..]]}.
[[nodiscard]] auto encode(const runtime::CompareOutput& output) -> std::string;

/// {"parts": [{"key_value": "..", "table": T}]}
[[nodiscard]] auto encode(const runtime::SplitOutput& output) -> std::string;

/// Decode, compare, encode.
[[nodiscard]] auto compare_json(std::string_view request) -> std::expected<std::string, Error>;

/// Decode, split, encode.
[[nodiscard]] auto split_json(std::string_view request) -> std::expected<std::string, Error>;

}  // namespace recon::io
