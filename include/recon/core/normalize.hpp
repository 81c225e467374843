#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace recon {

/// Key normalization rules for compare.
struct CompareOptions {
    bool trim = false;
    bool case_insensitive = false;
};

/// Group value substituted by split for keys that are empty after trimming.
inline constexpr std::string_view kEmptySplitKey = "EMPTY";

/// Strip leading and trailing Unicode White_Space from UTF-8 text.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// Copy of UTF-8 `text` with the simple (one-to-one, locale-free) Unicode
/// lowercase mapping applied per code point. Ill-formed bytes pass through.
[[nodiscard]] auto to_lower(std::string_view text) -> std::string;

/// Map a raw key cell to its comparison key: trim (if enabled), then
/// lowercase (if enabled). No other transformation is applied.
[[nodiscard]] auto normalize_key(std::string_view raw, const CompareOptions& options)
    -> std::string;

/// Map a raw key cell to its split group value: always trimmed, and
/// kEmptySplitKey when nothing is left.
[[nodiscard]] auto split_key_value(std::string_view raw) -> std::string;

/// Number at the start of `text` after leading whitespace: an optional sign,
/// then a decimal literal with optional fraction and exponent, or `Infinity`.
/// Trailing text is ignored ("10kg" reads as 10). Hex and `inf` are not numbers.
[[nodiscard]] auto leading_number(std::string_view text) -> std::optional<double>;

}  // namespace recon
