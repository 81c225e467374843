#pragma once

#include <recon/core/error.hpp>
#include <recon/core/normalize.hpp>
#include <recon/core/table.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace recon::runtime {

enum class MatchStatus : std::uint8_t {
    Both,
    LeftOnly,
    RightOnly,
};

[[nodiscard]] auto to_string(MatchStatus status) -> std::string_view;

/// Prefixes applied to left/right headers in the output schema.
inline constexpr std::string_view kLeftPrefix = "L__";
inline constexpr std::string_view kRightPrefix = "R__";

/// Trailing columns carried by every output row.
inline constexpr std::string_view kMatchStatusColumn = "match_status";
inline constexpr std::string_view kDiffColsColumn = "diff_cols";
inline constexpr std::string_view kDupKeyFlagColumn = "dup_key_flag";

struct CompareInput {
    Table left;
    Table right;
    std::string key;
    CompareOptions options;
};

using LogEntry = std::pair<std::string, std::string>;

/// Outcome of a compare call. All four tables share one header schema:
/// L__<left header>..., R__<right header>..., match_status, diff_cols, dup_key_flag.
struct CompareOutput {
    Table result;
    Table left_only;
    Table right_only;
    Table duplicates;
    std::vector<LogEntry> log;
};

/// Reconcile `input.left` against `input.right` on `input.key`.
///
/// Rows are grouped per side by normalized key. Keys with more than one row on
/// the left go to `duplicates` first; keys with more than one row on the right
/// follow unless the left already claimed the key. Remaining keys with a single
/// row on each side are matches (`result`), keys seen on one side only go to
/// `left_only` / `right_only`.
///
/// Output order: groups in the order their key was first seen on that side,
/// rows within a group in input order. Left duplicates precede right duplicates.
///
/// Some rows are not emitted anywhere:
///  - a single right row whose key is duplicated on the left,
///  - right duplicate rows whose key is also duplicated on the left,
///  - a single left row whose key is duplicated on the right.
[[nodiscard]] auto compare(const CompareInput& input) -> std::expected<CompareOutput, Error>;

/// Output header schema for a given pair of header lists.
[[nodiscard]] auto output_headers(const std::vector<std::string>& left_headers,
                                  const std::vector<std::string>& right_headers)
    -> std::vector<std::string>;

}  // namespace recon::runtime
