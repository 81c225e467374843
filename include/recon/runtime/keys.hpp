#pragma once

#include <recon/core/error.hpp>
#include <recon/core/normalize.hpp>
#include <recon/core/table.hpp>
#include <recon/runtime/compare.hpp>
#include <recon/runtime/split.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace recon::runtime {

/// Separator between key cells in a composite key value and column name.
inline constexpr std::string_view kCompositeKeySeparator = "|";

/// Append a helper column `column_name` holding the key cells of `keys`
/// joined by "|", then trimmed / lowercased per `options`.
///
/// Rows shorter than the header list are padded with empty cells so the
/// helper value lands in its own column. A missing key cell reads as empty,
/// so every row gets a key. Cells are joined unescaped: ("x|y", "z") and
/// ("x", "y|z") produce the same value.
[[nodiscard]] auto with_composite_key(const Table& table, const std::vector<std::string>& keys,
                                      const CompareOptions& options, std::string column_name)
    -> std::expected<Table, Error>;

/// Name for a composite key column over `keys` that collides with none of
/// the given header lists.
[[nodiscard]] auto composite_key_name(const std::vector<std::string>& keys,
                                      const std::vector<const Table*>& tables) -> std::string;

/// Compare on one or more key columns.
///
/// A helper composite key column is added to both sides, compared on, and
/// removed again from every output table. Unlike compare(), a row with no
/// cell at a key index is not skipped; it is keyed with that cell empty.
[[nodiscard]] auto compare_on_keys(const Table& left, const Table& right,
                                   const std::vector<std::string>& keys,
                                   const CompareOptions& options)
    -> std::expected<CompareOutput, Error>;

/// Split on one or more key columns (values trimmed, joined by "|"). Rows
/// come back padded or cut to the header width.
[[nodiscard]] auto split_on_keys(const Table& table, const std::vector<std::string>& keys)
    -> std::expected<SplitOutput, Error>;

/// One column of a sort order.
struct SortKey {
    std::string name;
    bool descending = false;
};

/// Stable sort of rows by `keys`, each ascending or descending. Unknown key
/// names are ignored. Values are normalized per `options`; two values that
/// both start with a number (see leading_number) compare numerically, a number
/// orders before text, anything else compares byte-wise. A descending key
/// reverses that order for its column only; rows equal on every key keep
/// their input order.
[[nodiscard]] auto sort_by_keys(const Table& table, const std::vector<SortKey>& keys,
                                const CompareOptions& options) -> Table;

/// Ascending sort on every column in `keys`.
[[nodiscard]] auto sort_by_keys(const Table& table, const std::vector<std::string>& keys,
                                const CompareOptions& options) -> Table;

}  // namespace recon::runtime
