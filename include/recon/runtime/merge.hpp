#pragma once

#include <recon/core/table.hpp>
#include <recon/runtime/compare.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace recon::runtime {

/// Numeric difference column: value(L__left) - value(R__right).
struct DeltaSpec {
    std::string left;
    std::string right;
    /// Output column name; "<left>-<right>" when empty.
    std::string label;
};

struct MergeOptions {
    /// Key columns whose L__/R__ pair is collapsed into one column.
    std::vector<std::string> keys;
    std::vector<DeltaSpec> deltas;
};

/// Flatten a compare outcome into one table.
///
/// Rows are `result`, `left_only`, `right_only`, then `duplicates`. For every
/// name in `options.keys`, the L__/R__ columns are replaced by a single column
/// holding the left value, or the right value when the left one is empty.
/// Each delta appends a column; cells that do not parse as numbers count as 0.
[[nodiscard]] auto merge_view(const CompareOutput& output, const MergeOptions& options) -> Table;

/// Leading numeric value of `text` as read by leading_number(), 0 when there
/// is none.
[[nodiscard]] auto numeric_value(std::string_view text) -> double;

}  // namespace recon::runtime
