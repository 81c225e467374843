#pragma once

#include <recon/core/error.hpp>
#include <recon/core/table.hpp>

#include <expected>
#include <string>
#include <vector>

namespace recon::runtime {

struct SplitInput {
    Table table;
    std::string key;
};

struct SplitPart {
    std::string key_value;
    Table table;
};

struct SplitOutput {
    std::vector<SplitPart> parts;
};

/// Partition `input.table` by the trimmed value of its key column.
///
/// Rows whose key is empty after trimming (or missing) are grouped under
/// "EMPTY". Rows are copied unmodified; every part carries the input headers.
/// Parts are ordered by key value, byte-wise ascending.
[[nodiscard]] auto split(const SplitInput& input) -> std::expected<SplitOutput, Error>;

}  // namespace recon::runtime
