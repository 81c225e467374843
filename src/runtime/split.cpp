#include <recon/core/normalize.hpp>
#include <recon/runtime/split.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

namespace recon::runtime {

auto split(const SplitInput& input) -> std::expected<SplitOutput, Error> {
    auto key_index = input.table.find(input.key);
    if (!key_index) {
        return std::unexpected(key_column_not_found(
            fmt::format("key column '{}' not found in headers (available: {})", input.key,
                        format_headers(input.table.headers))));
    }

    robin_hood::unordered_flat_map<std::string, std::size_t> part_index;
    SplitOutput output;
    for (const auto& row : input.table.rows) {
        auto value = split_key_value(cell_or_empty(row, *key_index));
        auto [it, inserted] = part_index.try_emplace(value, output.parts.size());
        if (inserted) {
            output.parts.push_back(SplitPart{
                .key_value = std::move(value),
                .table = Table{.headers = input.table.headers, .rows = {}},
            });
        }
        output.parts[it->second].table.rows.push_back(row);
    }

    std::ranges::stable_sort(output.parts, {}, &SplitPart::key_value);

    spdlog::debug("split: key '{}' -> {} parts from {} rows", input.key, output.parts.size(),
                  input.table.rows.size());
    return output;
}

}  // namespace recon::runtime
