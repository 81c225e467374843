#include <recon/core/normalize.hpp>
#include <recon/runtime/merge.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <optional>

namespace recon::runtime {

namespace {

// Where a merged column takes its value from.
struct MergedColumn {
    std::optional<std::size_t> primary;
    // Fallback used when the primary cell is empty (coalesced key columns).
    std::optional<std::size_t> fallback;
};

struct DeltaColumn {
    std::optional<std::size_t> left;
    std::optional<std::size_t> right;
};

auto strip_side_prefix(std::string_view header) -> std::optional<std::string_view> {
    if (header.starts_with(kLeftPrefix)) {
        return header.substr(kLeftPrefix.size());
    }
    if (header.starts_with(kRightPrefix)) {
        return header.substr(kRightPrefix.size());
    }
    return std::nullopt;
}

auto format_delta(double value) -> std::string {
    if (value == 0.0) {
        // Avoid rendering "-0".
        value = 0.0;
    }
    return fmt::format("{}", value);
}

}  // namespace

auto numeric_value(std::string_view text) -> double {
    return leading_number(text).value_or(0.0);
}

auto merge_view(const CompareOutput& output, const MergeOptions& options) -> Table {
    const Table& schema = output.result;

    Table merged;
    std::vector<MergedColumn> columns;
    for (std::size_t i = 0; i < schema.headers.size(); ++i) {
        const auto& header = schema.headers[i];
        auto bare = strip_side_prefix(header);
        bool is_key = bare && std::ranges::find(options.keys, *bare) != options.keys.end();
        if (!is_key) {
            merged.headers.push_back(header);
            columns.push_back(MergedColumn{.primary = i, .fallback = std::nullopt});
            continue;
        }
        std::string name(*bare);
        if (merged.find(name)) {
            continue;
        }
        merged.headers.push_back(name);
        columns.push_back(MergedColumn{
            .primary = schema.find(fmt::format("{}{}", kLeftPrefix, name)),
            .fallback = schema.find(fmt::format("{}{}", kRightPrefix, name)),
        });
    }

    std::vector<DeltaColumn> deltas;
    for (const auto& spec : options.deltas) {
        if (spec.left.empty() || spec.right.empty()) {
            continue;
        }
        merged.headers.push_back(spec.label.empty() ? fmt::format("{}-{}", spec.left, spec.right)
                                                    : spec.label);
        deltas.push_back(DeltaColumn{
            .left = schema.find(fmt::format("{}{}", kLeftPrefix, spec.left)),
            .right = schema.find(fmt::format("{}{}", kRightPrefix, spec.right)),
        });
    }

    auto read = [](const Row& row, const std::optional<std::size_t>& idx) -> std::string_view {
        return idx ? cell_or_empty(row, *idx) : std::string_view{};
    };

    for (const auto* table :
         {&output.result, &output.left_only, &output.right_only, &output.duplicates}) {
        for (const auto& row : table->rows) {
            Row out;
            out.reserve(merged.headers.size());
            for (const auto& col : columns) {
                auto value = read(row, col.primary);
                if (value.empty()) {
                    value = read(row, col.fallback);
                }
                out.emplace_back(value);
            }
            for (const auto& delta : deltas) {
                double diff = numeric_value(read(row, delta.left)) -
                              numeric_value(read(row, delta.right));
                out.push_back(format_delta(diff));
            }
            merged.rows.push_back(std::move(out));
        }
    }
    return merged;
}

}  // namespace recon::runtime
