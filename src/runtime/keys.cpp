#include <recon/runtime/keys.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace recon::runtime {

namespace {

auto resolve_keys(const Table& table, const std::vector<std::string>& keys)
    -> std::expected<std::vector<std::size_t>, Error> {
    if (keys.empty()) {
        return std::unexpected(malformed_input("at least one key column is required"));
    }
    std::vector<std::size_t> indices;
    indices.reserve(keys.size());
    for (const auto& key : keys) {
        auto idx = table.find(key);
        if (!idx) {
            return std::unexpected(key_column_not_found(
                fmt::format("key column '{}' not found (available: {})", key,
                            format_headers(table.headers))));
        }
        indices.push_back(*idx);
    }
    return indices;
}

// Three-way comparison of two normalized key values. Numbers order before
// text so that mixed columns still form a total order.
auto compare_values(const std::string& a, const std::string& b) -> int {
    auto an = leading_number(a);
    auto bn = leading_number(b);
    if (an && bn) {
        if (*an < *bn) {
            return -1;
        }
        return *an > *bn ? 1 : 0;
    }
    if (an || bn) {
        return an ? -1 : 1;
    }
    int cmp = a.compare(b);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

auto with_side(Error error, std::string_view side) -> Error {
    error.message = fmt::format("{} side: {}", side, error.message);
    return error;
}

}  // namespace

auto with_composite_key(const Table& table, const std::vector<std::string>& keys,
                        const CompareOptions& options, std::string column_name)
    -> std::expected<Table, Error> {
    auto indices = resolve_keys(table, keys);
    if (!indices) {
        return std::unexpected(indices.error());
    }

    Table out = table;
    const auto width = out.headers.size();
    out.headers.push_back(std::move(column_name));

    std::vector<std::string_view> parts;
    for (auto& row : out.rows) {
        parts.clear();
        for (auto idx : *indices) {
            parts.push_back(cell_or_empty(row, idx));
        }
        auto joined = fmt::format("{}", fmt::join(parts, kCompositeKeySeparator));
        auto value = normalize_key(joined, options);
        if (row.size() < width) {
            row.resize(width);
        } else if (row.size() > width) {
            // Cells past the header list would shadow the helper column.
            row.erase(row.begin() + static_cast<std::ptrdiff_t>(width), row.end());
        }
        row.push_back(std::move(value));
    }
    return out;
}

auto composite_key_name(const std::vector<std::string>& keys,
                        const std::vector<const Table*>& tables) -> std::string {
    std::string name = fmt::format("{}", fmt::join(keys, kCompositeKeySeparator));
    auto taken = [&tables](const std::string& candidate) {
        return std::ranges::any_of(
            tables, [&candidate](const Table* t) { return t->find(candidate).has_value(); });
    };
    while (taken(name)) {
        name.insert(name.begin(), '_');
    }
    return name;
}

auto compare_on_keys(const Table& left, const Table& right, const std::vector<std::string>& keys,
                     const CompareOptions& options) -> std::expected<CompareOutput, Error> {
    auto name = composite_key_name(keys, {&left, &right});

    auto keyed_left = with_composite_key(left, keys, options, name);
    if (!keyed_left) {
        return std::unexpected(with_side(keyed_left.error(), "left"));
    }
    auto keyed_right = with_composite_key(right, keys, options, name);
    if (!keyed_right) {
        return std::unexpected(with_side(keyed_right.error(), "right"));
    }

    CompareInput input{
        .left = std::move(*keyed_left),
        .right = std::move(*keyed_right),
        .key = name,
        .options = options,
    };
    auto output = compare(input);
    if (!output) {
        return std::unexpected(output.error());
    }

    const auto left_helper = fmt::format("{}{}", kLeftPrefix, name);
    const auto right_helper = fmt::format("{}{}", kRightPrefix, name);
    for (auto* table :
         {&output->result, &output->left_only, &output->right_only, &output->duplicates}) {
        *table = drop_column(drop_column(*table, left_helper), right_helper);
    }
    return output;
}

auto split_on_keys(const Table& table, const std::vector<std::string>& keys)
    -> std::expected<SplitOutput, Error> {
    auto name = composite_key_name(keys, {&table});
    auto keyed = with_composite_key(table, keys, CompareOptions{.trim = true}, name);
    if (!keyed) {
        return std::unexpected(keyed.error());
    }

    auto output = split(SplitInput{.table = std::move(*keyed), .key = name});
    if (!output) {
        return std::unexpected(output.error());
    }
    for (auto& part : output->parts) {
        part.table = drop_column(part.table, name);
    }
    return output;
}

auto sort_by_keys(const Table& table, const std::vector<SortKey>& keys,
                  const CompareOptions& options) -> Table {
    std::vector<std::size_t> indices;
    std::vector<bool> descending;
    for (const auto& key : keys) {
        if (auto idx = table.find(key.name)) {
            indices.push_back(*idx);
            descending.push_back(key.descending);
        }
    }
    if (indices.empty()) {
        return table;
    }

    // Normalize every sort value once up front.
    std::vector<std::vector<std::string>> values(table.rows.size());
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        values[r].reserve(indices.size());
        for (auto idx : indices) {
            values[r].push_back(normalize_key(cell_or_empty(table.rows[r], idx), options));
        }
    }

    std::vector<std::size_t> order(table.rows.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::ranges::stable_sort(order, [&values, &descending](std::size_t a, std::size_t b) {
        for (std::size_t k = 0; k < values[a].size(); ++k) {
            int cmp = compare_values(values[a][k], values[b][k]);
            if (cmp != 0) {
                return descending[k] ? cmp > 0 : cmp < 0;
            }
        }
        return false;
    });

    Table out;
    out.headers = table.headers;
    out.rows.reserve(order.size());
    for (auto idx : order) {
        out.rows.push_back(table.rows[idx]);
    }
    return out;
}

auto sort_by_keys(const Table& table, const std::vector<std::string>& keys,
                  const CompareOptions& options) -> Table {
    std::vector<SortKey> sort_keys;
    sort_keys.reserve(keys.size());
    for (const auto& key : keys) {
        sort_keys.push_back(SortKey{.name = key, .descending = false});
    }
    return sort_by_keys(table, sort_keys, options);
}

}  // namespace recon::runtime
