#include <recon/runtime/compare.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <optional>

namespace recon::runtime {

namespace {

// Rows sharing one normalized key on one side, in input order.
struct KeyGroup {
    std::string key;
    std::vector<std::size_t> rows;
};

// Groups in first-seen order plus a key -> group lookup.
class KeyGroups {
   public:
    void add(std::string key, std::size_t row) {
        auto [it, inserted] = index_.try_emplace(key, groups_.size());
        if (inserted) {
            groups_.push_back(KeyGroup{.key = std::move(key), .rows = {}});
        }
        groups_[it->second].rows.push_back(row);
    }

    [[nodiscard]] auto find(const std::string& key) const -> const KeyGroup* {
        if (auto it = index_.find(key); it != index_.end()) {
            return &groups_[it->second];
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return index_.count(key) != 0;
    }

    [[nodiscard]] auto groups() const noexcept -> const std::vector<KeyGroup>& { return groups_; }

   private:
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
    std::vector<KeyGroup> groups_;
};

auto group_rows(const Table& table, std::size_t key_index, const CompareOptions& options)
    -> KeyGroups {
    KeyGroups groups;
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        // A row without a key cell cannot be correlated and is left out entirely.
        if (key_index >= row.size()) {
            continue;
        }
        groups.add(normalize_key(row[key_index], options), r);
    }
    return groups;
}

auto resolve_key(const Table& table, const std::string& key, std::string_view side)
    -> std::expected<std::size_t, Error> {
    auto idx = table.find(key);
    if (!idx) {
        return std::unexpected(key_column_not_found(fmt::format(
            "key column '{}' not found in {} headers (available: {})", key, side,
            format_headers(table.headers))));
    }
    return *idx;
}

// Builds output rows in the shared L__/R__/status schema.
class RowBuilder {
   public:
    explicit RowBuilder(const CompareInput& input)
        : input_(input),
          left_width_(input.left.headers.size()),
          right_width_(input.right.headers.size()) {
        // First right column per left header name, resolved once.
        right_for_left_.reserve(left_width_);
        for (const auto& name : input.left.headers) {
            right_for_left_.push_back(input.right.find(name));
        }
    }

    [[nodiscard]] auto left(std::size_t l, bool dup) const -> Row {
        Row row = make_row();
        fill_left(row, input_.left.rows[l]);
        finish(row, MatchStatus::LeftOnly, {}, dup);
        return row;
    }

    [[nodiscard]] auto right(std::size_t r, bool dup) const -> Row {
        Row row = make_row();
        fill_right(row, input_.right.rows[r]);
        finish(row, MatchStatus::RightOnly, {}, dup);
        return row;
    }

    [[nodiscard]] auto matched(std::size_t l, std::size_t r) const -> Row {
        const auto& left_row = input_.left.rows[l];
        const auto& right_row = input_.right.rows[r];
        Row row = make_row();
        fill_left(row, left_row);
        fill_right(row, right_row);
        finish(row, MatchStatus::Both, diff_columns(left_row, right_row), false);
        return row;
    }

   private:
    [[nodiscard]] auto make_row() const -> Row {
        Row row;
        row.reserve(left_width_ + right_width_ + 3);
        row.resize(left_width_ + right_width_);
        return row;
    }

    void fill_left(Row& row, const Row& src) const {
        for (std::size_t i = 0; i < left_width_; ++i) {
            row[i] = cell_or_empty(src, i);
        }
    }

    void fill_right(Row& row, const Row& src) const {
        for (std::size_t i = 0; i < right_width_; ++i) {
            row[left_width_ + i] = cell_or_empty(src, i);
        }
    }

    static void finish(Row& row, MatchStatus status, std::string diff_cols, bool dup) {
        row.emplace_back(to_string(status));
        row.push_back(std::move(diff_cols));
        row.emplace_back(dup ? "1" : "0");
    }

    // Left header names whose same-named right cell differs, in left header order.
    [[nodiscard]] auto diff_columns(const Row& left_row, const Row& right_row) const
        -> std::string {
        std::vector<std::string_view> diffs;
        for (std::size_t i = 0; i < left_width_; ++i) {
            const auto& right_idx = right_for_left_[i];
            if (!right_idx) {
                continue;
            }
            if (cell_or_empty(left_row, i) != cell_or_empty(right_row, *right_idx)) {
                diffs.emplace_back(input_.left.headers[i]);
            }
        }
        return fmt::format("{}", fmt::join(diffs, ","));
    }

    const CompareInput& input_;
    std::size_t left_width_;
    std::size_t right_width_;
    std::vector<std::optional<std::size_t>> right_for_left_;
};

}  // namespace

auto to_string(MatchStatus status) -> std::string_view {
    switch (status) {
        case MatchStatus::Both:
            return "both";
        case MatchStatus::LeftOnly:
            return "left_only";
        case MatchStatus::RightOnly:
            return "right_only";
    }
    return "unknown";
}

auto output_headers(const std::vector<std::string>& left_headers,
                    const std::vector<std::string>& right_headers) -> std::vector<std::string> {
    std::vector<std::string> headers;
    headers.reserve(left_headers.size() + right_headers.size() + 3);
    for (const auto& h : left_headers) {
        headers.push_back(fmt::format("{}{}", kLeftPrefix, h));
    }
    for (const auto& h : right_headers) {
        headers.push_back(fmt::format("{}{}", kRightPrefix, h));
    }
    headers.emplace_back(kMatchStatusColumn);
    headers.emplace_back(kDiffColsColumn);
    headers.emplace_back(kDupKeyFlagColumn);
    return headers;
}

auto compare(const CompareInput& input) -> std::expected<CompareOutput, Error> {
    auto left_key = resolve_key(input.left, input.key, "left");
    if (!left_key) {
        return std::unexpected(left_key.error());
    }
    auto right_key = resolve_key(input.right, input.key, "right");
    if (!right_key) {
        return std::unexpected(right_key.error());
    }

    const auto left_groups = group_rows(input.left, *left_key, input.options);
    const auto right_groups = group_rows(input.right, *right_key, input.options);
    spdlog::debug("compare: key '{}' -> {} left groups, {} right groups", input.key,
                  left_groups.groups().size(), right_groups.groups().size());

    CompareOutput output;
    const RowBuilder build(input);
    robin_hood::unordered_flat_set<std::string> processed;

    // Duplicate keys. The left side claims a key first; a right-side duplicate
    // of a key the left already claimed is not emitted.
    for (const auto& group : left_groups.groups()) {
        if (group.rows.size() <= 1) {
            continue;
        }
        for (auto l : group.rows) {
            output.duplicates.rows.push_back(build.left(l, true));
        }
        processed.insert(group.key);
    }
    for (const auto& group : right_groups.groups()) {
        if (group.rows.size() <= 1 || processed.count(group.key) != 0) {
            continue;
        }
        for (auto r : group.rows) {
            output.duplicates.rows.push_back(build.right(r, true));
        }
        processed.insert(group.key);
    }

    for (const auto& group : left_groups.groups()) {
        if (processed.count(group.key) != 0) {
            continue;
        }
        const auto* counterpart = right_groups.find(group.key);
        if (counterpart == nullptr) {
            for (auto l : group.rows) {
                output.left_only.rows.push_back(build.left(l, false));
            }
            continue;
        }
        if (group.rows.size() == 1 && counterpart->rows.size() == 1) {
            output.result.rows.push_back(build.matched(group.rows.front(),
                                                       counterpart->rows.front()));
        }
    }

    for (const auto& group : right_groups.groups()) {
        if (processed.count(group.key) != 0 || left_groups.contains(group.key)) {
            continue;
        }
        for (auto r : group.rows) {
            output.right_only.rows.push_back(build.right(r, false));
        }
    }

    auto headers = output_headers(input.left.headers, input.right.headers);
    output.result.headers = headers;
    output.left_only.headers = headers;
    output.right_only.headers = headers;
    output.duplicates.headers = std::move(headers);

    spdlog::debug("compare: {} matched, {} left only, {} right only, {} duplicate rows",
                  output.result.rows.size(), output.left_only.rows.size(),
                  output.right_only.rows.size(), output.duplicates.rows.size());

    output.log = {
        {"left_rows", std::to_string(input.left.rows.size())},
        {"right_rows", std::to_string(input.right.rows.size())},
        {"key_column", input.key},
        {"trim", input.options.trim ? "true" : "false"},
        {"case_insensitive", input.options.case_insensitive ? "true" : "false"},
    };

    return output;
}

}  // namespace recon::runtime
