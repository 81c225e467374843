#include <recon/runtime/keys.hpp>
#include <recon/runtime/ops.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace recon::ops {

namespace {

template <typename T>
auto unwrap(std::expected<T, Error> result) -> T {
    if (!result) {
        throw std::runtime_error(result.error().format());
    }
    return std::move(*result);
}

}  // namespace

// ─── Throwing conveniences ────────────────────────────────────────────────────

auto compare(const Table& left, const Table& right, const std::string& key,
             CompareOptions options) -> runtime::CompareOutput {
    return unwrap(runtime::compare(runtime::CompareInput{
        .left = left,
        .right = right,
        .key = key,
        .options = options,
    }));
}

auto compare(const Table& left, const Table& right, const std::vector<std::string>& keys,
             CompareOptions options) -> runtime::CompareOutput {
    return unwrap(runtime::compare_on_keys(left, right, keys, options));
}

auto split(const Table& table, const std::string& key) -> runtime::SplitOutput {
    return unwrap(runtime::split(runtime::SplitInput{.table = table, .key = key}));
}

auto split(const Table& table, const std::vector<std::string>& keys) -> runtime::SplitOutput {
    return unwrap(runtime::split_on_keys(table, keys));
}

// ─── Printing ─────────────────────────────────────────────────────────────────

void print(const Table& t, std::ostream& out) {
    if (t.headers.empty()) {
        out << "(empty table)\n";
        return;
    }

    // Column widths from headers and every cell; missing cells print blank.
    const std::size_t cols = t.headers.size();
    std::vector<std::size_t> widths(cols);
    for (std::size_t c = 0; c < cols; ++c) {
        widths[c] = t.headers[c].size();
        for (const auto& row : t.rows) {
            widths[c] = std::max(widths[c], cell_or_empty(row, c).size());
        }
    }

    // Header row.
    for (std::size_t c = 0; c < cols; ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", t.headers[c], widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < cols; ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (const auto& row : t.rows) {
        for (std::size_t c = 0; c < cols; ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cell_or_empty(row, c), widths[c]);
        }
        out << "\n";
    }
}

void print(const runtime::CompareOutput& output, std::ostream& out) {
    const std::pair<const char*, const Table*> sections[] = {
        {"result", &output.result},
        {"left_only", &output.left_only},
        {"right_only", &output.right_only},
        {"duplicates", &output.duplicates},
    };
    for (const auto& [name, table] : sections) {
        out << fmt::format("== {} ({} rows)\n", name, table->rows.size());
        print(*table, out);
        out << "\n";
    }
    out << "== log\n";
    for (const auto& [label, value] : output.log) {
        out << fmt::format("{}: {}\n", label, value);
    }
}

void print(const runtime::SplitOutput& output, std::ostream& out) {
    for (const auto& part : output.parts) {
        out << fmt::format("== {} ({} rows)\n", part.key_value, part.table.rows.size());
        print(part.table, out);
        out << "\n";
    }
}

}  // namespace recon::ops
