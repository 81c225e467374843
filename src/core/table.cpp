#include <recon/core/table.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace recon {

auto Table::find(std::string_view name) const -> std::optional<std::size_t> {
    auto it = std::ranges::find(headers, name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(headers.begin(), it));
}

auto Table::cell(std::size_t row, std::size_t col) const -> std::string_view {
    return cell_or_empty(rows.at(row), col);
}

auto format_headers(const std::vector<std::string>& headers) -> std::string {
    return fmt::format("{}", fmt::join(headers, ", "));
}

auto select_columns(const Table& table, const std::vector<std::string>& names) -> Table {
    std::vector<std::size_t> indices;
    Table out;
    for (const auto& name : names) {
        if (auto idx = table.find(name)) {
            indices.push_back(*idx);
            out.headers.push_back(name);
        }
    }

    out.rows.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        Row projected;
        projected.reserve(indices.size());
        for (auto idx : indices) {
            projected.emplace_back(cell_or_empty(row, idx));
        }
        out.rows.push_back(std::move(projected));
    }
    return out;
}

auto drop_column(const Table& table, std::string_view name) -> Table {
    auto idx = table.find(name);
    if (!idx) {
        return table;
    }

    Table out = table;
    out.headers.erase(out.headers.begin() + static_cast<std::ptrdiff_t>(*idx));
    for (auto& row : out.rows) {
        if (*idx < row.size()) {
            row.erase(row.begin() + static_cast<std::ptrdiff_t>(*idx));
        }
    }
    return out;
}

}  // namespace recon
