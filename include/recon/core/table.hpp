#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recon {

using Row = std::vector<std::string>;

/// A row-oriented table of text cells.
///
/// Rows are not required to match the header count: a row may be shorter
/// (missing cells read as the empty string) or longer than the header list.
/// Header names are not required to be unique; lookups resolve to the first
/// occurrence.
struct Table {
    std::vector<std::string> headers;
    std::vector<Row> rows;

    /// Index of the first header named `name`, if any.
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;

    /// Cell at (row, col), or the empty string when the row is too short.
    [[nodiscard]] auto cell(std::size_t row, std::size_t col) const -> std::string_view;

    [[nodiscard]] auto num_rows() const noexcept -> std::size_t { return rows.size(); }
    [[nodiscard]] auto num_columns() const noexcept -> std::size_t { return headers.size(); }
};

/// Cell `col` of `row`, empty when `row` has no such cell.
[[nodiscard]] inline auto cell_or_empty(const Row& row, std::size_t col) -> std::string_view {
    return col < row.size() ? std::string_view{row[col]} : std::string_view{};
}

/// Format header names for error messages: "a, b, c".
[[nodiscard]] auto format_headers(const std::vector<std::string>& headers) -> std::string;

/// Keep the named columns, in the order given. Names that are not present are skipped.
[[nodiscard]] auto select_columns(const Table& table, const std::vector<std::string>& names)
    -> Table;

/// Remove the first column named `name`. Returns the table unchanged when absent.
[[nodiscard]] auto drop_column(const Table& table, std::string_view name) -> Table;

}  // namespace recon
