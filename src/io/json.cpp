#include <recon/io/json.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace recon::io {

namespace {

using json = nlohmann::json;

auto parse_object(std::string_view text) -> std::expected<json, Error> {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(malformed_input(fmt::format("invalid JSON: {}", e.what())));
    }
    if (!doc.is_object()) {
        return std::unexpected(malformed_input("request must be a JSON object"));
    }
    return doc;
}

auto field(const json& object, const char* name, std::string_view path)
    -> std::expected<const json*, Error> {
    auto it = object.find(name);
    if (it == object.end()) {
        return std::unexpected(malformed_input(fmt::format("missing field '{}{}'", path, name)));
    }
    return &*it;
}

auto read_string(const json& value, std::string_view path) -> std::expected<std::string, Error> {
    if (!value.is_string()) {
        return std::unexpected(malformed_input(
            fmt::format("field '{}' must be a string, got {}", path, value.type_name())));
    }
    return value.get<std::string>();
}

auto read_bool(const json& value, std::string_view path) -> std::expected<bool, Error> {
    if (!value.is_boolean()) {
        return std::unexpected(malformed_input(
            fmt::format("field '{}' must be a boolean, got {}", path, value.type_name())));
    }
    return value.get<bool>();
}

auto read_strings(const json& value, std::string_view path)
    -> std::expected<std::vector<std::string>, Error> {
    if (!value.is_array()) {
        return std::unexpected(malformed_input(
            fmt::format("field '{}' must be an array, got {}", path, value.type_name())));
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        auto item = read_string(value[i], fmt::format("{}[{}]", path, i));
        if (!item) {
            return std::unexpected(item.error());
        }
        out.push_back(std::move(*item));
    }
    return out;
}

auto read_rows(const json& value, std::string_view path)
    -> std::expected<std::vector<Row>, Error> {
    if (!value.is_array()) {
        return std::unexpected(malformed_input(
            fmt::format("field '{}' must be an array, got {}", path, value.type_name())));
    }
    std::vector<Row> rows;
    rows.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        auto row = read_strings(value[i], fmt::format("{}[{}]", path, i));
        if (!row) {
            return std::unexpected(row.error());
        }
        rows.push_back(std::move(*row));
    }
    return rows;
}

// Read `object[name]` with `reader`, naming the field in errors.
template <typename Reader>
auto read_field(const json& object, const char* name, std::string_view prefix, Reader reader)
    -> decltype(reader(object, std::string_view{})) {
    auto value = field(object, name, prefix);
    if (!value) {
        return std::unexpected(value.error());
    }
    return reader(**value, fmt::format("{}{}", prefix, name));
}

auto table_to_json(const Table& table) -> json {
    return json{{"headers", table.headers}, {"rows", table.rows}};
}

}  // namespace

auto decode_compare_input(std::string_view text) -> std::expected<runtime::CompareInput, Error> {
    auto doc = parse_object(text);
    if (!doc) {
        return std::unexpected(doc.error());
    }

    runtime::CompareInput input;

    auto left_headers = read_field(*doc, "left_headers", "", read_strings);
    if (!left_headers) {
        return std::unexpected(left_headers.error());
    }
    auto left_rows = read_field(*doc, "left_rows", "", read_rows);
    if (!left_rows) {
        return std::unexpected(left_rows.error());
    }
    auto right_headers = read_field(*doc, "right_headers", "", read_strings);
    if (!right_headers) {
        return std::unexpected(right_headers.error());
    }
    auto right_rows = read_field(*doc, "right_rows", "", read_rows);
    if (!right_rows) {
        return std::unexpected(right_rows.error());
    }
    auto key = read_field(*doc, "key", "", read_string);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto options = field(*doc, "options", "");
    if (!options) {
        return std::unexpected(options.error());
    }
    if (!(*options)->is_object()) {
        return std::unexpected(malformed_input(fmt::format(
            "field 'options' must be an object, got {}", (*options)->type_name())));
    }
    auto trim = read_field(**options, "trim", "options.", read_bool);
    if (!trim) {
        return std::unexpected(trim.error());
    }
    auto case_insensitive = read_field(**options, "case_insensitive", "options.", read_bool);
    if (!case_insensitive) {
        return std::unexpected(case_insensitive.error());
    }

    input.left = Table{.headers = std::move(*left_headers), .rows = std::move(*left_rows)};
    input.right = Table{.headers = std::move(*right_headers), .rows = std::move(*right_rows)};
    input.key = std::move(*key);
    input.options = CompareOptions{.trim = *trim, .case_insensitive = *case_insensitive};
    return input;
}

auto decode_split_input(std::string_view text) -> std::expected<runtime::SplitInput, Error> {
    auto doc = parse_object(text);
    if (!doc) {
        return std::unexpected(doc.error());
    }

    auto headers = read_field(*doc, "headers", "", read_strings);
    if (!headers) {
        return std::unexpected(headers.error());
    }
    auto rows = read_field(*doc, "rows", "", read_rows);
    if (!rows) {
        return std::unexpected(rows.error());
    }
    auto key = read_field(*doc, "key", "", read_string);
    if (!key) {
        return std::unexpected(key.error());
    }

    return runtime::SplitInput{
        .table = Table{.headers = std::move(*headers), .rows = std::move(*rows)},
        .key = std::move(*key),
    };
}

auto encode(const runtime::CompareOutput& output) -> std::string {
    json log = json::array();
    for (const auto& [label, value] : output.log) {
        log.push_back(json::array({label, value}));
    }
    json doc{
        {"result", table_to_json(output.result)},
        {"left_only", table_to_json(output.left_only)},
        {"right_only", table_to_json(output.right_only)},
        {"duplicates", table_to_json(output.duplicates)},
        {"log", std::move(log)},
    };
    return doc.dump();
}

auto encode(const runtime::SplitOutput& output) -> std::string {
    json parts = json::array();
    for (const auto& part : output.parts) {
        parts.push_back(json{{"key_value", part.key_value}, {"table", table_to_json(part.table)}});
    }
    return json{{"parts", std::move(parts)}}.dump();
}

auto compare_json(std::string_view request) -> std::expected<std::string, Error> {
    auto input = decode_compare_input(request);
    if (!input) {
        spdlog::debug("compare_json: rejected request: {}", input.error().message);
        return std::unexpected(input.error());
    }
    auto output = runtime::compare(*input);
    if (!output) {
        return std::unexpected(output.error());
    }
    return encode(*output);
}

auto split_json(std::string_view request) -> std::expected<std::string, Error> {
    auto input = decode_split_input(request);
    if (!input) {
        spdlog::debug("split_json: rejected request: {}", input.error().message);
        return std::unexpected(input.error());
    }
    auto output = runtime::split(*input);
    if (!output) {
        return std::unexpected(output.error());
    }
    return encode(*output);
}

}  // namespace recon::io
