#include <recon/core/normalize.hpp>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <cstdlib>
#include <limits>

namespace recon {

namespace {

auto bytes(std::string_view text) -> const std::uint8_t* {
    return reinterpret_cast<const std::uint8_t*>(text.data());
}

auto length_of(std::string_view text) -> std::int32_t {
    return static_cast<std::int32_t>(text.size());
}

// Ill-formed sequences decode to a negative code point and count as content.
auto is_space(UChar32 c) -> bool {
    return c >= 0 && u_isUWhiteSpace(c) != 0;
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

}  // namespace

auto trim(std::string_view text) -> std::string_view {
    const auto* s = bytes(text);
    const std::int32_t length = length_of(text);

    std::int32_t begin = 0;
    while (begin < length) {
        std::int32_t next = begin;
        UChar32 c = 0;
        U8_NEXT(s, next, length, c);
        if (!is_space(c)) {
            break;
        }
        begin = next;
    }

    std::int32_t end = length;
    while (end > begin) {
        std::int32_t prev = end;
        UChar32 c = 0;
        U8_PREV(s, begin, prev, c);
        if (!is_space(c)) {
            break;
        }
        end = prev;
    }
    return text.substr(static_cast<std::size_t>(begin), static_cast<std::size_t>(end - begin));
}

auto to_lower(std::string_view text) -> std::string {
    const auto* s = bytes(text);
    const std::int32_t length = length_of(text);

    std::string out;
    out.reserve(text.size());
    std::int32_t i = 0;
    while (i < length) {
        const std::int32_t start = i;
        UChar32 c = 0;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            // Bytes that are not valid UTF-8 are copied through unchanged.
            out.append(text.substr(static_cast<std::size_t>(start),
                                   static_cast<std::size_t>(i - start)));
            continue;
        }
        const UChar32 lower = u_tolower(c);
        char buffer[U8_MAX_LENGTH];
        std::int32_t n = 0;
        U8_APPEND_UNSAFE(buffer, n, lower);
        out.append(buffer, static_cast<std::size_t>(n));
    }
    return out;
}

auto normalize_key(std::string_view raw, const CompareOptions& options) -> std::string {
    std::string_view view = options.trim ? trim(raw) : raw;
    if (options.case_insensitive) {
        return to_lower(view);
    }
    return std::string(view);
}

auto split_key_value(std::string_view raw) -> std::string {
    auto trimmed = trim(raw);
    if (trimmed.empty()) {
        return std::string(kEmptySplitKey);
    }
    return std::string(trimmed);
}

auto leading_number(std::string_view text) -> std::optional<double> {
    text = trim(text);

    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    constexpr std::string_view kInfinity = "Infinity";
    if (text.substr(pos).starts_with(kInfinity)) {
        constexpr double inf = std::numeric_limits<double>::infinity();
        return negative ? -inf : inf;
    }

    // Decimal literal prefix: digits [. digits] [e [sign] digits].
    const std::size_t start = pos;
    std::size_t digits = 0;
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
        ++digits;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
            ++digits;
        }
    }
    if (digits == 0) {
        return std::nullopt;
    }
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        std::size_t exp = pos + 1;
        if (exp < text.size() && (text[exp] == '+' || text[exp] == '-')) {
            ++exp;
        }
        if (exp < text.size() && is_digit(text[exp])) {
            while (exp < text.size() && is_digit(text[exp])) {
                ++exp;
            }
            pos = exp;
        }
    }

    const std::string literal(text.substr(start, pos - start));
    const double value = std::strtod(literal.c_str(), nullptr);
    return negative ? -value : value;
}

}  // namespace recon
