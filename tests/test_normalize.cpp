#include <recon/core/normalize.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace recon;

TEST_CASE("normalize: options off leave the key untouched", "[normalize]") {
    CompareOptions options;
    REQUIRE(normalize_key("  Key A ", options) == "  Key A ");
    REQUIRE(normalize_key("", options) == "");
}

TEST_CASE("normalize: trim strips surrounding whitespace", "[normalize]") {
    CompareOptions options{.trim = true, .case_insensitive = false};

    SECTION("leading and trailing") {
        REQUIRE(normalize_key(" \t A-1 \r\n", options) == "A-1");
    }

    SECTION("inner whitespace is not collapsed") {
        REQUIRE(normalize_key("  a   b  ", options) == "a   b");
    }

    SECTION("all whitespace becomes empty") {
        REQUIRE(normalize_key(" \t ", options) == "");
    }

    SECTION("ideographic and no-break spaces") {
        REQUIRE(normalize_key("\u3000A1\u3000", options) == "A1");
        REQUIRE(normalize_key("\u00A0\u3000 X-2\u00A0", options) == "X-2");
        REQUIRE(normalize_key("\u3000", options) == "");
    }

    SECTION("inner ideographic space is kept") {
        REQUIRE(normalize_key("\u3000\u6771\u3000\u4EAC ", options) == "\u6771\u3000\u4EAC");
    }
}

TEST_CASE("normalize: case folding lowercases letters", "[normalize]") {
    CompareOptions options{.trim = false, .case_insensitive = true};
    REQUIRE(normalize_key("AbC-9", options) == "abc-9");
    REQUIRE(normalize_key(" X ", options) == " x ");

    SECTION("accented and non-Latin letters") {
        REQUIRE(normalize_key("\u00C9cole", options) == normalize_key("\u00E9cole", options));
        REQUIRE(normalize_key("\u00C9T\u00C9", options) == "\u00E9t\u00E9");
        REQUIRE(normalize_key("\u0391\u0392\u0393", options) == "\u03B1\u03B2\u03B3");
        REQUIRE(normalize_key("\uFF21\uFF22", options) == "\uFF41\uFF42");
    }

    SECTION("caseless scripts are unchanged") {
        REQUIRE(normalize_key("\u30C6\u30B9\u30C8", options) == "\u30C6\u30B9\u30C8");
    }

    SECTION("ill-formed UTF-8 passes through") {
        REQUIRE(normalize_key("A\xFF\xC3" "B", options) == "a\xFF\xC3" "b");
    }
}

TEST_CASE("normalize: trim then fold", "[normalize]") {
    CompareOptions options{.trim = true, .case_insensitive = true};
    REQUIRE(normalize_key(" A ", options) == normalize_key("a", options));
    REQUIRE(normalize_key("\u3000A1", options) == "a1");
}

TEST_CASE("split key value: trims and substitutes EMPTY", "[normalize]") {
    REQUIRE(split_key_value("  north ") == "north");
    REQUIRE(split_key_value("") == "EMPTY");
    REQUIRE(split_key_value("   ") == "EMPTY");
    REQUIRE(split_key_value("North") == "North");
    REQUIRE(split_key_value("\u3000north\u3000") == "north");
    REQUIRE(split_key_value("\u3000\u3000") == "EMPTY");
}

TEST_CASE("leading number: reads the numeric prefix", "[normalize]") {
    REQUIRE(leading_number("10") == 10.0);
    REQUIRE(leading_number("  -2.5e2xyz") == -250.0);
    REQUIRE(leading_number("10kg") == 10.0);
    REQUIRE(leading_number(".5") == 0.5);
    REQUIRE(leading_number("3e") == 3.0);
    REQUIRE(leading_number("-Infinity") == -std::numeric_limits<double>::infinity());

    REQUIRE_FALSE(leading_number("").has_value());
    REQUIRE_FALSE(leading_number("kg10").has_value());
    REQUIRE_FALSE(leading_number("-").has_value());
    REQUIRE_FALSE(leading_number(".").has_value());
    REQUIRE_FALSE(leading_number("inf").has_value());
    REQUIRE_FALSE(leading_number("nan").has_value());
    REQUIRE(leading_number("0x1A") == 0.0);
}
