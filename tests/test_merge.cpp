#include <recon/runtime/merge.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace recon;
using namespace recon::runtime;

namespace {

auto outcome() -> CompareOutput {
    Table left{.headers = {"id", "amount"},
               .rows = {{"1", "10"}, {"2", "4.5"}, {"3", "x"}, {"3", "1"}}};
    Table right{.headers = {"id", "amount"}, .rows = {{"1", "7"}, {"4", "2"}}};
    auto out = compare(CompareInput{.left = left, .right = right, .key = "id", .options = {}});
    REQUIRE(out.has_value());
    return std::move(*out);
}

}  // namespace

TEST_CASE("merge: rows are concatenated in table order", "[merge]") {
    auto merged = merge_view(outcome(), {});

    CHECK(merged.headers == outcome().result.headers);
    REQUIRE(merged.rows.size() == 5);
    auto status = merged.find("match_status");
    REQUIRE(status.has_value());
    std::vector<std::string> statuses;
    for (const auto& row : merged.rows) {
        statuses.emplace_back(cell_or_empty(row, *status));
    }
    CHECK(statuses ==
          std::vector<std::string>{"both", "left_only", "right_only", "left_only", "left_only"});
}

TEST_CASE("merge: key columns are coalesced from either side", "[merge]") {
    auto merged = merge_view(outcome(), {.keys = {"id"}, .deltas = {}});

    CHECK(merged.headers == std::vector<std::string>{"id", "L__amount", "R__amount",
                                                     "match_status", "diff_cols",
                                                     "dup_key_flag"});
    REQUIRE(merged.rows.size() == 5);
    CHECK(merged.rows[0] == Row{"1", "10", "7", "both", "amount", "0"});
    CHECK(merged.rows[1] == Row{"2", "4.5", "", "left_only", "", "0"});
    CHECK(merged.rows[2] == Row{"4", "", "2", "right_only", "", "0"});
}

TEST_CASE("merge: delta columns subtract right from left", "[merge]") {
    auto merged = merge_view(
        outcome(), {.keys = {"id"},
                    .deltas = {{.left = "amount", .right = "amount", .label = "delta"},
                               {.left = "amount", .right = "amount", .label = ""},
                               {.left = "", .right = "amount", .label = "skipped"}}});

    REQUIRE(merged.headers.size() == 8);
    CHECK(merged.headers[6] == "delta");
    CHECK(merged.headers[7] == "amount-amount");

    auto delta = [&merged](std::size_t row) { return merged.rows[row][6]; };
    CHECK(delta(0) == "3");
    CHECK(delta(1) == "4.5");
    CHECK(delta(2) == "-2");
    // Non-numeric cells count as zero.
    CHECK(delta(3) == "0");
    CHECK(delta(4) == "1");
}

TEST_CASE("merge: delta against unknown columns treats them as zero", "[merge]") {
    auto merged = merge_view(outcome(), {.keys = {}, .deltas = {{.left = "amount",
                                                                  .right = "missing",
                                                                  .label = "d"}}});
    REQUIRE(merged.rows.size() == 5);
    CHECK(merged.rows[0].back() == "10");
}

TEST_CASE("merge: numeric_value reads a leading number", "[merge]") {
    CHECK(numeric_value("12") == 12.0);
    CHECK(numeric_value(" 3.5 ") == 3.5);
    CHECK(numeric_value("7kg") == 7.0);
    CHECK(numeric_value("-2e1") == -20.0);
    CHECK(numeric_value("") == 0.0);
    CHECK(numeric_value("abc") == 0.0);
    CHECK(numeric_value("nan") == 0.0);
    CHECK(numeric_value("\u30003\u3000") == 3.0);
    CHECK(numeric_value("0x1A") == 0.0);
    CHECK(numeric_value("inf") == 0.0);
}
