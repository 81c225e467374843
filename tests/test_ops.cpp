#include <recon/runtime/ops.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace recon;

TEST_CASE("ops: compare and split return outcomes directly", "[ops]") {
    Table left{.headers = {"id", "v"}, .rows = {{"1", "a"}, {"2", "b"}}};
    Table right{.headers = {"id", "v"}, .rows = {{"1", "a"}}};

    auto out = ops::compare(left, right, std::string("id"));
    CHECK(out.result.rows.size() == 1);
    CHECK(out.left_only.rows.size() == 1);

    auto keyed = ops::compare(left, right, std::vector<std::string>{"id", "v"});
    CHECK(keyed.result.rows.size() == 1);

    auto parts = ops::split(left, std::string("v"));
    CHECK(parts.parts.size() == 2);
}

TEST_CASE("ops: failures are raised as runtime_error", "[ops]") {
    Table t{.headers = {"id"}, .rows = {}};
    REQUIRE_THROWS_AS(ops::compare(t, t, std::string("sku")), std::runtime_error);
    REQUIRE_THROWS_AS(ops::split(t, std::vector<std::string>{}), std::runtime_error);

    try {
        (void)ops::split(t, std::string("sku"));
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()).starts_with("KeyColumnNotFound: "));
    }
}

TEST_CASE("ops: print pads columns to the widest cell", "[ops]") {
    Table t{.headers = {"id", "name"}, .rows = {{"1", "alexandra"}, {"22"}}};
    std::ostringstream out;
    ops::print(t, out);

    CHECK(out.str() ==
          "id  name     \n"
          "--  ---------\n"
          "1   alexandra\n"
          "22           \n");
}

TEST_CASE("ops: print of a table without headers", "[ops]") {
    std::ostringstream out;
    ops::print(Table{}, out);
    CHECK(out.str() == "(empty table)\n");
}
