#include <recon/runtime/merge.hpp>
#include <recon/runtime/ops.hpp>

#include <fmt/core.h>

auto main() -> int {
    recon::Table invoices{
        .headers = {"id", "customer", "amount"},
        .rows = {{"A-1", "acme", "100"}, {"A-2", "globex", "250"}, {"A-3", "initech", "75"}},
    };
    recon::Table ledger{
        .headers = {"id", "customer", "amount"},
        .rows = {{"a-1 ", "acme", "100"}, {"A-2", "globex", "240"}, {"A-4", "hooli", "30"}},
    };

    fmt::print("=== Compare on id (trim, case-insensitive) ===\n");
    auto outcome = recon::ops::compare(invoices, ledger, std::string("id"),
                                       {.trim = true, .case_insensitive = true});
    recon::ops::print(outcome);

    fmt::print("\n=== Merged view with amount delta ===\n");
    auto merged = recon::runtime::merge_view(
        outcome, {.keys = {"id"},
                  .deltas = {{.left = "amount", .right = "amount", .label = "amount_delta"}}});
    recon::ops::print(merged);

    fmt::print("\n=== Split invoices by customer ===\n");
    recon::ops::print(recon::ops::split(invoices, std::string("customer")));

    return 0;
}
