#pragma once

#include <cstdint>
#include <iostream>
#include <string>

namespace recon::host {

enum class Operation : std::uint8_t {
    Compare,
    Split,
};

/// Configuration for one host invocation.
struct HostConfig {
    Operation operation = Operation::Compare;
    /// Request file; empty reads stdin.
    std::string input_path;
    /// Response file; empty writes stdout.
    std::string output_path;
    /// Print the resulting tables instead of the JSON response.
    bool pretty = false;
    bool verbose = false;
};

/// Read one JSON request from `in`, run the configured operation, and write
/// the response to `out`. Failures are reported on `err` as
/// "error: <kind>: <message>".
///
/// Returns the process exit code: 0 on success, 1 on failure.
[[nodiscard]] auto run(const HostConfig& config, std::istream& in, std::ostream& out,
                       std::ostream& err) -> int;

}  // namespace recon::host
