#include <recon/host/host.hpp>
#include <recon/io/json.hpp>
#include <recon/runtime/ops.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <expected>
#include <iterator>
#include <string>

namespace recon::host {

namespace {

auto run_pretty(Operation op, const std::string& request, std::ostream& out)
    -> std::expected<void, Error> {
    if (op == Operation::Compare) {
        auto input = io::decode_compare_input(request);
        if (!input) {
            return std::unexpected(input.error());
        }
        auto output = runtime::compare(*input);
        if (!output) {
            return std::unexpected(output.error());
        }
        ops::print(*output, out);
        return {};
    }

    auto input = io::decode_split_input(request);
    if (!input) {
        return std::unexpected(input.error());
    }
    auto output = runtime::split(*input);
    if (!output) {
        return std::unexpected(output.error());
    }
    ops::print(*output, out);
    return {};
}

auto run_json(Operation op, const std::string& request, std::ostream& out)
    -> std::expected<void, Error> {
    auto response = op == Operation::Compare ? io::compare_json(request) : io::split_json(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    out << *response << "\n";
    return {};
}

}  // namespace

auto run(const HostConfig& config, std::istream& in, std::ostream& out, std::ostream& err)
    -> int {
    std::string request(std::istreambuf_iterator<char>{in}, {});
    spdlog::debug("host: read {} byte request for {}", request.size(),
                  config.operation == Operation::Compare ? "compare" : "split");

    auto status = config.pretty ? run_pretty(config.operation, request, out)
                                : run_json(config.operation, request, out);
    if (!status) {
        err << fmt::format("error: {}\n", status.error().format());
        return 1;
    }
    return 0;
}

}  // namespace recon::host
