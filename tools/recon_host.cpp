#include <recon/host/host.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"recon — reconcile and split tabular data (JSON in, JSON out)"};
    app.set_version_flag("--version", "recon_host 0.1.0");
    app.require_subcommand(1);

    recon::host::HostConfig config;

    auto add_common = [&config](CLI::App* cmd) {
        cmd->add_option("-i,--input", config.input_path, "Request JSON file (default: stdin)");
        cmd->add_option("-o,--output", config.output_path, "Response file (default: stdout)");
        cmd->add_flag("--pretty", config.pretty, "Print tables instead of JSON");
        cmd->add_flag("-v,--verbose", config.verbose, "Enable debug logging");
    };

    auto* compare_cmd = app.add_subcommand("compare", "Reconcile left and right tables on a key");
    add_common(compare_cmd);
    compare_cmd->callback([&config] { config.operation = recon::host::Operation::Compare; });

    auto* split_cmd = app.add_subcommand("split", "Partition a table by a key column");
    add_common(split_cmd);
    split_cmd->callback([&config] { config.operation = recon::host::Operation::Split; });

    CLI11_PARSE(app, argc, argv);

    // Keep stdout clean for the response.
    spdlog::set_default_logger(spdlog::stderr_color_mt("recon"));
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    std::ifstream in_file;
    if (!config.input_path.empty()) {
        in_file.open(config.input_path);
        if (!in_file) {
            std::cerr << "recon_host: cannot open '" << config.input_path << "'\n";
            return 1;
        }
    }
    std::ofstream out_file;
    if (!config.output_path.empty()) {
        out_file.open(config.output_path);
        if (!out_file) {
            std::cerr << "recon_host: cannot write to '" << config.output_path << "'\n";
            return 1;
        }
    }

    std::istream& in = config.input_path.empty() ? std::cin : in_file;
    std::ostream& out = config.output_path.empty() ? std::cout : out_file;
    return recon::host::run(config, in, out, std::cerr);
}
