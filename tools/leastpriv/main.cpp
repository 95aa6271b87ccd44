/**
 * leastpriv CLI - Entry Point
 *
 * Least-privilege permission analysis for application principals.
 */

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "common.hpp"

// Forward declarations for commands
namespace leastpriv::cli::commands {
    void setup_analyze(CLI::App* app, GlobalOptions& opts);
    void setup_map(CLI::App* app, GlobalOptions& opts);
    void setup_canonicalize(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace leastpriv::cli;

    // Keep stdout for reports
    spdlog::set_default_logger(spdlog::stderr_color_mt("leastpriv"));

    CLI::App app{"leastpriv - least-privilege permission analysis"};
    app.set_version_flag("-V,--version", LEASTPRIV_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (leastpriv.config.v1)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* analyze_cmd = app.add_subcommand("analyze", "Compute least-privileged permissions per application");
    commands::setup_analyze(analyze_cmd, opts);

    auto* map_cmd = app.add_subcommand("map", "Inspect permission maps");
    commands::setup_map(map_cmd, opts);

    auto* canonicalize_cmd = app.add_subcommand("canonicalize", "Print the canonical form of URIs");
    commands::setup_canonicalize(canonicalize_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
