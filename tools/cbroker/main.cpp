/**
 * cbroker CLI - Entry Point
 *
 * Schema-contract broker command-line interface.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace cbroker::cli::commands {
    void setup_serve(CLI::App* app, GlobalOptions& opts);
    void setup_check_schema(CLI::App* app, GlobalOptions& opts);
    void setup_run_script(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cbroker::cli;

    CLI::App app{"cbroker - schema-contract broker"};
    app.set_version_flag("-V,--version", CBROKER_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");
    app.add_option("--log-level", opts.log_level, "debug|info|warn|error|off");

    // Commands
    auto* serve_cmd = app.add_subcommand("serve", "Run the JSON-RPC broker");
    commands::setup_serve(serve_cmd, opts);

    auto* check_cmd = app.add_subcommand("check-schema", "Validate JSON Schema files");
    commands::setup_check_schema(check_cmd, opts);

    auto* run_cmd = app.add_subcommand("run-script", "Run a transform script in the sandbox");
    commands::setup_run_script(run_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
