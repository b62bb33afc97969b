/**
 * cbroker CLI - run-script command
 *
 * Run a transform script through the same sandbox the broker uses.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cbroker/sandbox.hpp>

#include <fstream>
#include <sstream>

namespace cbroker::cli::commands {

namespace {

struct RunScriptOptions {
    std::string script_path;
    std::string input = "{}";
    int64_t timeout_ms = 2000;
    std::string helper_path;
};

int cmd_run_script(const GlobalOptions& opts, const RunScriptOptions& run_opts) {
    configure_logging(opts);

    std::ifstream file(run_opts.script_path);
    if (!file) {
        print_error("cannot read script: " + run_opts.script_path, opts.json);
        return 1;
    }
    std::stringstream source;
    source << file.rdbuf();

    auto input = nlohmann::json::parse(run_opts.input, nullptr, false);
    if (input.is_discarded()) {
        print_error("--input is not valid JSON", opts.json);
        return 1;
    }

    SandboxLimits limits;
    limits.timeout_ms = run_opts.timeout_ms;
    limits.helper_path = run_opts.helper_path.empty() ? safe_getenv("CBROKER_SANDBOX")
                                                      : run_opts.helper_path;
    SandboxExecutor sandbox(limits);

    auto result = sandbox.execute(source.str(), input);
    if (result.isErr()) {
        if (opts.json) {
            output_json({{"ok", false},
                         {"code", error_code_to_string(result.error().code())},
                         {"error", result.error().message()}});
        } else {
            std::cerr << error_code_to_string(result.error().code()) << ": "
                      << result.error().message() << std::endl;
        }
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"value", result.value()}});
    } else {
        std::cout << result.value().dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_run_script(CLI::App* app, GlobalOptions& opts) {
    static RunScriptOptions run_opts;

    app->add_option("-s,--script", run_opts.script_path, "Script file")->required();
    app->add_option("-i,--input", run_opts.input, "Input value as JSON");
    app->add_option("--timeout-ms", run_opts.timeout_ms, "Wall-clock deadline")->check(CLI::PositiveNumber);
    app->add_option("--sandbox", run_opts.helper_path, "Path to cbroker-sandbox");

    app->callback([&opts]() {
        std::exit(cmd_run_script(opts, run_opts));
    });
}

} // namespace cbroker::cli::commands
