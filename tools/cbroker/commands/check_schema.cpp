/**
 * cbroker CLI - check-schema command
 *
 * Load schema files exactly as contract.register would and report problems.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cbroker/schema_store.hpp>

#include <filesystem>
#include <vector>

namespace cbroker::cli::commands {

namespace {

struct CheckSchemaOptions {
    std::vector<std::string> files;
};

int cmd_check_schema(const GlobalOptions& opts, const CheckSchemaOptions& check_opts) {
    configure_logging(opts);

    FileSchemaStore store;
    std::string base = std::filesystem::current_path().string();

    nlohmann::json report = nlohmann::json::array();
    int failures = 0;

    for (const auto& file : check_opts.files) {
        auto loaded = load_schema(store, file, base);
        nlohmann::json entry = {{"file", file}, {"ok", loaded.isOk()}};
        if (loaded.isErr()) {
            ++failures;
            entry["error"] = loaded.error().message();
            entry["code"] = error_code_to_string(loaded.error().code());
            if (!opts.json) {
                std::cerr << "FAIL " << file << ": " << loaded.error().message() << std::endl;
            }
        } else if (!opts.json && !opts.quiet) {
            std::cout << "ok   " << file << std::endl;
        }
        report.push_back(std::move(entry));
    }

    if (opts.json) {
        output_json({{"ok", failures == 0}, {"results", report}});
    }
    return failures == 0 ? 0 : 1;
}

} // anonymous namespace

void setup_check_schema(CLI::App* app, GlobalOptions& opts) {
    static CheckSchemaOptions check_opts;

    app->add_option("files", check_opts.files, "Schema files to validate")->required();

    app->callback([&opts]() {
        std::exit(cmd_check_schema(opts, check_opts));
    });
}

} // namespace cbroker::cli::commands
