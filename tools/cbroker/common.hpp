/**
 * cbroker CLI - Common utilities and types
 */

#pragma once

#include <cbroker/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace cbroker::cli {

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    std::string log_level;         // --log-level
};

/**
 * Apply the log level. Priority: --log-level > -v/-q > config value.
 */
inline void configure_logging(const GlobalOptions& opts, const std::string& config_level = "info") {
    std::string name = config_level;
    if (opts.verbose) name = "debug";
    if (opts.quiet) name = "error";
    if (!opts.log_level.empty()) name = opts.log_level;

    auto level = parse_log_level(name);
    if (!level) {
        spdlog::warn("unknown log level '{}', using info", name);
        level = spdlog::level::info;
    }
    spdlog::set_level(*level);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

} // namespace cbroker::cli
