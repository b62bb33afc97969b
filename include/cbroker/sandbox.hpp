#pragma once

/**
 * @file sandbox.hpp
 * @brief Isolated execution of transform scripts
 *
 * Every execute() spawns a fresh `cbroker-sandbox` helper with fork/execve.
 * The helper runs with an empty environment, cwd "/", and only its three
 * standard streams open. It lowers its own rlimits and installs a seccomp
 * filter before it reads the script. The broker writes one JSON request to
 * the helper's stdin and reads one JSON reply from its stdout under a
 * wall-clock deadline.
 *
 * Wire format (one document each way):
 *   request: {"script": "...", "input": <json>}
 *   reply:   {"ok": true, "value": <json>} | {"ok": false, "error": "..."}
 */

#include "cbroker/error.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace cbroker {

struct SandboxLimits {
    std::string helper_path;           // empty = default_helper_path()
    int64_t timeout_ms = 2000;         // wall clock, enforced by the broker
    uint64_t memory_limit_mb = 256;    // RLIMIT_AS in the helper
    uint64_t cpu_seconds = 5;          // RLIMIT_CPU in the helper
    size_t max_output_bytes = 8 * 1024 * 1024;
};

// `cbroker-sandbox` in the directory of the running executable.
std::string default_helper_path();

// Error for a helper that died from signal `sig`.
Error signal_failure(int sig, const SandboxLimits& limits);

/**
 * @brief Runs scripts in the sandbox helper.
 *
 * Outcomes:
 * - ok(value)                 script returned a JSON value
 * - SCRIPT_TIMEOUT            deadline passed and the helper was killed, or
 *                             the helper ran out of CPU time (SIGXCPU)
 * - SCRIPT_ERROR              the script failed; message is the script's own
 * - SANDBOX_FAILURE           the helper could not be started, was killed by
 *                             another signal (e.g. the OOM killer), or produced
 *                             no valid reply
 *
 * execute() is safe to call from several threads at once; each call owns its
 * own child process and pipes.
 */
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxLimits limits = {});

    Result<nlohmann::json> execute(const std::string& script, const nlohmann::json& input) const;

    // Same, with a per-call wall-clock deadline instead of limits().timeout_ms.
    Result<nlohmann::json> execute(const std::string& script,
                                   const nlohmann::json& input,
                                   int64_t timeout_ms) const;

    const SandboxLimits& limits() const { return limits_; }

private:
    SandboxLimits limits_;
};

} // namespace cbroker
