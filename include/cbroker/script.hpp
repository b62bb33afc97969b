#pragma once

/**
 * @file script.hpp
 * @brief Transform scripts: JSONata expressions over one JSON value
 *
 * A transform script is a JSONata expression evaluated with the value being
 * transformed as its context:
 *
 * ```
 * {
 *     "temp": temperature,
 *     "humid": humidity,
 *     "city": $uppercase(location)
 * }
 * ```
 *
 * Fields missing from the input are left out of constructed objects.
 * `$error("message")` fails the transform with that message. JSONata's
 * function library is pure; there is no I/O of any kind.
 *
 * Evaluation is done by jsonata-cpp. Scripts are meant to be evaluated by the
 * sandbox helper, never inside the broker process.
 */

#include <string>

#include <nlohmann/json.hpp>

namespace cbroker {
namespace script {

struct ScriptResult {
    bool ok = false;
    nlohmann::json value;
    std::string error;
};

// Compile and evaluate `source` against `input`. Syntax errors, evaluation
// errors and $error() all come back as ok=false with the library's message.
ScriptResult run_script(const std::string& source, const nlohmann::json& input);

} // namespace script
} // namespace cbroker
