#include "cbroker/script.hpp"

#include <jsonata/Jsonata.h>

#include <exception>
#include <new>

namespace cbroker {
namespace script {

namespace {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

// jsonata-cpp works on ordered_json; the broker on json.
ordered_json to_ordered(const json& value) {
    return ordered_json::parse(value.dump());
}

json from_ordered(const ordered_json& value) {
    return json::parse(value.dump());
}

} // namespace

ScriptResult run_script(const std::string& source, const json& input) {
    ScriptResult result;
    if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
        result.error = "script is empty";
        return result;
    }

    try {
        jsonata::Jsonata expression(source);
        ordered_json value = expression.evaluate(to_ordered(input));
        if (value.is_null() || value.is_discarded()) {
            result.error = "script produced no value";
            return result;
        }
        result.value = from_ordered(value);
        result.ok = true;
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace script
} // namespace cbroker
