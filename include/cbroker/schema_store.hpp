#pragma once

#include "cbroker/error.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace cbroker {

// ============================================================================
// Schema Store
// ============================================================================

// Resolves a schema path to raw bytes. Relative paths are resolved against
// the caller-provided base.
class SchemaStore {
public:
    virtual ~SchemaStore() = default;

    // Turn a (possibly relative) path into the path actually read.
    virtual std::string resolve(const std::string& path, const std::string& base) const = 0;

    // Read the resolved path. SCHEMA_NOT_FOUND when it is not a readable file.
    virtual Result<std::string> read(const std::string& resolved_path) const = 0;
};

class FileSchemaStore : public SchemaStore {
public:
    std::string resolve(const std::string& path, const std::string& base) const override;
    Result<std::string> read(const std::string& resolved_path) const override;
};

// ============================================================================
// Schema Loading
// ============================================================================

struct LoadedSchema {
    std::string path;
    nlohmann::json schema;
};

// Resolve, read, parse and validate a schema against the draft-07 meta-schema.
// Errors: SCHEMA_NOT_FOUND "Schema file not found: <path>",
//         INVALID_JSON "Invalid JSON in <path>: ...",
//         INVALID_SCHEMA "Invalid JSON Schema in <path>: ...".
Result<LoadedSchema> load_schema(const SchemaStore& store,
                                 const std::string& path,
                                 const std::string& base);

// Validate an already-parsed document against the draft-07 meta-schema.
// Returns an empty string when valid, otherwise the validator's message.
std::string check_json_schema(const nlohmann::json& schema);

} // namespace cbroker
