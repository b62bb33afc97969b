#include "cbroker/schema_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json-schema.hpp>

namespace cbroker {

namespace fs = std::filesystem;

namespace {

// Formats are annotations here; only the structure of the schema is checked.
void ignore_format(const std::string& /*format*/, const std::string& /*value*/) {}

} // namespace

std::string FileSchemaStore::resolve(const std::string& path, const std::string& base) const {
    fs::path p(path);
    if (p.is_absolute() || base.empty()) {
        return p.lexically_normal().string();
    }
    return (fs::path(base) / p).lexically_normal().string();
}

Result<std::string> FileSchemaStore::read(const std::string& resolved_path) const {
    std::error_code ec;
    if (!fs::is_regular_file(resolved_path, ec)) {
        return Result<std::string>::err(
            Error(ErrorCode::SCHEMA_NOT_FOUND, "Schema file not found: " + resolved_path));
    }

    std::ifstream file(resolved_path, std::ios::binary);
    if (!file) {
        return Result<std::string>::err(
            Error(ErrorCode::SCHEMA_NOT_FOUND, "Schema file not found: " + resolved_path));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

std::string check_json_schema(const nlohmann::json& schema) {
    if (!schema.is_object()) {
        return "schema must be a JSON object";
    }
    try {
        nlohmann::json_schema::json_validator meta(nlohmann::json_schema::draft7_schema_builtin,
                                                 nullptr, ignore_format);
        meta.validate(schema);

        // The meta-schema accepts some documents the validator cannot compile
        // (e.g. unresolvable $ref); compiling catches those.
        nlohmann::json_schema::json_validator compiled(nullptr, ignore_format);
        compiled.set_root_schema(schema);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "";
}

Result<LoadedSchema> load_schema(const SchemaStore& store,
                                 const std::string& path,
                                 const std::string& base) {
    LoadedSchema loaded;
    loaded.path = store.resolve(path, base);

    auto bytes = store.read(loaded.path);
    if (bytes.isErr()) {
        return Result<LoadedSchema>::err(bytes.error());
    }

    try {
        loaded.schema = nlohmann::json::parse(bytes.value());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<LoadedSchema>::err(
            Error(ErrorCode::INVALID_JSON, "Invalid JSON in " + loaded.path + ": " + e.what()));
    }

    std::string problem = check_json_schema(loaded.schema);
    if (!problem.empty()) {
        return Result<LoadedSchema>::err(
            Error(ErrorCode::INVALID_SCHEMA, "Invalid JSON Schema in " + loaded.path + ": " + problem));
    }

    return Result<LoadedSchema>::ok(std::move(loaded));
}

} // namespace cbroker
