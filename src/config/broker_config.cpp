#include "cbroker/config.hpp"

#include "cbroker/registry.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cbroker {

using json = nlohmann::json;

namespace {

struct ConfigTypeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void warn_unknown(const json& section, const std::string& prefix,
                  const std::set<std::string>& known, std::vector<std::string>& warnings) {
    for (auto& [key, val] : section.items()) {
        (void)val;
        if (known.count(key) == 0) {
            warnings.push_back("unknown_key:" + prefix + key);
        }
    }
}

const json* section(const json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) return nullptr;
    if (!j[key].is_object()) throw ConfigTypeError(key + " must be an object");
    return &j[key];
}

void read_string(const json& j, const std::string& key, const std::string& path, std::string& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    if (!j[key].is_string()) throw ConfigTypeError(path + " must be a string");
    out = j[key].get<std::string>();
}

template<typename T>
void read_number(const json& j, const std::string& key, const std::string& path, T& out, T min_value) {
    if (!j.contains(key) || j[key].is_null()) return;
    if (!j[key].is_number_integer()) throw ConfigTypeError(path + " must be an integer");
    auto value = j[key].get<int64_t>();
    if (value < static_cast<int64_t>(min_value)) {
        throw ConfigTypeError(path + " must be at least " + std::to_string(min_value));
    }
    out = static_cast<T>(value);
}

std::vector<json> read_objects(const json& j, const std::string& key) {
    std::vector<json> result;
    if (!j.contains(key) || j[key].is_null()) return result;
    if (!j[key].is_array()) throw ConfigTypeError(key + " must be an array");
    for (const auto& entry : j[key]) {
        if (!entry.is_object()) throw ConfigTypeError(key + " entries must be objects");
        result.push_back(entry);
    }
    return result;
}

} // namespace

BrokerConfig default_broker_config() {
    return BrokerConfig{};
}

BrokerConfigParseResult parse_broker_config(const std::string& json_str,
                                            const std::string& source_path) {
    BrokerConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        warn_unknown(j, "", {"listen", "rpc_path", "schema_base", "log_level", "sandbox",
                             "provider", "contracts", "transforms"}, result.warnings);

        auto& cfg = result.config;

        if (const json* listen = section(j, "listen")) {
            warn_unknown(*listen, "listen.", {"host", "port"}, result.warnings);
            read_string(*listen, "host", "listen.host", cfg.listen.host);
            read_number(*listen, "port", "listen.port", cfg.listen.port, 0);
            if (cfg.listen.port > 65535) throw ConfigTypeError("listen.port must be at most 65535");
        }

        read_string(j, "rpc_path", "rpc_path", cfg.rpc_path);
        if (cfg.rpc_path.empty() || cfg.rpc_path[0] != '/') {
            throw ConfigTypeError("rpc_path must start with '/'");
        }

        read_string(j, "schema_base", "schema_base", cfg.schema_base);
        if (cfg.schema_base.empty() && !source_path.empty()) {
            cfg.schema_base = std::filesystem::path(source_path).parent_path().string();
        }

        read_string(j, "log_level", "log_level", cfg.log_level);
        if (!parse_log_level(cfg.log_level)) {
            result.warnings.push_back("invalid_configuration:log_level:" + cfg.log_level);
            cfg.log_level = "info";
        }

        if (const json* sandbox = section(j, "sandbox")) {
            warn_unknown(*sandbox, "sandbox.", {"helper_path", "timeout_ms", "memory_limit_mb",
                                                "cpu_seconds", "max_output_bytes"},
                         result.warnings);
            read_string(*sandbox, "helper_path", "sandbox.helper_path", cfg.sandbox.helper_path);
            read_number(*sandbox, "timeout_ms", "sandbox.timeout_ms", cfg.sandbox.timeout_ms, int64_t{1});
            read_number(*sandbox, "memory_limit_mb", "sandbox.memory_limit_mb",
                        cfg.sandbox.memory_limit_mb, uint64_t{0});
            read_number(*sandbox, "cpu_seconds", "sandbox.cpu_seconds", cfg.sandbox.cpu_seconds, uint64_t{0});
            read_number(*sandbox, "max_output_bytes", "sandbox.max_output_bytes",
                        cfg.sandbox.max_output_bytes, size_t{1});
        }

        if (const json* provider = section(j, "provider")) {
            warn_unknown(*provider, "provider.", {"connect_timeout_ms", "read_timeout_ms"}, result.warnings);
            read_number(*provider, "connect_timeout_ms", "provider.connect_timeout_ms",
                        cfg.provider.connect_timeout_ms, int64_t{1});
            read_number(*provider, "read_timeout_ms", "provider.read_timeout_ms",
                        cfg.provider.read_timeout_ms, int64_t{1});
        }

        cfg.contracts = read_objects(j, "contracts");
        cfg.transforms = read_objects(j, "transforms");

        result.ok = true;
        return result;

    } catch (const ConfigTypeError& e) {
        result.error = e.what();
        return result;
    } catch (const json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

BrokerConfigParseResult load_broker_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        BrokerConfigParseResult result;
        result.error = "cannot read config file: " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_broker_config(buffer.str(), path);
}

std::vector<std::string> apply_env_overrides(BrokerConfig& config, const EnvLookup& getenv) {
    std::vector<std::string> warnings;

    std::string port = getenv("CBROKER_PORT");
    if (!port.empty()) {
        char* end = nullptr;
        long value = std::strtol(port.c_str(), &end, 10);
        if (end != port.c_str() + port.size() || value < 0 || value > 65535) {
            warnings.push_back("invalid_environment:CBROKER_PORT:" + port);
        } else {
            config.listen.port = static_cast<int>(value);
        }
    }

    std::string schema_base = getenv("CBROKER_SCHEMA_BASE");
    if (!schema_base.empty()) config.schema_base = schema_base;

    std::string sandbox = getenv("CBROKER_SANDBOX");
    if (!sandbox.empty()) config.sandbox.helper_path = sandbox;

    return warnings;
}

Result<void> apply_startup_entries(const BrokerConfig& config, ContractRegistry& registry) {
    for (size_t i = 0; i < config.contracts.size(); ++i) {
        auto request = parse_registration_params(config.contracts[i]);
        if (request.isErr()) {
            return Result<void>::err(request.error().withContext("contracts[" + std::to_string(i) + "]"));
        }
        auto outcome = registry.register_contract(request.value());
        if (outcome.isErr()) {
            return Result<void>::err(outcome.error().withContext("contracts[" + std::to_string(i) + "]"));
        }
    }

    for (size_t i = 0; i < config.transforms.size(); ++i) {
        auto def = parse_transform_params(config.transforms[i]);
        if (def.isErr()) {
            return Result<void>::err(def.error().withContext("transforms[" + std::to_string(i) + "]"));
        }
        auto stored = registry.register_transform(def.value());
        if (stored.isErr()) {
            return Result<void>::err(stored.error().withContext("transforms[" + std::to_string(i) + "]"));
        }
    }

    if (!config.contracts.empty() || !config.transforms.empty()) {
        spdlog::info("applied {} contract(s) and {} transform(s) from config",
                     config.contracts.size(), config.transforms.size());
    }
    return Result<void>::ok();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace cbroker
