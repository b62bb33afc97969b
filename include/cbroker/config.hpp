#pragma once

#include "cbroker/error.hpp"
#include "cbroker/provider_client.hpp"
#include "cbroker/sandbox.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace cbroker {

class ContractRegistry;

// ============================================================================
// Broker Configuration
// ============================================================================

struct BrokerConfig {
    struct {
        std::string host = "0.0.0.0";
        int port = 8000;
    } listen;

    std::string rpc_path = "/rpc";
    std::string schema_base;   // base for relative schema paths
    std::string log_level = "info";

    SandboxLimits sandbox;
    HttpClientOptions provider;

    // Applied at startup, in order, exactly as the RPC methods would.
    std::vector<nlohmann::json> contracts;   // contract.register params
    std::vector<nlohmann::json> transforms;  // transform.register params

    std::string source_path;
};

struct BrokerConfigParseResult {
    bool ok = false;
    std::string error;
    BrokerConfig config;
    std::vector<std::string> warnings;
};

// Built-in defaults.
BrokerConfig default_broker_config();

// Parse a config document. Unknown keys are warnings, wrong types are errors.
// When schema_base is absent it defaults to the directory of source_path.
BrokerConfigParseResult parse_broker_config(const std::string& json_str,
                                            const std::string& source_path = "");

// Read and parse a config file.
BrokerConfigParseResult load_broker_config(const std::string& path);

using EnvLookup = std::function<std::string(const char*)>;

// CBROKER_PORT, CBROKER_SCHEMA_BASE and CBROKER_SANDBOX override the file.
// Returns warnings for values that could not be used.
std::vector<std::string> apply_env_overrides(BrokerConfig& config, const EnvLookup& getenv);

// Register the config's contracts, then its transforms. Stops at the first failure.
Result<void> apply_startup_entries(const BrokerConfig& config, ContractRegistry& registry);

// "debug", "info", "warn", "error", "off" (and spdlog's other names).
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace cbroker
