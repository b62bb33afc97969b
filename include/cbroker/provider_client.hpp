#pragma once

#include "cbroker/error.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace cbroker {

// ============================================================================
// Provider Client
// ============================================================================

/**
 * @brief Invokes a Provider endpoint with a JSON body.
 *
 * Errors distinguish "never reached" from "reached but failed":
 * - NO_PROVIDER      connection refused, DNS failure, connect/read timeout
 * - PROVIDER_FAILED  non-2xx status or a body that is not JSON
 */
class ProviderClient {
public:
    virtual ~ProviderClient() = default;

    virtual Result<nlohmann::json> invoke(const std::string& endpoint,
                                          const nlohmann::json& body) const = 0;
};

struct HttpClientOptions {
    int64_t connect_timeout_ms = 2000;
    int64_t read_timeout_ms = 10000;
};

// POSTs application/json to http://host[:port]/path using cpp-httplib.
class HttpProviderClient : public ProviderClient {
public:
    explicit HttpProviderClient(HttpClientOptions options = {});

    Result<nlohmann::json> invoke(const std::string& endpoint,
                                  const nlohmann::json& body) const override;

private:
    HttpClientOptions options_;
};

// ============================================================================
// Endpoint parsing
// ============================================================================

struct EndpointParts {
    std::string scheme_host_port;  // "http://localhost:8001"
    std::string path;              // "/weather", "/" when absent
};

// Split an endpoint URL. Only http:// and https:// are accepted.
Result<EndpointParts> split_endpoint(const std::string& endpoint);

} // namespace cbroker
