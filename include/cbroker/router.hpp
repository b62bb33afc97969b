#pragma once

#include "cbroker/error.hpp"
#include "cbroker/registry.hpp"
#include "cbroker/types.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cbroker {

class ProviderClient;
class TransformationEngine;

// Candidates in match order, with those whose metadata carries every
// key/value of `preferences` moved to the front (stable).
std::vector<RouteCandidate> order_candidates(std::vector<RouteCandidate> candidates,
                                             const nlohmann::json& preferences);

/**
 * @brief Routes a Consumer call to a matched Provider.
 *
 * The route is copied out of the registry before any I/O. Providers that
 * cannot be reached are skipped in favour of the next candidate; a Provider
 * that answers with an error ends the call.
 *
 * Errors:
 * - NO_PROVIDER      consumer unknown, nothing matched, or nothing reachable
 * - PROVIDER_FAILED  "Provider call failed: ..."
 * - transform errors (SCRIPT_*, SANDBOX_FAILURE) as returned by the engine
 */
class RequestRouter {
public:
    RequestRouter(const ContractRegistry& registry,
                  const TransformationEngine& engine,
                  const ProviderClient& client);

    Result<CallResult> call(const std::string& consumer_uri,
                            const nlohmann::json& data,
                            const nlohmann::json& preferences = nlohmann::json::object()) const;

private:
    const ContractRegistry& registry_;
    const TransformationEngine& engine_;
    const ProviderClient& client_;
};

} // namespace cbroker
