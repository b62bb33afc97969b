#include "cbroker/router.hpp"

#include "cbroker/provider_client.hpp"
#include "cbroker/transform.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

namespace cbroker {

using json = nlohmann::json;

namespace {

bool satisfies(const json& metadata, const json& preferences) {
    for (auto& [key, wanted] : preferences.items()) {
        auto it = metadata.find(key);
        if (it == metadata.end() || *it != wanted) return false;
    }
    return true;
}

} // namespace

std::vector<RouteCandidate> order_candidates(std::vector<RouteCandidate> candidates,
                                             const json& preferences) {
    if (!preferences.is_object() || preferences.empty()) {
        return candidates;
    }
    std::stable_partition(candidates.begin(), candidates.end(),
                          [&preferences](const RouteCandidate& c) {
                              return satisfies(c.provider.metadata, preferences);
                          });
    return candidates;
}

RequestRouter::RequestRouter(const ContractRegistry& registry,
                             const TransformationEngine& engine,
                             const ProviderClient& client)
    : registry_(registry), engine_(engine), client_(client) {}

Result<CallResult> RequestRouter::call(const std::string& consumer_uri,
                                       const json& data,
                                       const json& preferences) const {
    using R = Result<CallResult>;
    const auto started = std::chrono::steady_clock::now();

    auto route = registry_.resolve(consumer_uri);
    if (!route) {
        return R::err(Error(ErrorCode::NO_PROVIDER, "Consumer not registered: " + consumer_uri));
    }
    if (route->candidates.empty()) {
        return R::err(Error(ErrorCode::NO_PROVIDER, "No provider matches consumer: " + consumer_uri));
    }

    for (const auto& candidate : order_candidates(std::move(route->candidates), preferences)) {
        const auto& provider = candidate.provider;
        if (!provider.endpoint) {
            spdlog::debug("route {}: skipping {} (no endpoint)", consumer_uri, provider.uri);
            continue;
        }

        auto forward = engine_.apply(candidate.forward, data);
        if (forward.isErr()) return R::err(forward.error());

        auto reply = client_.invoke(*provider.endpoint, forward.value().data);
        if (reply.isErr()) {
            if (reply.error().code() == ErrorCode::NO_PROVIDER) {
                spdlog::warn("route {}: provider {} unreachable: {}", consumer_uri, provider.uri,
                             reply.error().message());
                continue;
            }
            return R::err(Error(ErrorCode::PROVIDER_FAILED,
                                "Provider call failed: " + reply.error().message()));
        }

        auto reverse = engine_.apply(candidate.reverse, reply.value());
        if (reverse.isErr()) return R::err(reverse.error());

        CallResult result;
        result.data = std::move(reverse.value().data);
        result.meta.transform_applied = forward.value().transform_applied ||
                                        reverse.value().transform_applied;
        result.meta.provider_uri = provider.uri;
        result.meta.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        spdlog::debug("route {} -> {} in {} ms", consumer_uri, provider.uri, result.meta.latency_ms);
        return R::ok(std::move(result));
    }

    return R::err(Error(ErrorCode::NO_PROVIDER, "No available providers"));
}

} // namespace cbroker
