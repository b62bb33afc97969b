#include "cbroker/provider_client.hpp"

#include <chrono>

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace cbroker {

using json = nlohmann::json;

Result<EndpointParts> split_endpoint(const std::string& endpoint) {
    using R = Result<EndpointParts>;

    auto scheme_end = endpoint.find("://");
    if (scheme_end == std::string::npos) {
        return R::err(Error(ErrorCode::INVALID_PARAMS, "Endpoint is not a URL: " + endpoint));
    }
    std::string scheme = endpoint.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return R::err(Error(ErrorCode::INVALID_PARAMS, "Unsupported endpoint scheme: " + scheme));
    }

    auto authority_start = scheme_end + 3;
    auto path_start = endpoint.find('/', authority_start);
    EndpointParts parts;
    if (path_start == std::string::npos) {
        parts.scheme_host_port = endpoint;
        parts.path = "/";
    } else {
        parts.scheme_host_port = endpoint.substr(0, path_start);
        parts.path = endpoint.substr(path_start);
    }
    if (parts.scheme_host_port.size() == authority_start) {
        return R::err(Error(ErrorCode::INVALID_PARAMS, "Endpoint has no host: " + endpoint));
    }
    return R::ok(parts);
}

HttpProviderClient::HttpProviderClient(HttpClientOptions options)
    : options_(options) {}

Result<json> HttpProviderClient::invoke(const std::string& endpoint, const json& body) const {
    using R = Result<json>;

    auto parts = split_endpoint(endpoint);
    if (parts.isErr()) {
        return R::err(Error(ErrorCode::NO_PROVIDER, parts.error().message()));
    }

    httplib::Client client(parts.value().scheme_host_port);
    if (!client.is_valid()) {
        return R::err(Error(ErrorCode::NO_PROVIDER, "Cannot connect to " + endpoint));
    }
    client.set_connection_timeout(std::chrono::milliseconds(options_.connect_timeout_ms));
    client.set_read_timeout(std::chrono::milliseconds(options_.read_timeout_ms));
    client.set_write_timeout(std::chrono::milliseconds(options_.read_timeout_ms));

    auto res = client.Post(parts.value().path, body.dump(), "application/json");
    if (!res) {
        return R::err(Error(ErrorCode::NO_PROVIDER,
                            endpoint + " unreachable: " + httplib::to_string(res.error())));
    }

    if (res->status < 200 || res->status >= 300) {
        return R::err(Error(ErrorCode::PROVIDER_FAILED,
                            endpoint + " returned HTTP " + std::to_string(res->status)));
    }

    json reply = json::parse(res->body, nullptr, false);
    if (reply.is_discarded()) {
        return R::err(Error(ErrorCode::PROVIDER_FAILED, endpoint + " returned a non-JSON body"));
    }
    spdlog::debug("provider {} answered HTTP {}", endpoint, res->status);
    return R::ok(std::move(reply));
}

} // namespace cbroker
