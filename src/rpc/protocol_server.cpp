#include "cbroker/rpc.hpp"

#include "cbroker/registry.hpp"
#include "cbroker/router.hpp"
#include "cbroker/transform.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace cbroker {

using json = nlohmann::json;

// ============================================================================
// Envelope helpers
// ============================================================================

namespace rpc {

json make_response(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"result", std::move(result)}, {"id", id}};
}

json make_error(const json& id, int code, const std::string& message, const json& data) {
    json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) {
        error["data"] = data;
    }
    return json{{"jsonrpc", "2.0"}, {"error", std::move(error)}, {"id", id}};
}

int code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_PARAMS: return INVALID_PARAMS;
        case ErrorCode::NO_PROVIDER: return NO_PROVIDER;
        default: return INTERNAL_ERROR;
    }
}

} // namespace rpc

namespace {

Error missing(const std::string& field) {
    return Error(ErrorCode::INVALID_PARAMS, "Missing required parameter: " + field);
}

Result<std::string> string_param(const json& params, const std::string& field) {
    if (!params.contains(field) || params[field].is_null()) {
        return Result<std::string>::err(missing(field));
    }
    if (!params[field].is_string() || params[field].get_ref<const std::string&>().empty()) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_PARAMS,
                                              "Invalid parameter type: " + field +
                                              " must be a non-empty string"));
    }
    return Result<std::string>::ok(params[field].get<std::string>());
}

json contract_summary(const Contract& c) {
    json j = {{"uri", c.uri}, {"type", contract_kind_to_string(c.kind)}};
    if (c.endpoint) j["endpoint"] = *c.endpoint;
    if (!c.metadata.empty()) j["metadata"] = c.metadata;
    return j;
}

json schemas_of(const Contract& c) {
    return json{{"input", c.input_schema}, {"output", c.output_schema}};
}

json provider_match_json(const MatchSummary& m) {
    return json{{"consumer", m.uri}, {"autoTransform", m.transform_applied}};
}

json consumer_match_json(const MatchSummary& m) {
    json j = {
        {"uri", m.uri},
        {"transformApplied", m.transform_applied},
        {"transformPreview", {
            {"forward", field_map_to_json(m.forward_map)},
            {"reverse", field_map_to_json(m.reverse_map)},
        }},
    };
    j["endpoint"] = m.endpoint ? json(*m.endpoint) : json();
    return j;
}

json registration_result(const Contract& contract, const std::vector<MatchSummary>& matches) {
    json result = {{"status", "registered"}};
    json list = json::array();
    if (contract.kind == ContractKind::Provider) {
        result["provider"] = contract.uri;
        for (const auto& m : matches) list.push_back(provider_match_json(m));
        result["matches"] = std::move(list);
        result["schema"] = schemas_of(contract);
    } else {
        result["consumer"] = contract.uri;
        for (const auto& m : matches) list.push_back(consumer_match_json(m));
        result["providers"] = std::move(list);
        result["expects"] = schemas_of(contract);
    }
    return result;
}

} // namespace

// ============================================================================
// ProtocolServer
// ============================================================================

ProtocolServer::ProtocolServer(ContractRegistry& registry,
                               const TransformationEngine& engine,
                               const RequestRouter& router)
    : registry_(registry), engine_(engine), router_(router) {
    add_method("contract.register", [this](const json& p) { return contract_register(p); });
    add_method("contract.test", [this](const json& p) { return contract_test(p); });
    add_method("contract.call", [this](const json& p) { return contract_call(p); });
    add_method("contract.get", [this](const json& p) { return contract_get(p); });
    add_method("contract.list", [this](const json& p) { return contract_list(p); });
    add_method("transform.register", [this](const json& p) { return transform_register(p); });
}

void ProtocolServer::add_method(const std::string& name, MethodHandler handler) {
    methods_[name] = std::move(handler);
}

bool ProtocolServer::has_method(const std::string& name) const {
    return methods_.count(name) > 0;
}

std::vector<std::string> ProtocolServer::methods() const {
    std::vector<std::string> names;
    for (const auto& [name, handler] : methods_) {
        (void)handler;
        names.push_back(name);
    }
    return names;
}

json ProtocolServer::handle(const json& message) const {
    if (message.is_array()) {
        if (message.empty()) {
            return rpc::make_error(nullptr, rpc::INVALID_REQUEST, "Invalid Request",
                                   json{{"detail", "empty batch"}});
        }
        json responses = json::array();
        for (const auto& item : message) {
            responses.push_back(handle_one(item));
        }
        return responses;
    }
    return handle_one(message);
}

std::string ProtocolServer::handle_body(const std::string& body) const {
    json message = json::parse(body, nullptr, false);
    json response;
    if (message.is_discarded()) {
        response = rpc::make_error(nullptr, rpc::PARSE_ERROR, "Parse error",
                                   json{{"detail", "request body is not valid JSON"}});
    } else {
        response = handle(message);
    }
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

json ProtocolServer::handle_one(const json& request) const {
    if (!request.is_object()) {
        return rpc::make_error(nullptr, rpc::INVALID_REQUEST, "Invalid Request",
                               json{{"detail", "request must be an object"}});
    }

    json id = nullptr;
    if (request.contains("id")) {
        const auto& raw = request["id"];
        if (raw.is_string() || raw.is_number() || raw.is_null()) id = raw;
    }

    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return rpc::make_error(id, rpc::INVALID_REQUEST, "Invalid Request",
                               json{{"detail", "jsonrpc must be \"2.0\""}});
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        return rpc::make_error(id, rpc::INVALID_REQUEST, "Invalid Request",
                               json{{"detail", "method must be a string"}});
    }
    const std::string method = request["method"].get<std::string>();

    auto it = methods_.find(method);
    if (it == methods_.end()) {
        return rpc::make_error(id, rpc::METHOD_NOT_FOUND, "Method not found",
                               json{{"detail", method}});
    }

    json params = json::object();
    if (request.contains("params") && !request["params"].is_null()) {
        params = request["params"];
        if (!params.is_object()) {
            return rpc::make_error(id, rpc::INVALID_PARAMS, "params must be an object",
                                   json{{"detail", "params must be an object"}});
        }
    }

    try {
        auto result = it->second(params);
        if (result.isOk()) {
            return rpc::make_response(id, std::move(result.value()));
        }

        const Error& err = result.error();
        spdlog::debug("{} failed: {}", method, err.toString());
        switch (rpc::code_for(err.code())) {
            case rpc::INVALID_PARAMS:
                return rpc::make_error(id, rpc::INVALID_PARAMS, err.message(),
                                       json{{"detail", err.message()}});
            case rpc::NO_PROVIDER: {
                json data = {{"detail", err.message()}};
                if (params.contains("from")) data["consumer"] = params["from"];
                return rpc::make_error(id, rpc::NO_PROVIDER, "No compatible provider found", data);
            }
            default:
                return rpc::make_error(id, rpc::INTERNAL_ERROR, "Internal error",
                                       json{{"detail", err.message()}});
        }
    } catch (const std::exception& e) {
        spdlog::error("{} raised: {}", method, e.what());
        return rpc::make_error(id, rpc::INTERNAL_ERROR, "Internal error",
                               json{{"detail", e.what()}});
    }
}

// ============================================================================
// Methods
// ============================================================================

Result<json> ProtocolServer::contract_register(const json& params) {
    auto request = parse_registration_params(params);
    if (request.isErr()) return Result<json>::err(request.error());

    auto outcome = registry_.register_contract(request.value());
    if (outcome.isErr()) return Result<json>::err(outcome.error());

    return Result<json>::ok(registration_result(outcome.value().contract, outcome.value().matches));
}

Result<json> ProtocolServer::contract_test(const json& params) const {
    auto from = string_param(params, "from");
    if (from.isErr()) return Result<json>::err(from.error());
    auto to = string_param(params, "to");
    if (to.isErr()) return Result<json>::err(to.error());

    json test_data = params.contains("testData") ? params["testData"] : json::object();

    bool dry_run = true;
    if (params.contains("dryRun") && !params["dryRun"].is_null()) {
        if (!params["dryRun"].is_boolean()) {
            return Result<json>::err(Error(ErrorCode::INVALID_PARAMS,
                                           "Invalid parameter type: dryRun must be a boolean"));
        }
        dry_run = params["dryRun"].get<bool>();
    }

    auto trace = engine_.trace(test_data, from.value(), to.value(), dry_run);
    if (trace.isErr()) return Result<json>::err(trace.error());
    return Result<json>::ok(json{{"steps", trace_to_json(trace.value())}});
}

Result<json> ProtocolServer::contract_call(const json& params) const {
    auto from = string_param(params, "from");
    if (from.isErr()) return Result<json>::err(from.error());
    if (!params.contains("data")) {
        return Result<json>::err(missing("data"));
    }

    json preferences = json::object();
    if (params.contains("preferences") && !params["preferences"].is_null()) {
        if (!params["preferences"].is_object()) {
            return Result<json>::err(Error(ErrorCode::INVALID_PARAMS,
                                           "Invalid parameter type: preferences must be an object"));
        }
        preferences = params["preferences"];
    }

    auto result = router_.call(from.value(), params["data"], preferences);
    if (result.isErr()) return Result<json>::err(result.error());

    const auto& call = result.value();
    return Result<json>::ok(json{
        {"data", call.data},
        {"meta", {
            {"transformApplied", call.meta.transform_applied},
            {"latency", call.meta.latency_ms},
            {"provider", call.meta.provider_uri},
        }},
    });
}

Result<json> ProtocolServer::contract_get(const json& params) const {
    auto uri = string_param(params, "uri");
    if (uri.isErr()) return Result<json>::err(uri.error());

    auto contract = registry_.get(uri.value());
    if (!contract) {
        return Result<json>::err(Error(ErrorCode::INVALID_PARAMS, "Contract not found: " + uri.value()));
    }

    json result = contract_summary(*contract);
    json matches = json::array();
    auto summaries = registry_.matches_for(contract->uri);
    if (contract->kind == ContractKind::Provider) {
        result["schema"] = schemas_of(*contract);
        for (const auto& m : summaries) matches.push_back(provider_match_json(m));
    } else {
        result["expects"] = schemas_of(*contract);
        for (const auto& m : summaries) matches.push_back(consumer_match_json(m));
    }
    result["matches"] = std::move(matches);
    return Result<json>::ok(std::move(result));
}

Result<json> ProtocolServer::contract_list(const json& params) const {
    std::vector<ContractKind> kinds = {ContractKind::Provider, ContractKind::Consumer};
    if (params.contains("type") && !params["type"].is_null()) {
        auto kind = params["type"].is_string() ? parse_contract_kind(params["type"].get<std::string>())
                                               : std::nullopt;
        if (!kind) {
            return Result<json>::err(Error(ErrorCode::INVALID_PARAMS,
                                           "Invalid registration type: must be 'provider' or 'consumer'"));
        }
        kinds = {*kind};
    }

    json contracts = json::array();
    for (auto kind : kinds) {
        for (const auto& c : registry_.list(kind)) {
            contracts.push_back(contract_summary(c));
        }
    }
    return Result<json>::ok(json{{"contracts", std::move(contracts)}});
}

Result<json> ProtocolServer::transform_register(const json& params) {
    auto def = parse_transform_params(params);
    if (def.isErr()) return Result<json>::err(def.error());

    auto stored = registry_.register_transform(def.value());
    if (stored.isErr()) return Result<json>::err(stored.error());

    const auto& d = def.value();
    auto providers = registry_.providers_for(d.consumer_uri);
    bool matched = std::find(providers.begin(), providers.end(), d.provider_uri) != providers.end();

    return Result<json>::ok(json{
        {"status", "registered"},
        {"from", d.consumer_uri},
        {"to", d.provider_uri},
        {"matched", matched},
    });
}

} // namespace cbroker
