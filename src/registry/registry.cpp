#include "cbroker/registry.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace cbroker {

namespace {

Error missing(const std::string& field) {
    return Error(ErrorCode::INVALID_PARAMS, "Missing required parameter: " + field);
}

Error wrong_type(const std::string& field, const std::string& expected) {
    return Error(ErrorCode::INVALID_PARAMS,
                 "Invalid parameter type: " + field + " must be " + expected);
}

// Read a required non-empty string parameter.
Result<std::string> required_string(const nlohmann::json& params, const std::string& field) {
    if (!params.contains(field) || params[field].is_null()) {
        return Result<std::string>::err(missing(field));
    }
    if (!params[field].is_string()) {
        return Result<std::string>::err(wrong_type(field, "a string"));
    }
    auto value = params[field].get<std::string>();
    if (value.empty()) {
        return Result<std::string>::err(missing(field));
    }
    return Result<std::string>::ok(value);
}

// Read an optional string parameter; absent or null yields nullopt.
Result<std::optional<std::string>> optional_string(const nlohmann::json& params,
                                                   const std::string& field) {
    if (!params.contains(field) || params[field].is_null()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    if (!params[field].is_string()) {
        return Result<std::optional<std::string>>::err(wrong_type(field, "a string"));
    }
    return Result<std::optional<std::string>>::ok(params[field].get<std::string>());
}

} // namespace

// ============================================================================
// Parameter Parsing
// ============================================================================

Result<RegistrationRequest> parse_registration_params(const nlohmann::json& params) {
    using R = Result<RegistrationRequest>;
    RegistrationRequest req;

    auto type = required_string(params, "type");
    if (type.isErr()) return R::err(type.error());
    auto kind = parse_contract_kind(type.value());
    if (!kind) {
        return R::err(Error(ErrorCode::INVALID_PARAMS,
                            "Invalid registration type: must be 'provider' or 'consumer'"));
    }
    req.kind = *kind;

    auto uri = required_string(params, "uri");
    if (uri.isErr()) return R::err(uri.error());
    req.uri = uri.value();

    const char* input_field = req.kind == ContractKind::Provider ? "inputSchemaPath"
                                                                 : "expectsInputSchemaPath";
    const char* output_field = req.kind == ContractKind::Provider ? "outputSchemaPath"
                                                                  : "expectsOutputSchemaPath";

    auto input = required_string(params, input_field);
    if (input.isErr()) return R::err(input.error());
    req.input_schema_path = input.value();

    auto output = required_string(params, output_field);
    if (output.isErr()) return R::err(output.error());
    req.output_schema_path = output.value();

    auto endpoint = optional_string(params, "endpoint");
    if (endpoint.isErr()) return R::err(endpoint.error());
    req.endpoint = endpoint.value();

    auto base = optional_string(params, "schemaBase");
    if (base.isErr()) return R::err(base.error());
    req.schema_base = base.value();

    if (params.contains("metadata") && !params["metadata"].is_null()) {
        if (!params["metadata"].is_object()) {
            return R::err(wrong_type("metadata", "an object"));
        }
        req.metadata = params["metadata"];
    }

    return R::ok(std::move(req));
}

Result<std::vector<FieldMapping>> parse_field_map(const nlohmann::json& j, const std::string& field) {
    using R = Result<std::vector<FieldMapping>>;
    std::vector<FieldMapping> result;

    // {"city": "location"} is accepted as a shorthand; its entries apply in key order.
    if (j.is_object()) {
        for (auto& [src, dst] : j.items()) {
            if (!dst.is_string() || src.empty() || dst.get<std::string>().empty()) {
                return R::err(wrong_type(field, "a map of non-empty path strings"));
            }
            result.push_back({src, dst.get<std::string>()});
        }
        return R::ok(std::move(result));
    }

    if (!j.is_array()) {
        return R::err(wrong_type(field, "an array of {from, to} entries"));
    }
    for (const auto& entry : j) {
        if (!entry.is_object() ||
            !entry.contains("from") || !entry["from"].is_string() ||
            !entry.contains("to") || !entry["to"].is_string()) {
            return R::err(wrong_type(field, "an array of {from, to} entries"));
        }
        FieldMapping m{entry["from"].get<std::string>(), entry["to"].get<std::string>()};
        if (m.source.empty() || m.dest.empty()) {
            return R::err(wrong_type(field, "an array of non-empty {from, to} paths"));
        }
        result.push_back(std::move(m));
    }
    return R::ok(std::move(result));
}

Result<TransformDefinition> parse_transform_params(const nlohmann::json& params) {
    using R = Result<TransformDefinition>;
    TransformDefinition def;

    auto from = required_string(params, "from");
    if (from.isErr()) return R::err(from.error());
    def.consumer_uri = from.value();

    auto to = required_string(params, "to");
    if (to.isErr()) return R::err(to.error());
    def.provider_uri = to.value();

    if (params.contains("fieldMap") && !params["fieldMap"].is_null()) {
        auto map = parse_field_map(params["fieldMap"], "fieldMap");
        if (map.isErr()) return R::err(map.error());
        def.field_map = std::move(map.value());
    }
    if (params.contains("reverseFieldMap") && !params["reverseFieldMap"].is_null()) {
        auto map = parse_field_map(params["reverseFieldMap"], "reverseFieldMap");
        if (map.isErr()) return R::err(map.error());
        def.reverse_field_map = std::move(map.value());
    }

    auto script = optional_string(params, "script");
    if (script.isErr()) return R::err(script.error());
    def.script = script.value();

    auto reverse_script = optional_string(params, "reverseScript");
    if (reverse_script.isErr()) return R::err(reverse_script.error());
    def.reverse_script = reverse_script.value();

    return R::ok(std::move(def));
}

// ============================================================================
// Contract Registry
// ============================================================================

ContractRegistry::ContractRegistry(std::shared_ptr<const SchemaStore> store,
                                   std::string default_schema_base)
    : store_(std::move(store)), default_schema_base_(std::move(default_schema_base)) {}

Result<RegistrationOutcome> ContractRegistry::register_contract(const RegistrationRequest& request) {
    using R = Result<RegistrationOutcome>;
    const bool provider = request.kind == ContractKind::Provider;

    if (request.uri.empty()) {
        return R::err(missing("uri"));
    }
    if (request.input_schema_path.empty()) {
        return R::err(missing(provider ? "inputSchemaPath" : "expectsInputSchemaPath"));
    }
    if (request.output_schema_path.empty()) {
        return R::err(missing(provider ? "outputSchemaPath" : "expectsOutputSchemaPath"));
    }

    {
        std::shared_lock lock(mutex_);
        if (contracts_.count(request.uri) > 0) {
            return R::err(Error(ErrorCode::INVALID_PARAMS,
                                "Contract already registered: " + request.uri));
        }
    }

    // Schema I/O happens before the exclusive lock is taken.
    const std::string& base = request.schema_base ? *request.schema_base : default_schema_base_;
    auto input = load_schema(*store_, request.input_schema_path, base);
    if (input.isErr()) return R::err(input.error());
    auto output = load_schema(*store_, request.output_schema_path, base);
    if (output.isErr()) return R::err(output.error());

    Contract contract;
    contract.uri = request.uri;
    contract.kind = request.kind;
    contract.input_schema = std::move(input.value().schema);
    contract.input_schema_path = input.value().path;
    contract.output_schema = std::move(output.value().schema);
    contract.output_schema_path = output.value().path;
    if (provider) {
        contract.endpoint = request.endpoint;
    }
    contract.metadata = request.metadata.is_object() ? request.metadata : nlohmann::json::object();

    RegistrationOutcome outcome;
    {
        std::unique_lock lock(mutex_);
        if (contracts_.count(contract.uri) > 0) {
            return R::err(Error(ErrorCode::INVALID_PARAMS,
                                "Contract already registered: " + contract.uri));
        }
        contract.sequence = next_sequence_++;
        std::string key = contract.uri;
        auto it = contracts_.emplace(std::move(key), std::move(contract)).first;
        order_.push_back(it->first);
        const Contract& stored = it->second;

        if (provider) {
            matcher_.on_provider_added(stored, contracts_of_kind(ContractKind::Consumer), catalog_);
        } else {
            matcher_.on_consumer_added(stored, contracts_of_kind(ContractKind::Provider), catalog_);
        }

        outcome.contract = stored;
        outcome.matches = matches_for_locked(stored);
    }

    spdlog::info("registered {} {} ({} match{})", contract_kind_to_string(request.kind),
                 request.uri, outcome.matches.size(), outcome.matches.size() == 1 ? "" : "es");
    return R::ok(std::move(outcome));
}

Result<void> ContractRegistry::register_transform(const TransformDefinition& def) {
    if (def.consumer_uri.empty()) return Result<void>::err(missing("from"));
    if (def.provider_uri.empty()) return Result<void>::err(missing("to"));

    std::unique_lock lock(mutex_);

    auto consumer = contracts_.find(def.consumer_uri);
    auto provider = contracts_.find(def.provider_uri);
    if (consumer != contracts_.end() && consumer->second.kind != ContractKind::Consumer) {
        return Result<void>::err(Error(ErrorCode::INVALID_PARAMS,
                                       "from must name a consumer: " + def.consumer_uri));
    }
    if (provider != contracts_.end() && provider->second.kind != ContractKind::Provider) {
        return Result<void>::err(Error(ErrorCode::INVALID_PARAMS,
                                       "to must name a provider: " + def.provider_uri));
    }

    catalog_.put(def);
    if (consumer != contracts_.end() && provider != contracts_.end()) {
        matcher_.on_transform_changed(consumer->second, provider->second, catalog_);
    }

    spdlog::info("registered transform {} -> {} ({} forward, {} reverse mapping(s){})",
                 def.consumer_uri, def.provider_uri, def.field_map.size(),
                 def.reverse_field_map ? def.reverse_field_map->size() : def.field_map.size(),
                 (def.script || def.reverse_script) ? ", scripted" : "");
    return Result<void>::ok();
}

std::optional<Contract> ContractRegistry::get(const std::string& uri) const {
    std::shared_lock lock(mutex_);
    auto it = contracts_.find(uri);
    if (it == contracts_.end()) return std::nullopt;
    return it->second;
}

std::vector<Contract> ContractRegistry::list(ContractKind kind) const {
    std::shared_lock lock(mutex_);
    std::vector<Contract> result;
    for (const auto* c : contracts_of_kind(kind)) {
        result.push_back(*c);
    }
    return result;
}

std::vector<std::string> ContractRegistry::providers_for(const std::string& consumer_uri) const {
    std::shared_lock lock(mutex_);
    return matcher_.index().providers_for(consumer_uri);
}

std::vector<std::string> ContractRegistry::consumers_for(const std::string& provider_uri) const {
    std::shared_lock lock(mutex_);
    return matcher_.index().consumers_for(provider_uri);
}

std::vector<MatchSummary> ContractRegistry::matches_for(const std::string& uri) const {
    std::shared_lock lock(mutex_);
    auto it = contracts_.find(uri);
    if (it == contracts_.end()) return {};
    return matches_for_locked(it->second);
}

std::optional<TransformSpec> ContractRegistry::find_transform(const std::string& consumer_uri,
                                                              const std::string& provider_uri,
                                                              Direction direction) const {
    std::shared_lock lock(mutex_);
    const TransformSpec* spec = catalog_.find(consumer_uri, provider_uri, direction);
    if (!spec) return std::nullopt;
    return *spec;
}

std::optional<RouteSnapshot> ContractRegistry::resolve(const std::string& consumer_uri) const {
    std::shared_lock lock(mutex_);
    auto it = contracts_.find(consumer_uri);
    if (it == contracts_.end() || it->second.kind != ContractKind::Consumer) {
        return std::nullopt;
    }

    RouteSnapshot snapshot;
    snapshot.consumer = it->second;
    for (const auto& provider_uri : matcher_.index().providers_for(consumer_uri)) {
        auto p = contracts_.find(provider_uri);
        if (p == contracts_.end()) continue;

        RouteCandidate candidate;
        candidate.provider = p->second;
        if (const auto* fwd = catalog_.find(consumer_uri, provider_uri, Direction::Forward)) {
            candidate.forward = *fwd;
        }
        if (const auto* rev = catalog_.find(consumer_uri, provider_uri, Direction::Reverse)) {
            candidate.reverse = *rev;
        }
        snapshot.candidates.push_back(std::move(candidate));
    }
    return snapshot;
}

std::vector<const Contract*> ContractRegistry::contracts_of_kind(ContractKind kind) const {
    std::vector<const Contract*> result;
    for (const auto& uri : order_) {
        const Contract& c = contracts_.at(uri);
        if (c.kind == kind) {
            result.push_back(&c);
        }
    }
    return result;
}

MatchSummary ContractRegistry::summarize_locked(const Contract& consumer,
                                                const Contract& provider,
                                                const std::string& other_uri) const {
    MatchSummary summary;
    summary.uri = other_uri;
    summary.endpoint = provider.endpoint;
    if (auto match = matcher_.index().pair(consumer.uri, provider.uri)) {
        summary.transform_applied = match->transform_applied;
    }
    if (const auto* fwd = catalog_.find(consumer.uri, provider.uri, Direction::Forward)) {
        summary.forward_map = fwd->field_map;
    }
    if (const auto* rev = catalog_.find(consumer.uri, provider.uri, Direction::Reverse)) {
        summary.reverse_map = rev->field_map;
    }
    return summary;
}

std::vector<MatchSummary> ContractRegistry::matches_for_locked(const Contract& contract) const {
    std::vector<MatchSummary> result;
    if (contract.kind == ContractKind::Provider) {
        for (const auto& consumer_uri : matcher_.index().consumers_for(contract.uri)) {
            result.push_back(summarize_locked(contracts_.at(consumer_uri), contract, consumer_uri));
        }
    } else {
        for (const auto& provider_uri : matcher_.index().providers_for(contract.uri)) {
            result.push_back(summarize_locked(contract, contracts_.at(provider_uri), provider_uri));
        }
    }
    return result;
}

} // namespace cbroker
