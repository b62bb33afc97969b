#include "cbroker/transform.hpp"

#include "cbroker/provider_client.hpp"
#include "cbroker/registry.hpp"
#include "cbroker/sandbox.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>

namespace cbroker {

using json = nlohmann::json;

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    for (;;) {
        auto dot = path.find('.', start);
        segments.push_back(path.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

bool is_index(const std::string& segment) {
    return !segment.empty() && segment.size() < 10 &&
           std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

json zero_value(const json& schema) {
    json type = schema.contains("type") ? schema["type"] : json();
    if (type.is_array() && !type.empty()) type = type[0];
    if (!type.is_string()) return nullptr;

    const auto& t = type.get_ref<const std::string&>();
    if (t == "string") return "";
    if (t == "number" || t == "integer") return 0;
    if (t == "boolean") return false;
    if (t == "array") return json::array();
    if (t == "object") return json::object();
    return nullptr;
}

json simulate_value(const json& schema, const std::string& name, const json& request);

json simulate_object(const json& schema, const json& request) {
    json out = json::object();
    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return out;
    }
    for (auto& [key, prop] : schema["properties"].items()) {
        out[key] = simulate_value(prop, key, request);
    }
    return out;
}

json simulate_value(const json& schema, const std::string& name, const json& request) {
    if (!schema.is_object()) return nullptr;
    if (schema.contains("const")) return schema["const"];
    if (schema.contains("default")) return schema["default"];
    if (schema.contains("examples") && schema["examples"].is_array() && !schema["examples"].empty()) {
        return schema["examples"][0];
    }
    if (schema.contains("enum") && schema["enum"].is_array() && !schema["enum"].empty()) {
        return schema["enum"][0];
    }
    if (!name.empty() && request.is_object() && request.contains(name)) {
        return request[name];
    }
    if (schema.contains("properties")) {
        json nested = (!name.empty() && request.is_object()) ? request.value(name, json()) : json();
        return simulate_object(schema, nested);
    }
    return zero_value(schema);
}

} // namespace

// ============================================================================
// Field Paths
// ============================================================================

std::optional<json> get_path(const json& data, const std::string& path) {
    const json* cur = &data;
    for (const auto& seg : split_path(path)) {
        if (cur->is_object()) {
            auto it = cur->find(seg);
            if (it == cur->end()) return std::nullopt;
            cur = &*it;
        } else if (cur->is_array() && is_index(seg)) {
            auto i = static_cast<size_t>(std::strtoul(seg.c_str(), nullptr, 10));
            if (i >= cur->size()) return std::nullopt;
            cur = &(*cur)[i];
        } else {
            return std::nullopt;
        }
    }
    return *cur;
}

Result<void> set_path(json& data, const std::string& path, json value) {
    json* cur = &data;
    for (const auto& seg : split_path(path)) {
        if (cur->is_array() && is_index(seg)) {
            auto i = static_cast<size_t>(std::strtoul(seg.c_str(), nullptr, 10));
            if (i > kMaxArrayIndex) {
                return Result<void>::err(Error(ErrorCode::INVALID_PARAMS,
                                               "Array index " + seg + " in " + path +
                                               " exceeds " + std::to_string(kMaxArrayIndex)));
            }
            while (cur->size() <= i) cur->push_back(nullptr);
            cur = &(*cur)[i];
            continue;
        }
        if (!cur->is_object()) {
            *cur = json::object();
        }
        cur = &(*cur)[seg];
    }
    *cur = std::move(value);
    return Result<void>::ok();
}

Result<json> apply_field_map(const json& data, const std::vector<FieldMapping>& field_map) {
    json out = json::object();
    for (const auto& m : field_map) {
        auto value = get_path(data, m.source);
        if (!value) continue;
        auto written = set_path(out, m.dest, std::move(*value));
        if (written.isErr()) return Result<json>::err(written.error());
    }
    return Result<json>::ok(std::move(out));
}

json simulate_response(const json& output_schema, const json& request) {
    if (output_schema.is_object() && output_schema.contains("properties")) {
        return simulate_object(output_schema, request);
    }
    return simulate_value(output_schema, "", request);
}

// ============================================================================
// TransformationEngine
// ============================================================================

TransformationEngine::TransformationEngine(const ContractRegistry& registry,
                                           const SandboxExecutor& sandbox,
                                           const ProviderClient* provider_client)
    : registry_(registry), sandbox_(sandbox), provider_client_(provider_client) {}

Result<TransformOutcome> TransformationEngine::apply(const std::optional<TransformSpec>& spec,
                                                     const json& data) const {
    using R = Result<TransformOutcome>;

    TransformOutcome outcome;
    if (!spec || (spec->field_map.empty() && !spec->script)) {
        outcome.data = data;
        return R::ok(std::move(outcome));
    }

    outcome.transform_applied = true;
    if (spec->field_map.empty()) {
        outcome.data = data;
    } else {
        auto mapped = apply_field_map(data, spec->field_map);
        if (mapped.isErr()) return R::err(mapped.error());
        outcome.data = std::move(mapped.value());
    }

    if (spec->script) {
        auto result = sandbox_.execute(*spec->script, outcome.data);
        if (result.isErr()) {
            spdlog::debug("{} transform {} -> {} failed: {}", direction_to_string(spec->direction),
                          spec->consumer_uri, spec->provider_uri, result.error().message());
            return R::err(result.error());
        }
        outcome.data = std::move(result.value());
    }
    return R::ok(std::move(outcome));
}

Result<TransformOutcome> TransformationEngine::transform(const json& data,
                                                         const std::string& from,
                                                         const std::string& to,
                                                         Direction direction) const {
    const std::string& consumer = direction == Direction::Forward ? from : to;
    const std::string& provider = direction == Direction::Forward ? to : from;
    return apply(registry_.find_transform(consumer, provider, direction), data);
}

Result<TransformTrace> TransformationEngine::trace(const json& data,
                                                   const std::string& consumer_uri,
                                                   const std::string& provider_uri,
                                                   bool dry_run) const {
    using R = Result<TransformTrace>;

    auto consumer = registry_.get(consumer_uri);
    if (!consumer) {
        return R::err(Error(ErrorCode::INVALID_PARAMS, "Contract not found: " + consumer_uri));
    }
    if (consumer->kind != ContractKind::Consumer) {
        return R::err(Error(ErrorCode::INVALID_PARAMS, "from must name a consumer: " + consumer_uri));
    }
    auto provider = registry_.get(provider_uri);
    if (!provider) {
        return R::err(Error(ErrorCode::INVALID_PARAMS, "Contract not found: " + provider_uri));
    }
    if (provider->kind != ContractKind::Provider) {
        return R::err(Error(ErrorCode::INVALID_PARAMS, "to must name a provider: " + provider_uri));
    }

    TransformTrace trace;
    trace.push_back({"input", data});

    auto forward = transform(data, consumer_uri, provider_uri, Direction::Forward);
    if (forward.isErr()) return R::err(forward.error());
    trace.push_back({"transformed", forward.value().data});

    json response;
    if (dry_run) {
        response = simulate_response(provider->output_schema, forward.value().data);
    } else {
        if (!provider->endpoint) {
            return R::err(Error(ErrorCode::NO_PROVIDER, "Provider has no endpoint: " + provider_uri));
        }
        if (!provider_client_) {
            return R::err(Error(ErrorCode::INTERNAL, "No provider client configured"));
        }
        auto reply = provider_client_->invoke(*provider->endpoint, forward.value().data);
        if (reply.isErr()) return R::err(reply.error());
        response = std::move(reply.value());
    }
    trace.push_back({"provider-response", response});

    auto reverse = transform(response, provider_uri, consumer_uri, Direction::Reverse);
    if (reverse.isErr()) return R::err(reverse.error());
    trace.push_back({"output", reverse.value().data});

    return R::ok(std::move(trace));
}

} // namespace cbroker
