#include "cbroker/matcher.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace cbroker {

namespace {

std::string top_segment(const std::string& path) {
    auto dot = path.find('.');
    return dot == std::string::npos ? path : path.substr(0, dot);
}

std::string join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& i : items) {
        if (!out.empty()) out += ", ";
        out += i;
    }
    return out;
}

// Required fields of `target` that `produced` does not cover.
std::set<std::string> uncovered(const std::optional<std::set<std::string>>& produced,
                                const nlohmann::json& target) {
    std::set<std::string> missing;
    if (!produced) return missing;
    for (const auto& field : required_fields(target)) {
        if (produced->count(field) == 0) {
            missing.insert(field);
        }
    }
    return missing;
}

} // namespace

// ============================================================================
// Schema Field Analysis
// ============================================================================

std::set<std::string> required_fields(const nlohmann::json& schema) {
    std::set<std::string> result;
    if (!schema.is_object() || !schema.contains("required") || !schema["required"].is_array()) {
        return result;
    }
    for (const auto& r : schema["required"]) {
        if (r.is_string()) {
            result.insert(r.get<std::string>());
        }
    }
    return result;
}

std::set<std::string> property_names(const nlohmann::json& schema) {
    std::set<std::string> result;
    if (!schema.is_object() || !schema.contains("properties") || !schema["properties"].is_object()) {
        return result;
    }
    for (auto& [key, val] : schema["properties"].items()) {
        (void)val;
        result.insert(key);
    }
    return result;
}

std::optional<std::set<std::string>> produced_fields(const nlohmann::json& source_schema,
                                                     const TransformSpec* spec) {
    auto source = property_names(source_schema);
    if (spec == nullptr) {
        return source;
    }
    if (spec->script) {
        return std::nullopt;
    }
    if (spec->field_map.empty()) {
        return source;
    }

    std::set<std::string> produced;
    for (const auto& m : spec->field_map) {
        if (source.empty() || source.count(top_segment(m.source)) > 0) {
            produced.insert(top_segment(m.dest));
        }
    }
    return produced;
}

// ============================================================================
// Match Index
// ============================================================================

void MatchIndex::insert_ordered(std::vector<Entry>& list, uint64_t seq, const std::string& uri) {
    for (const auto& e : list) {
        if (e.second == uri) return;
    }
    auto pos = std::lower_bound(list.begin(), list.end(), Entry{seq, uri});
    list.insert(pos, Entry{seq, uri});
}

void MatchIndex::erase(std::vector<Entry>& list, const std::string& uri) {
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const Entry& e) { return e.second == uri; }),
               list.end());
}

std::vector<std::string> MatchIndex::uris(
    const std::unordered_map<std::string, std::vector<Entry>>& lists,
    const std::string& key) {
    std::vector<std::string> result;
    auto it = lists.find(key);
    if (it == lists.end()) return result;
    result.reserve(it->second.size());
    for (const auto& e : it->second) {
        result.push_back(e.second);
    }
    return result;
}

void MatchIndex::set(const Contract& consumer, const Contract& provider, const PairMatch& match) {
    pairs_[{consumer.uri, provider.uri}] = match;
    if (match.compatible) {
        insert_ordered(by_consumer_[consumer.uri], provider.sequence, provider.uri);
        insert_ordered(by_provider_[provider.uri], consumer.sequence, consumer.uri);
    } else {
        erase(by_consumer_[consumer.uri], provider.uri);
        erase(by_provider_[provider.uri], consumer.uri);
    }
}

std::vector<std::string> MatchIndex::providers_for(const std::string& consumer_uri) const {
    return uris(by_consumer_, consumer_uri);
}

std::vector<std::string> MatchIndex::consumers_for(const std::string& provider_uri) const {
    return uris(by_provider_, provider_uri);
}

std::optional<PairMatch> MatchIndex::pair(const std::string& consumer_uri,
                                          const std::string& provider_uri) const {
    auto it = pairs_.find({consumer_uri, provider_uri});
    if (it == pairs_.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// Schema Compatibility Matcher
// ============================================================================

PairMatch SchemaCompatibilityMatcher::evaluate(const Contract& consumer,
                                               const Contract& provider,
                                               const TransformCatalog& catalog) {
    PairMatch match;
    const TransformSpec* forward = catalog.find(consumer.uri, provider.uri, Direction::Forward);
    const TransformSpec* reverse = catalog.find(consumer.uri, provider.uri, Direction::Reverse);
    match.transform_applied = forward != nullptr || reverse != nullptr;

    // Consumer sends its output shape; the provider must receive its required input.
    auto forward_missing = uncovered(produced_fields(consumer.output_schema, forward),
                                     provider.input_schema);
    // Provider returns its output shape; the consumer must receive its required input.
    auto reverse_missing = uncovered(produced_fields(provider.output_schema, reverse),
                                     consumer.input_schema);

    if (forward_missing.empty() && reverse_missing.empty()) {
        match.compatible = true;
        return match;
    }

    if (!forward_missing.empty()) {
        match.reason = "forward transform does not produce required provider input: " +
                       join(forward_missing);
    }
    if (!reverse_missing.empty()) {
        if (!match.reason.empty()) match.reason += "; ";
        match.reason += "reverse transform does not produce required consumer input: " +
                        join(reverse_missing);
    }
    return match;
}

void SchemaCompatibilityMatcher::record(const Contract& consumer,
                                        const Contract& provider,
                                        const TransformCatalog& catalog) {
    auto match = evaluate(consumer, provider, catalog);
    if (match.compatible) {
        spdlog::debug("match: {} -> {} (transform: {})", consumer.uri, provider.uri,
                      match.transform_applied ? "registered" : "identity");
    } else {
        spdlog::debug("no match: {} -> {}: {}", consumer.uri, provider.uri, match.reason);
    }
    index_.set(consumer, provider, match);
}

void SchemaCompatibilityMatcher::on_provider_added(const Contract& provider,
                                                   const std::vector<const Contract*>& consumers,
                                                   const TransformCatalog& catalog) {
    for (const auto* consumer : consumers) {
        record(*consumer, provider, catalog);
    }
}

void SchemaCompatibilityMatcher::on_consumer_added(const Contract& consumer,
                                                   const std::vector<const Contract*>& providers,
                                                   const TransformCatalog& catalog) {
    for (const auto* provider : providers) {
        record(consumer, *provider, catalog);
    }
}

void SchemaCompatibilityMatcher::on_transform_changed(const Contract& consumer,
                                                      const Contract& provider,
                                                      const TransformCatalog& catalog) {
    record(consumer, provider, catalog);
}

} // namespace cbroker
