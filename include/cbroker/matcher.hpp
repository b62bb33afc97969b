#pragma once

#include "cbroker/catalog.hpp"
#include "cbroker/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cbroker {

// ============================================================================
// Schema Field Analysis
// ============================================================================

// Top-level "required" entries of an object schema.
std::set<std::string> required_fields(const nlohmann::json& schema);

// Top-level "properties" keys of an object schema.
std::set<std::string> property_names(const nlohmann::json& schema);

// Top-level fields a transform produces from data shaped like source_schema.
// spec == nullptr means identity. Returns nullopt when the spec carries a
// script, whose output cannot be known statically.
std::optional<std::set<std::string>> produced_fields(const nlohmann::json& source_schema,
                                                     const TransformSpec* spec);

// ============================================================================
// Pair Evaluation
// ============================================================================

struct PairMatch {
    bool compatible = false;
    bool transform_applied = false;  // a registered TransformSpec drives the pair
    std::string reason;              // why the pair is incompatible
};

// ============================================================================
// Match Index
// ============================================================================

// consumer -> [provider...] and provider -> [consumer...], each list ordered by
// registration sequence of the listed contract.
class MatchIndex {
public:
    void set(const Contract& consumer, const Contract& provider, const PairMatch& match);

    std::vector<std::string> providers_for(const std::string& consumer_uri) const;
    std::vector<std::string> consumers_for(const std::string& provider_uri) const;

    // nullopt when the pair has never been evaluated.
    std::optional<PairMatch> pair(const std::string& consumer_uri,
                                  const std::string& provider_uri) const;

private:
    using Entry = std::pair<uint64_t, std::string>;

    static void insert_ordered(std::vector<Entry>& list, uint64_t seq, const std::string& uri);
    static void erase(std::vector<Entry>& list, const std::string& uri);
    static std::vector<std::string> uris(const std::unordered_map<std::string, std::vector<Entry>>& lists,
                                         const std::string& key);

    std::unordered_map<std::string, std::vector<Entry>> by_consumer_;
    std::unordered_map<std::string, std::vector<Entry>> by_provider_;
    std::map<std::pair<std::string, std::string>, PairMatch> pairs_;
};

// ============================================================================
// Schema Compatibility Matcher
// ============================================================================

class SchemaCompatibilityMatcher {
public:
    // Decide whether consumer and provider can talk, using the catalog's spec
    // for the pair or identity mapping when none is registered.
    static PairMatch evaluate(const Contract& consumer,
                              const Contract& provider,
                              const TransformCatalog& catalog);

    // Test a new provider against every existing consumer.
    void on_provider_added(const Contract& provider,
                           const std::vector<const Contract*>& consumers,
                           const TransformCatalog& catalog);

    // Test a new consumer against every existing provider.
    void on_consumer_added(const Contract& consumer,
                           const std::vector<const Contract*>& providers,
                           const TransformCatalog& catalog);

    // Re-evaluate one pair after its TransformSpecs changed.
    void on_transform_changed(const Contract& consumer,
                              const Contract& provider,
                              const TransformCatalog& catalog);

    const MatchIndex& index() const { return index_; }

private:
    void record(const Contract& consumer, const Contract& provider, const TransformCatalog& catalog);

    MatchIndex index_;
};

} // namespace cbroker
