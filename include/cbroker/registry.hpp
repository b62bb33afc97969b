#pragma once

#include "cbroker/catalog.hpp"
#include "cbroker/error.hpp"
#include "cbroker/matcher.hpp"
#include "cbroker/schema_store.hpp"
#include "cbroker/types.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cbroker {

// ============================================================================
// Registration Request
// ============================================================================

struct RegistrationRequest {
    ContractKind kind = ContractKind::Provider;
    std::string uri;
    // Provider: inputSchemaPath / outputSchemaPath.
    // Consumer: expectsInputSchemaPath / expectsOutputSchemaPath.
    std::string input_schema_path;
    std::string output_schema_path;
    std::optional<std::string> endpoint;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> schema_base;  // overrides the registry default
};

// Build a request from contract.register params, naming the offending field
// on failure ("Missing required parameter: inputSchemaPath").
Result<RegistrationRequest> parse_registration_params(const nlohmann::json& params);

// Build a transform definition from transform.register params.
Result<TransformDefinition> parse_transform_params(const nlohmann::json& params);

// Parse a field map given as [{"from": "...", "to": "..."}, ...].
Result<std::vector<FieldMapping>> parse_field_map(const nlohmann::json& j, const std::string& field);

// ============================================================================
// Registration Outcome
// ============================================================================

struct MatchSummary {
    std::string uri;  // the other side of the pair
    bool transform_applied = false;
    std::optional<std::string> endpoint;
    std::vector<FieldMapping> forward_map;
    std::vector<FieldMapping> reverse_map;
};

struct RegistrationOutcome {
    Contract contract;
    std::vector<MatchSummary> matches;
};

// ============================================================================
// Route Snapshot
// ============================================================================

// Everything a live call needs, copied out of the registry so no lock is
// held across provider I/O or sandbox execution.
struct RouteCandidate {
    Contract provider;
    std::optional<TransformSpec> forward;
    std::optional<TransformSpec> reverse;
};

struct RouteSnapshot {
    Contract consumer;
    std::vector<RouteCandidate> candidates;  // in match order
};

// ============================================================================
// Contract Registry
// ============================================================================

/**
 * @brief In-memory store of validated contracts, transform specs and the
 * MatchIndex derived from them.
 *
 * Registration loads schemas outside the lock, then inserts the contract and
 * runs the matcher under one exclusive lock, so readers never observe a
 * contract without its matches.
 */
class ContractRegistry {
public:
    explicit ContractRegistry(std::shared_ptr<const SchemaStore> store,
                              std::string default_schema_base = "");

    ContractRegistry(const ContractRegistry&) = delete;
    ContractRegistry& operator=(const ContractRegistry&) = delete;

    Result<RegistrationOutcome> register_contract(const RegistrationRequest& request);

    // Store both directions of a transform and re-evaluate that pair.
    Result<void> register_transform(const TransformDefinition& def);

    std::optional<Contract> get(const std::string& uri) const;
    std::vector<Contract> list(ContractKind kind) const;

    std::vector<std::string> providers_for(const std::string& consumer_uri) const;
    std::vector<std::string> consumers_for(const std::string& provider_uri) const;
    std::vector<MatchSummary> matches_for(const std::string& uri) const;

    std::optional<TransformSpec> find_transform(const std::string& consumer_uri,
                                                const std::string& provider_uri,
                                                Direction direction) const;

    // nullopt when consumer_uri is not a registered consumer.
    std::optional<RouteSnapshot> resolve(const std::string& consumer_uri) const;

    const std::string& default_schema_base() const { return default_schema_base_; }

private:
    std::vector<const Contract*> contracts_of_kind(ContractKind kind) const;
    std::vector<MatchSummary> matches_for_locked(const Contract& contract) const;
    MatchSummary summarize_locked(const Contract& consumer, const Contract& provider,
                                  const std::string& other_uri) const;

    std::shared_ptr<const SchemaStore> store_;
    std::string default_schema_base_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Contract> contracts_;
    std::vector<std::string> order_;  // registration order
    uint64_t next_sequence_ = 0;
    TransformCatalog catalog_;
    SchemaCompatibilityMatcher matcher_;
};

} // namespace cbroker
