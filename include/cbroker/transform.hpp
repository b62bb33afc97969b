#pragma once

#include "cbroker/error.hpp"
#include "cbroker/types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cbroker {

class ContractRegistry;
class ProviderClient;
class SandboxExecutor;

// ============================================================================
// Field Paths
// ============================================================================

// Read a dotted path ("a.b.0.c"). Numeric segments index arrays.
// nullopt when any segment is missing.
std::optional<nlohmann::json> get_path(const nlohmann::json& data, const std::string& path);

// Largest array index a destination path may write.
constexpr size_t kMaxArrayIndex = 10000;

// Write a dotted path, creating intermediate objects (or array slots for
// numeric segments under an existing array). An array index above
// kMaxArrayIndex is INVALID_PARAMS and leaves `data` as it was at that segment.
Result<void> set_path(nlohmann::json& data, const std::string& path, nlohmann::json value);

// Apply entries in declaration order onto an empty object. Entries whose
// source path is missing are skipped.
Result<nlohmann::json> apply_field_map(const nlohmann::json& data,
                                       const std::vector<FieldMapping>& field_map);

// Deterministic stand-in for a Provider reply, derived from its output schema.
// Per property: const, default, examples[0], enum[0], the same-named field of
// `request`, then a zero value for the declared type.
nlohmann::json simulate_response(const nlohmann::json& output_schema, const nlohmann::json& request);

// ============================================================================
// Transformation Engine
// ============================================================================

struct TransformOutcome {
    nlohmann::json data;
    bool transform_applied = false;
};

/**
 * @brief Converts data between Consumer and Provider shapes.
 *
 * A spec's field map runs first; its script, if any, then receives the
 * post-field-map value in the sandbox and its result is final. Without a spec
 * the data passes through unchanged.
 */
class TransformationEngine {
public:
    // provider_client is only needed for live traces (dry_run = false).
    TransformationEngine(const ContractRegistry& registry,
                         const SandboxExecutor& sandbox,
                         const ProviderClient* provider_client = nullptr);

    Result<TransformOutcome> apply(const std::optional<TransformSpec>& spec,
                                   const nlohmann::json& data) const;

    // Forward: from is the consumer, to the provider. Reverse: from is the
    // provider, to the consumer.
    Result<TransformOutcome> transform(const nlohmann::json& data,
                                       const std::string& from,
                                       const std::string& to,
                                       Direction direction) const;

    // input, transformed, provider-response, output.
    Result<TransformTrace> trace(const nlohmann::json& data,
                                 const std::string& consumer_uri,
                                 const std::string& provider_uri,
                                 bool dry_run) const;

private:
    const ContractRegistry& registry_;
    const SandboxExecutor& sandbox_;
    const ProviderClient* provider_client_;
};

} // namespace cbroker
