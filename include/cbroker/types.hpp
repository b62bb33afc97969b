#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cbroker {

// ============================================================================
// Contract Kind
// ============================================================================

enum class ContractKind {
    Provider,
    Consumer
};

inline const char* contract_kind_to_string(ContractKind k) {
    switch (k) {
        case ContractKind::Provider: return "provider";
        case ContractKind::Consumer: return "consumer";
        default: return "provider";
    }
}

// Exactly "provider" or "consumer".
std::optional<ContractKind> parse_contract_kind(const std::string& s);

// ============================================================================
// Contract
// ============================================================================

// A registered Provider or Consumer. Immutable once stored.
//
// For a Provider, input_schema is what it accepts and output_schema is what it
// returns. For a Consumer, input_schema is the shape it expects to receive
// (expectsInputSchema) and output_schema is the shape it sends
// (expectsOutputSchema).
struct Contract {
    std::string uri;
    ContractKind kind = ContractKind::Provider;
    nlohmann::json input_schema;
    nlohmann::json output_schema;
    std::string input_schema_path;   // resolved path the schema was loaded from
    std::string output_schema_path;
    std::optional<std::string> endpoint;  // Provider only
    nlohmann::json metadata = nlohmann::json::object();
    uint64_t sequence = 0;  // registration order
};

// ============================================================================
// Transform Specification
// ============================================================================

enum class Direction {
    Forward,  // Consumer-shaped -> Provider-shaped
    Reverse   // Provider-shaped -> Consumer-shaped
};

inline const char* direction_to_string(Direction d) {
    switch (d) {
        case Direction::Forward: return "forward";
        case Direction::Reverse: return "reverse";
        default: return "forward";
    }
}

struct FieldMapping {
    std::string source;  // dotted path
    std::string dest;    // dotted path
};

// Conversion for one ordered (Consumer, Provider) pair in one direction.
// consumer_uri/provider_uri name the pair regardless of direction.
struct TransformSpec {
    std::string consumer_uri;
    std::string provider_uri;
    Direction direction = Direction::Forward;
    std::vector<FieldMapping> field_map;  // applied in declaration order
    std::optional<std::string> script;
};

// Both directions of a transform as submitted by a caller.
struct TransformDefinition {
    std::string consumer_uri;
    std::string provider_uri;
    std::vector<FieldMapping> field_map;
    std::optional<std::string> script;
    std::optional<std::vector<FieldMapping>> reverse_field_map;
    std::optional<std::string> reverse_script;
};

// ============================================================================
// Trace and Call Results
// ============================================================================

struct TraceStep {
    std::string step;  // "input" | "transformed" | "provider-response" | "output"
    nlohmann::json data;
};

using TransformTrace = std::vector<TraceStep>;

struct CallMeta {
    bool transform_applied = false;
    int64_t latency_ms = 0;
    std::string provider_uri;
};

struct CallResult {
    nlohmann::json data;
    CallMeta meta;
};

// ============================================================================
// JSON helpers
// ============================================================================

nlohmann::json trace_to_json(const TransformTrace& trace);
nlohmann::json field_map_to_json(const std::vector<FieldMapping>& field_map);

} // namespace cbroker
