#pragma once

#include "cbroker/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace cbroker {

// ============================================================================
// Transform Catalog
// ============================================================================

// TransformSpecs keyed by (consumer, provider, direction). Not synchronized;
// the ContractRegistry guards it together with the contracts.
class TransformCatalog {
public:
    // Store both directions of a definition, replacing earlier specs for the pair.
    // A definition without reverse entries gets the inverse of its forward map.
    void put(const TransformDefinition& def);

    const TransformSpec* find(const std::string& consumer_uri,
                              const std::string& provider_uri,
                              Direction direction) const;

    size_t size() const { return specs_.size(); }

private:
    using Key = std::tuple<std::string, std::string, Direction>;
    std::map<Key, TransformSpec> specs_;
};

// Inverse of a field map (dest -> source), preserving declaration order.
std::vector<FieldMapping> invert_field_map(const std::vector<FieldMapping>& field_map);

} // namespace cbroker
