#include "cbroker/catalog.hpp"

namespace cbroker {

std::vector<FieldMapping> invert_field_map(const std::vector<FieldMapping>& field_map) {
    std::vector<FieldMapping> inverted;
    inverted.reserve(field_map.size());
    for (const auto& m : field_map) {
        inverted.push_back({m.dest, m.source});
    }
    return inverted;
}

void TransformCatalog::put(const TransformDefinition& def) {
    TransformSpec forward;
    forward.consumer_uri = def.consumer_uri;
    forward.provider_uri = def.provider_uri;
    forward.direction = Direction::Forward;
    forward.field_map = def.field_map;
    forward.script = def.script;

    TransformSpec reverse;
    reverse.consumer_uri = def.consumer_uri;
    reverse.provider_uri = def.provider_uri;
    reverse.direction = Direction::Reverse;
    if (def.reverse_field_map) {
        reverse.field_map = *def.reverse_field_map;
    } else if (!def.reverse_script) {
        reverse.field_map = invert_field_map(def.field_map);
    }
    reverse.script = def.reverse_script;

    specs_[Key{def.consumer_uri, def.provider_uri, Direction::Forward}] = std::move(forward);
    specs_[Key{def.consumer_uri, def.provider_uri, Direction::Reverse}] = std::move(reverse);
}

const TransformSpec* TransformCatalog::find(const std::string& consumer_uri,
                                            const std::string& provider_uri,
                                            Direction direction) const {
    auto it = specs_.find(Key{consumer_uri, provider_uri, direction});
    if (it == specs_.end()) return nullptr;
    return &it->second;
}

} // namespace cbroker
