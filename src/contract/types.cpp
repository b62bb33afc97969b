#include "cbroker/types.hpp"

#include <optional>

namespace cbroker {

std::optional<ContractKind> parse_contract_kind(const std::string& s) {
    if (s == "provider") return ContractKind::Provider;
    if (s == "consumer") return ContractKind::Consumer;
    return std::nullopt;
}

nlohmann::json trace_to_json(const TransformTrace& trace) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& s : trace) {
        steps.push_back({{"step", s.step}, {"data", s.data}});
    }
    return steps;
}

nlohmann::json field_map_to_json(const std::vector<FieldMapping>& field_map) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& m : field_map) {
        out.push_back({{"from", m.source}, {"to", m.dest}});
    }
    return out;
}

} // namespace cbroker
