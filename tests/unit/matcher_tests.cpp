/**
 * @file matcher_tests.cpp
 * @brief Tests for schema compatibility matching and the match index
 */

#include <doctest/doctest.h>
#include "test_support.hpp"

#include <cbroker/matcher.hpp>

using namespace cbroker;
using namespace cbroker::test;

namespace {

Contract make_contract(const std::string& uri, ContractKind kind,
                       const json& input, const json& output, uint64_t seq) {
    Contract c;
    c.uri = uri;
    c.kind = kind;
    c.input_schema = input;
    c.output_schema = output;
    c.sequence = seq;
    return c;
}

json object_schema(std::initializer_list<const char*> props, std::initializer_list<const char*> required) {
    json schema = {{"type", "object"}, {"properties", json::object()}, {"required", json::array()}};
    for (const auto* p : props) schema["properties"][p] = {{"type", "string"}};
    for (const auto* r : required) schema["required"].push_back(r);
    return schema;
}

} // namespace

// =============================================================================
// Field Analysis
// =============================================================================

TEST_CASE("required_fields and property_names read top-level keywords") {
    auto schema = weather_output_schema();
    CHECK(required_fields(schema) == std::set<std::string>{"humidity", "location", "temperature"});
    CHECK(property_names(schema).size() == 3);

    CHECK(required_fields(json::object()).empty());
    CHECK(required_fields(json::parse(R"({"required": "x"})")).empty());
    CHECK(property_names(json::array()).empty());
}

TEST_CASE("produced_fields") {
    auto source = object_schema({"city", "country"}, {"city"});

    SUBCASE("identity") {
        auto produced = produced_fields(source, nullptr);
        REQUIRE(produced.has_value());
        CHECK(*produced == std::set<std::string>{"city", "country"});
    }

    SUBCASE("field map keeps only mapped destinations") {
        TransformSpec spec;
        spec.field_map = {{"city", "location.name"}, {"missing", "other"}};
        auto produced = produced_fields(source, &spec);
        REQUIRE(produced.has_value());
        CHECK(*produced == std::set<std::string>{"location"});
    }

    SUBCASE("scripts are opaque") {
        TransformSpec spec;
        spec.script = "$";
        CHECK_FALSE(produced_fields(source, &spec).has_value());
    }

    SUBCASE("empty field map passes through") {
        TransformSpec spec;
        CHECK(produced_fields(source, &spec) == produced_fields(source, nullptr));
    }
}

// =============================================================================
// Pair Evaluation
// =============================================================================

TEST_CASE("identity matching of aligned schemas") {
    auto shared = object_schema({"city"}, {"city"});
    auto consumer = make_contract("c", ContractKind::Consumer, shared, shared, 1);
    auto provider = make_contract("p", ContractKind::Provider, shared, shared, 0);
    TransformCatalog catalog;

    auto match = SchemaCompatibilityMatcher::evaluate(consumer, provider, catalog);
    CHECK(match.compatible);
    CHECK_FALSE(match.transform_applied);
    CHECK(match.reason.empty());
}

TEST_CASE("weather and dashboard need a transform") {
    auto provider = make_contract("services/weather/v1", ContractKind::Provider,
                                  weather_input_schema(), weather_output_schema(), 0);
    auto consumer = make_contract("ui/dashboard/v2", ContractKind::Consumer,
                                  dashboard_expects_input_schema(),
                                  dashboard_expects_output_schema(), 1);
    TransformCatalog catalog;

    auto without = SchemaCompatibilityMatcher::evaluate(consumer, provider, catalog);
    CHECK_FALSE(without.compatible);
    CHECK(without.reason.find("location") != std::string::npos);
    CHECK(without.reason.find("temp") != std::string::npos);

    catalog.put(dashboard_weather_transform());
    auto with = SchemaCompatibilityMatcher::evaluate(consumer, provider, catalog);
    CHECK(with.compatible);
    CHECK(with.transform_applied);
}

TEST_CASE("a forward-only definition gets the inverse as reverse map") {
    TransformDefinition def;
    def.consumer_uri = "c";
    def.provider_uri = "p";
    def.field_map = {{"city", "location"}};

    TransformCatalog catalog;
    catalog.put(def);
    const auto* reverse = catalog.find("c", "p", Direction::Reverse);
    REQUIRE(reverse != nullptr);
    REQUIRE(reverse->field_map.size() == 1);
    CHECK(reverse->field_map[0].source == "location");
    CHECK(reverse->field_map[0].dest == "city");
    CHECK(catalog.find("c", "p", Direction::Forward) != nullptr);
    CHECK(catalog.find("p", "c", Direction::Forward) == nullptr);
}

TEST_CASE("script transforms are assumed compatible") {
    auto provider = make_contract("p", ContractKind::Provider,
                                  weather_input_schema(), weather_output_schema(), 0);
    auto consumer = make_contract("c", ContractKind::Consumer,
                                  dashboard_expects_input_schema(),
                                  dashboard_expects_output_schema(), 1);
    TransformDefinition def;
    def.consumer_uri = "c";
    def.provider_uri = "p";
    def.script = R"({"location": city})";
    def.reverse_script = R"({"temp": temperature, "humid": humidity, "city": location})";

    TransformCatalog catalog;
    catalog.put(def);
    auto match = SchemaCompatibilityMatcher::evaluate(consumer, provider, catalog);
    CHECK(match.compatible);
    CHECK(match.transform_applied);
}

// =============================================================================
// Incremental Index
// =============================================================================

TEST_CASE("match index keeps registration order and drops broken pairs") {
    auto shared = object_schema({"city"}, {"city"});
    auto p1 = make_contract("p1", ContractKind::Provider, shared, shared, 0);
    auto c1 = make_contract("c1", ContractKind::Consumer, shared, shared, 1);
    auto p2 = make_contract("p2", ContractKind::Provider, shared, shared, 2);
    auto incompatible = make_contract("p3", ContractKind::Provider,
                                      object_schema({"zip"}, {"zip"}), shared, 3);

    TransformCatalog catalog;
    SchemaCompatibilityMatcher matcher;
    matcher.on_consumer_added(c1, {&p1}, catalog);
    matcher.on_provider_added(p2, {&c1}, catalog);
    matcher.on_provider_added(incompatible, {&c1}, catalog);

    CHECK(matcher.index().providers_for("c1") == std::vector<std::string>{"p1", "p2"});
    CHECK(matcher.index().consumers_for("p2") == std::vector<std::string>{"c1"});
    CHECK(matcher.index().consumers_for("p3").empty());
    CHECK(matcher.index().providers_for("c1").size() == 2);

    auto p3 = matcher.index().pair("c1", "p3");
    REQUIRE(p3.has_value());
    CHECK_FALSE(p3->compatible);
    CHECK_FALSE(matcher.index().pair("c1", "nobody").has_value());

    // A transform that maps nothing the provider needs breaks a working pair
    TransformDefinition def;
    def.consumer_uri = "c1";
    def.provider_uri = "p1";
    def.field_map = {{"city", "town"}};
    catalog.put(def);
    matcher.on_transform_changed(c1, p1, catalog);
    CHECK(matcher.index().providers_for("c1") == std::vector<std::string>{"p2"});

    // and fixing it restores p1 ahead of p2
    def.field_map = {{"city", "city"}};
    catalog.put(def);
    matcher.on_transform_changed(c1, p1, catalog);
    CHECK(matcher.index().providers_for("c1") == std::vector<std::string>{"p1", "p2"});
}

TEST_CASE("registry matches incrementally in both registration orders") {
    TestSchemaDir dir;
    write_weather_fixtures(dir);

    SUBCASE("consumer first, transform last") {
        auto registry = make_registry(dir);
        REQUIRE(registry->register_contract(dashboard_consumer_request()).isOk());
        auto provider = registry->register_contract(weather_provider_request());
        REQUIRE(provider.isOk());
        CHECK(provider.value().matches.empty());

        REQUIRE(registry->register_transform(dashboard_weather_transform()).isOk());
        CHECK(registry->providers_for("ui/dashboard/v2") ==
              std::vector<std::string>{"services/weather/v1"});
        CHECK(registry->consumers_for("services/weather/v1") ==
              std::vector<std::string>{"ui/dashboard/v2"});
    }

    SUBCASE("transform first") {
        auto registry = make_registry(dir);
        REQUIRE(registry->register_transform(dashboard_weather_transform()).isOk());
        REQUIRE(registry->register_contract(dashboard_consumer_request()).isOk());
        auto provider = registry->register_contract(weather_provider_request());
        REQUIRE(provider.isOk());
        REQUIRE(provider.value().matches.size() == 1);
        CHECK(provider.value().matches[0].uri == "ui/dashboard/v2");
        CHECK(provider.value().matches[0].transform_applied);
    }
}
