/**
 * @file router_tests.cpp
 * @brief Tests for provider ordering, failover and call errors
 */

#include <doctest/doctest.h>
#include "test_support.hpp"

#include <cbroker/router.hpp>
#include <cbroker/sandbox.hpp>
#include <cbroker/transform.hpp>

using namespace cbroker;
using namespace cbroker::test;

namespace {

const json kWeatherReply = json::parse(R"({"temperature": 25.5, "humidity": 60, "location": "Tokyo"})");

// Registry, engine and router over a fake provider client.
struct RouterFixture {
    TestSchemaDir dir;
    std::unique_ptr<ContractRegistry> registry;
    SandboxExecutor sandbox;
    FakeProviderClient client;
    TransformationEngine engine;
    RequestRouter router;

    RouterFixture()
        : registry((write_weather_fixtures(dir), make_registry(dir))),
          sandbox(helper_limits()),
          engine(*registry, sandbox, &client),
          router(*registry, engine, client) {}

    static SandboxLimits helper_limits() {
        SandboxLimits limits;
        limits.helper_path = sandbox_helper_path();
        return limits;
    }

    void add_provider(const std::string& uri, const std::string& endpoint,
                      const json& metadata = json::object()) {
        auto req = weather_provider_request(uri, endpoint);
        req.metadata = metadata;
        REQUIRE(registry->register_contract(req).isOk());
        REQUIRE(registry->register_transform(dashboard_weather_transform("ui/dashboard/v2", uri)).isOk());
    }

    void add_dashboard() {
        REQUIRE(registry->register_contract(dashboard_consumer_request()).isOk());
    }
};

RouteCandidate candidate(const std::string& uri, const json& metadata) {
    RouteCandidate c;
    c.provider.uri = uri;
    c.provider.metadata = metadata;
    return c;
}

} // namespace

// =============================================================================
// Candidate Ordering
// =============================================================================

TEST_CASE("order_candidates moves preferred providers to the front, stably") {
    std::vector<RouteCandidate> candidates = {
        candidate("a", json{{"region", "us"}}),
        candidate("b", json{{"region", "eu"}, {"tier", "gold"}}),
        candidate("c", json::object()),
        candidate("d", json{{"region", "eu"}}),
    };

    auto ordered = order_candidates(candidates, json{{"region", "eu"}});
    REQUIRE(ordered.size() == 4);
    CHECK(ordered[0].provider.uri == "b");
    CHECK(ordered[1].provider.uri == "d");
    CHECK(ordered[2].provider.uri == "a");
    CHECK(ordered[3].provider.uri == "c");

    auto both = order_candidates(candidates, json{{"region", "eu"}, {"tier", "gold"}});
    CHECK(both[0].provider.uri == "b");
    CHECK(both[1].provider.uri == "a");

    auto none = order_candidates(candidates, json::object());
    CHECK(none[0].provider.uri == "a");
    CHECK(none[3].provider.uri == "d");
}

// =============================================================================
// Calls
// =============================================================================

TEST_CASE("call transforms both ways around the provider") {
    RouterFixture f;
    f.add_provider("services/weather/v1", "http://weather-a/weather");
    f.add_dashboard();
    f.client.reply("http://weather-a/weather", kWeatherReply);

    auto r = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}});
    REQUIRE(r.isOk());
    CHECK(r.value().data == json::parse(R"({"temp": 25.5, "humid": 60, "city": "Tokyo"})"));
    CHECK(r.value().meta.transform_applied);
    CHECK(r.value().meta.provider_uri == "services/weather/v1");
    CHECK(r.value().meta.latency_ms >= 0);

    auto calls = f.client.calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].body == json{{"location", "Tokyo"}});
}

TEST_CASE("call without a transform passes data through") {
    RouterFixture f;
    f.dir.write("echo.json", json::parse(R"({"type": "object", "properties": {"q": {"type": "string"}}})"));

    RegistrationRequest provider;
    provider.kind = ContractKind::Provider;
    provider.uri = "services/echo";
    provider.input_schema_path = "echo.json";
    provider.output_schema_path = "echo.json";
    provider.endpoint = "http://echo/";
    REQUIRE(f.registry->register_contract(provider).isOk());

    RegistrationRequest consumer = provider;
    consumer.kind = ContractKind::Consumer;
    consumer.uri = "ui/echo";
    consumer.endpoint.reset();
    REQUIRE(f.registry->register_contract(consumer).isOk());

    f.client.on("http://echo/", [](const json& body) { return Result<json>::ok(body); });

    auto r = f.router.call("ui/echo", json{{"q", "hi"}});
    REQUIRE(r.isOk());
    CHECK(r.value().data == json{{"q", "hi"}});
    CHECK_FALSE(r.value().meta.transform_applied);
}

TEST_CASE("unreachable providers fail over to the next candidate") {
    RouterFixture f;
    f.add_provider("services/weather/a", "http://down/weather");
    f.add_provider("services/weather/b", "http://up/weather");
    f.add_dashboard();
    f.client.reply("http://up/weather", kWeatherReply);

    auto r = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}});
    REQUIRE(r.isOk());
    CHECK(r.value().meta.provider_uri == "services/weather/b");

    auto calls = f.client.calls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].endpoint == "http://down/weather");
    CHECK(calls[1].endpoint == "http://up/weather");
}

TEST_CASE("preferences pick the provider tried first") {
    RouterFixture f;
    f.add_provider("services/weather/us", "http://us/weather", json{{"region", "us"}});
    f.add_provider("services/weather/eu", "http://eu/weather", json{{"region", "eu"}});
    f.add_dashboard();
    f.client.reply("http://us/weather", kWeatherReply);
    f.client.reply("http://eu/weather", kWeatherReply);

    auto first = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}});
    REQUIRE(first.isOk());
    CHECK(first.value().meta.provider_uri == "services/weather/us");

    auto preferred = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}}, json{{"region", "eu"}});
    REQUIRE(preferred.isOk());
    CHECK(preferred.value().meta.provider_uri == "services/weather/eu");
}

TEST_CASE("a provider that answers with an error ends the call") {
    RouterFixture f;
    f.add_provider("services/weather/a", "http://broken/weather");
    f.add_provider("services/weather/b", "http://up/weather");
    f.add_dashboard();
    f.client.fail("http://broken/weather", ErrorCode::PROVIDER_FAILED,
                  "http://broken/weather returned HTTP 500");
    f.client.reply("http://up/weather", kWeatherReply);

    auto r = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::PROVIDER_FAILED);
    CHECK(r.error().message() == "Provider call failed: http://broken/weather returned HTTP 500");
    CHECK(f.client.calls().size() == 1);
}

TEST_CASE("NO_PROVIDER cases") {
    RouterFixture f;

    SUBCASE("unknown consumer") {
        auto r = f.router.call("ui/unknown", json::object());
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::NO_PROVIDER);
        CHECK(r.error().message() == "Consumer not registered: ui/unknown");
    }

    SUBCASE("no matching provider") {
        f.add_dashboard();
        auto r = f.router.call("ui/dashboard/v2", json::object());
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::NO_PROVIDER);
        CHECK(r.error().message() == "No provider matches consumer: ui/dashboard/v2");
    }

    SUBCASE("every provider unreachable") {
        f.add_provider("services/weather/v1", "http://down/weather");
        f.add_dashboard();
        auto r = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}});
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::NO_PROVIDER);
        CHECK(r.error().message() == "No available providers");
    }

    SUBCASE("matched provider without endpoint") {
        auto req = weather_provider_request();
        req.endpoint.reset();
        REQUIRE(f.registry->register_contract(req).isOk());
        REQUIRE(f.registry->register_transform(dashboard_weather_transform()).isOk());
        f.add_dashboard();
        auto r = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}});
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::NO_PROVIDER);
        CHECK(f.client.calls().empty());
    }
}

TEST_CASE("script failures in a transform abort the call") {
    RouterFixture f;
    auto req = weather_provider_request();
    REQUIRE(f.registry->register_contract(req).isOk());
    f.add_dashboard();

    TransformDefinition def;
    def.consumer_uri = "ui/dashboard/v2";
    def.provider_uri = "services/weather/v1";
    def.script = R"($error("no city"))";
    def.reverse_script = "$";
    REQUIRE(f.registry->register_transform(def).isOk());
    f.client.reply("http://127.0.0.1:9/weather", kWeatherReply);

    auto r = f.router.call("ui/dashboard/v2", json{{"city", "Tokyo"}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SCRIPT_ERROR);
    CHECK(r.error().message().find("no city") != std::string::npos);
    CHECK(f.client.calls().empty());
}
