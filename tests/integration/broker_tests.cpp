/**
 * @file broker_tests.cpp
 * @brief End-to-end tests: JSON-RPC over HTTP against a live mock provider
 *
 * The broker and a mock weather provider both listen on ephemeral ports on
 * 127.0.0.1. Transform scripts run in the real cbroker-sandbox helper.
 */

#include <doctest/doctest.h>
#include "test_support.hpp"

#include <cbroker/config.hpp>
#include <cbroker/provider_client.hpp>
#include <cbroker/router.hpp>
#include <cbroker/rpc.hpp>
#include <cbroker/sandbox.hpp>
#include <cbroker/transform.hpp>

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace cbroker;
using namespace cbroker::test;

namespace {

// stop() is a no-op until the listen loop has started.
template<typename F>
void wait_until_running(F running) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    REQUIRE(running());
}

// Mock weather service: POST /weather echoes the location with fixed readings,
// POST /broken answers 500.
class MockWeatherProvider {
public:
    MockWeatherProvider() {
        server_.Post("/weather", [this](const httplib::Request& req, httplib::Response& res) {
            ++hits_;
            auto body = json::parse(req.body, nullptr, false);
            std::string location = body.is_object() ? body.value("location", "") : "";
            json reply = {{"temperature", 25.5}, {"humidity", 60}, {"location", location}};
            res.set_content(reply.dump(), "application/json");
        });
        server_.Post("/broken", [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
            res.set_content("boom", "text/plain");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        REQUIRE(port_ > 0);
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        wait_until_running([this] { return server_.is_running(); });
    }

    ~MockWeatherProvider() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string endpoint(const std::string& path = "/weather") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    int hits() const { return hits_; }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
    std::atomic<int> hits_{0};
};

// The full broker stack behind an HttpServer on an ephemeral port.
class BrokerUnderTest {
public:
    explicit BrokerUnderTest(TestSchemaDir& dir)
        : registry_(make_registry(dir)),
          sandbox_(limits()),
          engine_(*registry_, sandbox_, &client_),
          router_(*registry_, engine_, client_),
          protocol_(*registry_, engine_, router_),
          server_(protocol_, options()) {
        REQUIRE(server_.bind());
        thread_ = std::thread([this] { server_.listen(); });
        wait_until_running([this] { return server_.is_running(); });
    }

    ~BrokerUnderTest() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    json rpc(const std::string& method, const json& params, int id = 1) {
        json request = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}};
        return post(request.dump());
    }

    json post(const std::string& body) {
        httplib::Client http("127.0.0.1", server_.port());
        http.set_read_timeout(std::chrono::seconds(15));
        auto res = http.Post("/rpc", body, "application/json");
        REQUIRE(static_cast<bool>(res));
        REQUIRE(res->status == 200);
        return json::parse(res->body);
    }

    int port() const { return server_.port(); }

private:
    static SandboxLimits limits() {
        SandboxLimits l;
        l.helper_path = sandbox_helper_path();
        l.timeout_ms = 500;
        return l;
    }

    static HttpServerOptions options() {
        HttpServerOptions o;
        o.host = "127.0.0.1";
        o.port = 0;
        return o;
    }

    std::unique_ptr<ContractRegistry> registry_;
    SandboxExecutor sandbox_;
    HttpProviderClient client_;
    TransformationEngine engine_;
    RequestRouter router_;
    ProtocolServer protocol_;
    HttpServer server_;
    std::thread thread_;
};

json provider_params(const std::string& uri, const std::string& endpoint) {
    return json{
        {"type", "provider"},
        {"uri", uri},
        {"inputSchemaPath", "weather/input.json"},
        {"outputSchemaPath", "weather/output.json"},
        {"endpoint", endpoint},
    };
}

json dashboard_params() {
    return json{
        {"type", "consumer"},
        {"uri", "ui/dashboard/v2"},
        {"expectsInputSchemaPath", "dashboard/expects-input.json"},
        {"expectsOutputSchemaPath", "dashboard/expects-output.json"},
    };
}

json dashboard_transform_params(const std::string& provider_uri = "services/weather/v1") {
    json params = json::parse(R"({
        "from": "ui/dashboard/v2",
        "fieldMap": [{"from": "city", "to": "location"}],
        "reverseFieldMap": [
            {"from": "temperature", "to": "temp"},
            {"from": "humidity", "to": "humid"},
            {"from": "location", "to": "city"}
        ]
    })");
    params["to"] = provider_uri;
    return params;
}

} // namespace

TEST_CASE("health endpoint") {
    TestSchemaDir dir;
    BrokerUnderTest broker(dir);

    httplib::Client http("127.0.0.1", broker.port());
    auto res = http.Get("/health");
    REQUIRE(static_cast<bool>(res));
    CHECK(res->status == 200);
    CHECK(res->body == "ok");
}

TEST_CASE("register, match and dry-run a weather dashboard") {
    TestSchemaDir dir;
    write_weather_fixtures(dir);
    MockWeatherProvider weather;
    BrokerUnderTest broker(dir);

    auto provider = broker.rpc("contract.register", provider_params("services/weather/v1", weather.endpoint()));
    REQUIRE(provider.contains("result"));
    CHECK(provider["result"]["matches"].empty());

    auto transform = broker.rpc("transform.register", dashboard_transform_params());
    REQUIRE(transform.contains("result"));
    CHECK(transform["result"]["matched"] == false);

    auto consumer = broker.rpc("contract.register", dashboard_params());
    REQUIRE(consumer.contains("result"));
    REQUIRE(consumer["result"]["providers"].size() == 1);
    CHECK(consumer["result"]["providers"][0]["uri"] == "services/weather/v1");
    CHECK(consumer["result"]["providers"][0]["transformApplied"] == true);

    auto test = broker.rpc("contract.test", json{{"from", "ui/dashboard/v2"},
                                                 {"to", "services/weather/v1"},
                                                 {"testData", {{"city", "Tokyo"}}}});
    REQUIRE(test.contains("result"));
    const auto& steps = test["result"]["steps"];
    REQUIRE(steps.size() == 4);
    CHECK(steps[0]["data"] == json{{"city", "Tokyo"}});
    CHECK(steps[1]["data"] == json{{"location", "Tokyo"}});
    CHECK(steps[2]["data"] == json::parse(R"({"temperature": 0, "humidity": 0, "location": "Tokyo"})"));
    CHECK(steps[3]["data"] == json::parse(R"({"temp": 0, "humid": 0, "city": "Tokyo"})"));
    CHECK(weather.hits() == 0);
}

TEST_CASE("live call through the broker") {
    TestSchemaDir dir;
    write_weather_fixtures(dir);
    MockWeatherProvider weather;
    BrokerUnderTest broker(dir);

    REQUIRE(broker.rpc("contract.register", provider_params("services/weather/v1", weather.endpoint()))
                .contains("result"));
    REQUIRE(broker.rpc("contract.register", dashboard_params()).contains("result"));
    REQUIRE(broker.rpc("transform.register", dashboard_transform_params()).contains("result"));

    auto response = broker.rpc("contract.call", json{{"from", "ui/dashboard/v2"},
                                                     {"data", {{"city", "Tokyo"}}}});
    REQUIRE(response.contains("result"));
    CHECK(response["result"]["data"] == json::parse(R"({"temp": 25.5, "humid": 60, "city": "Tokyo"})"));
    CHECK(response["result"]["meta"]["transformApplied"] == true);
    CHECK(response["result"]["meta"]["provider"] == "services/weather/v1");
    CHECK(weather.hits() == 1);
}

TEST_CASE("calls fail over from a dead provider") {
    TestSchemaDir dir;
    write_weather_fixtures(dir);
    MockWeatherProvider weather;
    BrokerUnderTest broker(dir);

    // Port 1 on loopback refuses connections.
    REQUIRE(broker.rpc("contract.register", provider_params("services/weather/dead",
                                                           "http://127.0.0.1:1/weather"))
                .contains("result"));
    REQUIRE(broker.rpc("contract.register", provider_params("services/weather/live", weather.endpoint()))
                .contains("result"));
    REQUIRE(broker.rpc("contract.register", dashboard_params()).contains("result"));
    REQUIRE(broker.rpc("transform.register", dashboard_transform_params("services/weather/dead"))
                .contains("result"));
    REQUIRE(broker.rpc("transform.register", dashboard_transform_params("services/weather/live"))
                .contains("result"));

    auto response = broker.rpc("contract.call", json{{"from", "ui/dashboard/v2"},
                                                     {"data", {{"city", "Oslo"}}}});
    REQUIRE(response.contains("result"));
    CHECK(response["result"]["meta"]["provider"] == "services/weather/live");
    CHECK(response["result"]["data"]["city"] == "Oslo");
}

TEST_CASE("a provider answering HTTP 500 is an internal error") {
    TestSchemaDir dir;
    write_weather_fixtures(dir);
    MockWeatherProvider weather;
    BrokerUnderTest broker(dir);

    REQUIRE(broker.rpc("contract.register", provider_params("services/weather/v1",
                                                           weather.endpoint("/broken")))
                .contains("result"));
    REQUIRE(broker.rpc("contract.register", dashboard_params()).contains("result"));
    REQUIRE(broker.rpc("transform.register", dashboard_transform_params()).contains("result"));

    auto failed = broker.rpc("contract.call", json{{"from", "ui/dashboard/v2"},
                                                   {"data", {{"city", "Oslo"}}}});
    REQUIRE(failed.contains("error"));
    CHECK(failed["error"]["code"] == rpc::INTERNAL_ERROR);
    CHECK(failed["error"]["message"] == "Internal error");
    CHECK(failed["error"]["data"]["detail"].get<std::string>().find("HTTP 500") != std::string::npos);
}

TEST_CASE("a runaway transform script is killed and the broker keeps serving") {
    TestSchemaDir dir;
    write_weather_fixtures(dir);
    MockWeatherProvider weather;
    BrokerUnderTest broker(dir);

    REQUIRE(broker.rpc("contract.register", provider_params("services/weather/v1", weather.endpoint()))
                .contains("result"));
    REQUIRE(broker.rpc("contract.register", dashboard_params()).contains("result"));
    REQUIRE(broker.rpc("transform.register", json{
        {"from", "ui/dashboard/v2"},
        {"to", "services/weather/v1"},
        {"script", "$sum([1..10000].($sum([1..10000])))"},
        {"reverseScript", "$"},
    }).contains("result"));

    auto started = std::chrono::steady_clock::now();
    auto response = broker.rpc("contract.call", json{{"from", "ui/dashboard/v2"},
                                                     {"data", {{"city", "Tokyo"}}}}, 41);
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(response["id"] == 41);
    REQUIRE(response.contains("error"));
    CHECK(response["error"]["code"] == rpc::INTERNAL_ERROR);
    CHECK(response["error"]["data"]["detail"].get<std::string>().find("timed out") != std::string::npos);
    CHECK(elapsed < std::chrono::seconds(5));
    CHECK(weather.hits() == 0);

    auto list = broker.rpc("contract.list", json::object(), 42);
    CHECK(list["id"] == 42);
    CHECK(list["result"]["contracts"].size() == 2);
}

TEST_CASE("malformed bodies and batches over HTTP") {
    TestSchemaDir dir;
    BrokerUnderTest broker(dir);

    auto parse_error = broker.post("{\"jsonrpc\": ");
    CHECK(parse_error["error"]["code"] == rpc::PARSE_ERROR);
    CHECK(parse_error["id"].is_null());

    auto batch = broker.post(R"([
        {"jsonrpc": "2.0", "method": "contract.list", "id": 1},
        {"jsonrpc": "2.0", "method": "contract.get", "params": {"uri": "missing"}, "id": 2}
    ])");
    REQUIRE(batch.is_array());
    REQUIRE(batch.size() == 2);
    CHECK(batch[0]["id"] == 1);
    CHECK(batch[1]["error"]["code"] == rpc::INVALID_PARAMS);
}

TEST_CASE("HttpProviderClient errors") {
    MockWeatherProvider weather;
    HttpClientOptions options;
    options.connect_timeout_ms = 500;
    HttpProviderClient client(options);

    auto ok = client.invoke(weather.endpoint(), json{{"location", "Lima"}});
    REQUIRE(ok.isOk());
    CHECK(ok.value()["location"] == "Lima");

    auto refused = client.invoke("http://127.0.0.1:1/weather", json::object());
    REQUIRE(refused.isErr());
    CHECK(refused.error().code() == ErrorCode::NO_PROVIDER);

    auto status = client.invoke(weather.endpoint("/broken"), json::object());
    REQUIRE(status.isErr());
    CHECK(status.error().code() == ErrorCode::PROVIDER_FAILED);
    CHECK(status.error().message().find("HTTP 500") != std::string::npos);

    auto scheme = split_endpoint("ftp://example.com/x");
    CHECK(scheme.isErr());
    auto parts = split_endpoint("http://localhost:3001");
    REQUIRE(parts.isOk());
    CHECK(parts.value().scheme_host_port == "http://localhost:3001");
    CHECK(parts.value().path == "/");
}

TEST_CASE("the example config serves the weather dashboard") {
    auto parsed = load_broker_config(CBROKER_EXAMPLE_CONFIG);
    REQUIRE(parsed.ok);
    CHECK(parsed.warnings.empty());

    ContractRegistry registry(std::make_shared<FileSchemaStore>(), parsed.config.schema_base);
    auto applied = apply_startup_entries(parsed.config, registry);
    REQUIRE(applied.isOk());

    SandboxLimits limits = parsed.config.sandbox;
    limits.helper_path = sandbox_helper_path();
    SandboxExecutor sandbox(limits);
    FakeProviderClient client;
    TransformationEngine engine(registry, sandbox, &client);
    RequestRouter router(registry, engine, client);
    ProtocolServer protocol(registry, engine, router);

    auto consumer = protocol.handle(json::parse(R"({
        "jsonrpc": "2.0", "id": 1, "method": "contract.register",
        "params": {
            "type": "consumer",
            "uri": "ui/dashboard/v2",
            "expectsInputSchemaPath": "schemas/dashboard/expects-input.json",
            "expectsOutputSchemaPath": "schemas/dashboard/expects-output.json"
        }
    })"));
    REQUIRE(consumer.contains("result"));
    REQUIRE(consumer["result"]["providers"].size() == 1);
    CHECK(consumer["result"]["providers"][0]["uri"] == "services/weather/v1");

    auto trace = protocol.handle(json::parse(R"({
        "jsonrpc": "2.0", "id": 2, "method": "contract.test",
        "params": {"from": "ui/dashboard/v2", "to": "services/weather/v1", "testData": {"city": "Tokyo"}}
    })"));
    REQUIRE(trace.contains("result"));
    const auto& steps = trace["result"]["steps"];
    REQUIRE(steps.size() == 4);
    CHECK(steps[1]["data"] == json{{"location", "Tokyo"}});
    CHECK(steps[3]["data"] == json::parse(R"({"temp": 0, "humid": 0, "city": "Tokyo"})"));
    CHECK(client.calls().empty());
}
