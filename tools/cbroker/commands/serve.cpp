/**
 * cbroker CLI - serve command
 *
 * Load configuration, apply startup contracts, and serve JSON-RPC over HTTP.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cbroker/provider_client.hpp>
#include <cbroker/registry.hpp>
#include <cbroker/router.hpp>
#include <cbroker/rpc.hpp>
#include <cbroker/sandbox.hpp>
#include <cbroker/transform.hpp>

#include <csignal>
#include <memory>

namespace cbroker::cli::commands {

namespace {

struct ServeOptions {
    std::string config_path;
    std::string host;
    int port = -1;
    std::string schema_base;
};

HttpServer* g_server = nullptr;

void handle_stop_signal(int) {
    // httplib::Server::stop only flips an atomic and shuts the listen socket down.
    if (g_server) g_server->stop();
}

int cmd_serve(const GlobalOptions& opts, const ServeOptions& serve_opts) {
    // Priority: flag > environment > config file > defaults
    BrokerConfig config = default_broker_config();

    std::string config_path = serve_opts.config_path;
    if (config_path.empty()) config_path = safe_getenv("CBROKER_CONFIG");

    if (!config_path.empty()) {
        auto parsed = load_broker_config(config_path);
        if (!parsed.ok) {
            configure_logging(opts);
            print_error("invalid config " + config_path + ": " + parsed.error, opts.json);
            return 1;
        }
        config = std::move(parsed.config);
        configure_logging(opts, config.log_level);
        for (const auto& w : parsed.warnings) {
            spdlog::warn("config {}: {}", config_path, w);
        }
    } else {
        configure_logging(opts, config.log_level);
    }

    for (const auto& w : apply_env_overrides(config, safe_getenv)) {
        spdlog::warn("environment: {}", w);
    }

    if (!serve_opts.host.empty()) config.listen.host = serve_opts.host;
    if (serve_opts.port >= 0) config.listen.port = serve_opts.port;
    if (!serve_opts.schema_base.empty()) config.schema_base = serve_opts.schema_base;

    ContractRegistry registry(std::make_shared<FileSchemaStore>(), config.schema_base);
    SandboxExecutor sandbox(config.sandbox);
    HttpProviderClient client(config.provider);
    TransformationEngine engine(registry, sandbox, &client);
    RequestRouter router(registry, engine, client);
    ProtocolServer protocol(registry, engine, router);

    auto applied = apply_startup_entries(config, registry);
    if (applied.isErr()) {
        print_error("startup entries: " + applied.error().message(), opts.json);
        return 1;
    }

    HttpServerOptions http;
    http.host = config.listen.host;
    http.port = config.listen.port;
    http.rpc_path = config.rpc_path;
    HttpServer server(protocol, http);
    if (!server.bind()) {
        print_error("cannot listen on " + http.host + ":" + std::to_string(http.port), opts.json);
        return 1;
    }

    spdlog::info("sandbox helper: {}", sandbox.limits().helper_path);
    g_server = &server;
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    bool clean = server.listen();
    g_server = nullptr;
    spdlog::info("server stopped");
    return clean ? 0 : 1;
}

} // anonymous namespace

void setup_serve(CLI::App* app, GlobalOptions& opts) {
    static ServeOptions serve_opts;

    app->add_option("-c,--config", serve_opts.config_path, "Broker config file (JSON)");
    app->add_option("--host", serve_opts.host, "Listen address");
    app->add_option("-p,--port", serve_opts.port, "Listen port (0 = any)")->check(CLI::Range(0, 65535));
    app->add_option("--schema-base", serve_opts.schema_base, "Base directory for relative schema paths");

    app->callback([&opts]() {
        std::exit(cmd_serve(opts, serve_opts));
    });
}

} // namespace cbroker::cli::commands
