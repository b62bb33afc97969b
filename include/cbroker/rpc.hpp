#pragma once

/**
 * @file rpc.hpp
 * @brief JSON-RPC 2.0 front end of the broker
 *
 * ProtocolServer turns one request body (a request object or a batch array)
 * into one response body. Methods are held in an explicit dispatch table of
 * uniform handlers `params -> Result<json>`; a handler's Error is mapped to
 * exactly one JSON-RPC error code:
 *
 *   INVALID_PARAMS                 -32602  message is the cause
 *   NO_PROVIDER                    -32001  "No compatible provider found"
 *   anything else                  -32603  "Internal error", data.detail = cause
 *
 * Envelope problems use the standard codes -32700, -32600 and -32601.
 */

#include "cbroker/error.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace httplib {
class Server;
}

namespace cbroker {

class ContractRegistry;
class RequestRouter;
class TransformationEngine;

namespace rpc {

constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int NO_PROVIDER = -32001;

nlohmann::json make_response(const nlohmann::json& id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message,
                          const nlohmann::json& data = nullptr);

int code_for(ErrorCode code);

} // namespace rpc

using MethodHandler = std::function<Result<nlohmann::json>(const nlohmann::json& params)>;

// ============================================================================
// Protocol Server
// ============================================================================

class ProtocolServer {
public:
    // Registers the contract.* and transform.* methods.
    ProtocolServer(ContractRegistry& registry,
                   const TransformationEngine& engine,
                   const RequestRouter& router);

    ProtocolServer(const ProtocolServer&) = delete;
    ProtocolServer& operator=(const ProtocolServer&) = delete;

    void add_method(const std::string& name, MethodHandler handler);
    bool has_method(const std::string& name) const;
    std::vector<std::string> methods() const;

    // A request object yields a response object; a non-empty array yields an
    // array of responses in the same order.
    nlohmann::json handle(const nlohmann::json& message) const;

    // Parse, handle and serialize. Unparsable bodies get a -32700 response.
    std::string handle_body(const std::string& body) const;

private:
    nlohmann::json handle_one(const nlohmann::json& request) const;

    Result<nlohmann::json> contract_register(const nlohmann::json& params);
    Result<nlohmann::json> contract_test(const nlohmann::json& params) const;
    Result<nlohmann::json> contract_call(const nlohmann::json& params) const;
    Result<nlohmann::json> contract_get(const nlohmann::json& params) const;
    Result<nlohmann::json> contract_list(const nlohmann::json& params) const;
    Result<nlohmann::json> transform_register(const nlohmann::json& params);

    ContractRegistry& registry_;
    const TransformationEngine& engine_;
    const RequestRouter& router_;
    std::map<std::string, MethodHandler> methods_;
};

// ============================================================================
// HTTP Transport
// ============================================================================

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    int port = 8000;        // 0 = pick any free port
    std::string rpc_path = "/rpc";
};

/**
 * @brief Serves a ProtocolServer over HTTP with cpp-httplib.
 *
 * POST <rpc_path> carries JSON-RPC; GET /health answers "ok". Every
 * application-level failure is a JSON-RPC error inside a 200 response.
 */
class HttpServer {
public:
    HttpServer(const ProtocolServer& protocol, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind the listening socket. Returns false when the address is unavailable.
    bool bind();

    // Port actually bound (useful with port 0).
    int port() const { return bound_port_; }

    // Serve until stop(). Requires a successful bind().
    bool listen();

    void stop();
    bool is_running() const;

private:
    const ProtocolServer& protocol_;
    HttpServerOptions options_;
    std::unique_ptr<httplib::Server> server_;
    int bound_port_ = -1;
};

} // namespace cbroker
