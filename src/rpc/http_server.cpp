#include "cbroker/rpc.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace cbroker {

HttpServer::HttpServer(const ProtocolServer& protocol, HttpServerOptions options)
    : protocol_(protocol),
      options_(std::move(options)),
      server_(std::make_unique<httplib::Server>()) {
    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_content("ok", "text/plain");
    });

    server_->Post(options_.rpc_path, [this](const httplib::Request& req, httplib::Response& res) {
        res.status = 200;
        res.set_content(protocol_.handle_body(req.body), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                      std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        spdlog::error("{} {}: {}", req.method, req.path, what);
        res.status = 500;
        res.set_content("internal server error", "text/plain");
    });
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::bind() {
    if (options_.port == 0) {
        bound_port_ = server_->bind_to_any_port(options_.host);
    } else if (server_->bind_to_port(options_.host, options_.port)) {
        bound_port_ = options_.port;
    } else {
        bound_port_ = -1;
    }
    if (bound_port_ < 0) {
        spdlog::error("cannot bind {}:{}", options_.host, options_.port);
        return false;
    }
    return true;
}

bool HttpServer::listen() {
    spdlog::info("listening on http://{}:{}{}", options_.host, bound_port_, options_.rpc_path);
    return server_->listen_after_bind();
}

void HttpServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

} // namespace cbroker
