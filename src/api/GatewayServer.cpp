#include "api/GatewayServer.hpp"

#include <ixwebsocket/IXSocketTLSOptions.h>

#include <iostream>
#include <stdexcept>

namespace sgw::api {

GatewayServer::GatewayServer(const sgw::config::ServerSettings& server,
                             const sgw::config::TlsSettings& tls,
                             const GatewayRouter& router)
    : server_(server.port, server.host, ix::SocketServer::kDefaultTcpBacklog,
              static_cast<size_t>(server.max_connections))
    , router_(router) {
    if (tls.enabled()) {
        ix::SocketTLSOptions options;
        options.tls = true;
        options.certFile = tls.cert_file;
        options.keyFile = tls.key_file;
        options.caFile = "NONE";  // no client certificates
        server_.setTLSOptions(options);
        tls_enabled_ = true;
    } else if (!tls.cert_file.empty() || !tls.key_file.empty()) {
        std::cerr << "[server] Warning: SSL key/cert file specified but not found. "
                  << "Starting with HTTP." << std::endl;
    }

    server_.setOnConnectionCallback(
        [this](ix::HttpRequestPtr request,
               std::shared_ptr<ix::ConnectionState> /*state*/) -> ix::HttpResponsePtr {
            return on_request(request);
        });
}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::start() {
    auto [ok, error] = server_.listen();
    if (!ok) {
        throw std::runtime_error("Failed to listen: " + error);
    }
    server_.start();
    started_ = true;
}

void GatewayServer::stop() {
    if (started_) {
        server_.stop();
        started_ = false;
    }
}

ix::HttpResponsePtr GatewayServer::on_request(const ix::HttpRequestPtr& request) const {
    HttpReply reply = router_.handle(request->method, request->uri);

    std::cout << "[http] " << request->method << " " << request->uri
              << " -> " << reply.status << std::endl;

    ix::WebSocketHttpHeaders headers;
    headers["Content-Type"] = "application/json";
    return std::make_shared<ix::HttpResponse>(
        reply.status, reply.description, ix::HttpErrorCode::Ok, headers, reply.payload());
}

} // namespace sgw::api
