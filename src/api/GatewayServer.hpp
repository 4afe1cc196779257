#pragma once

#include "api/GatewayRouter.hpp"
#include "config/Settings.hpp"

#include <ixwebsocket/IXHttpServer.h>

namespace sgw::api {

// Serves GatewayRouter over ix::HttpServer. Each connection runs on its own
// thread; the router holds no mutable state so no locking is needed.
class GatewayServer {
public:
    GatewayServer(const sgw::config::ServerSettings& server,
                  const sgw::config::TlsSettings& tls,
                  const GatewayRouter& router);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // Binds and starts accepting. Throws std::runtime_error if the bind fails.
    void start();
    void stop();

    bool tls_enabled() const noexcept { return tls_enabled_; }

private:
    ix::HttpResponsePtr on_request(const ix::HttpRequestPtr& request) const;

    ix::HttpServer server_;
    const GatewayRouter& router_;
    bool tls_enabled_{false};
    bool started_{false};
};

} // namespace sgw::api
