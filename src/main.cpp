#include "api/GatewayRouter.hpp"
#include "api/GatewayServer.hpp"
#include "config/Settings.hpp"
#include "infrastructure/BeeApiClient.hpp"
#include "services/AccountService.hpp"
#include "services/StampLookupService.hpp"

#include <ixwebsocket/IXNetSystem.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main() {
    auto settings = sgw::config::Settings::from_environment();

    // Bad configuration is the only fatal error.
    try {
        settings.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 1;
    }

    ix::initNetSystem();

    sgw::infrastructure::BeeApiClient upstream(settings.upstream);
    sgw::services::StampLookupService stamps(upstream);
    sgw::services::AccountService accounts(upstream);
    sgw::api::GatewayRouter router(stamps, accounts);
    sgw::api::GatewayServer server(settings.server, settings.tls, router);

    try {
        server.start();
    } catch (const std::runtime_error& e) {
        std::cerr << "[server] " << e.what() << std::endl;
        ix::uninitNetSystem();
        return 1;
    }

    std::cout << "[server] Started " << (server.tls_enabled() ? "HTTPS" : "HTTP")
              << " server on " << settings.server.host << ":" << settings.server.port
              << " upstream=" << upstream.base_url()
              << " timeout=" << settings.upstream.request_timeout_seconds << "s" << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    server.stop();
    ix::uninitNetSystem();
    std::cout << "\n[server] Done." << std::endl;
    return 0;
}
