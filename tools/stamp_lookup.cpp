#include "config/Settings.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/BeeApiClient.hpp"
#include "services/StampLookupService.hpp"

#include <ixwebsocket/IXNetSystem.h>

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

// One-shot lookup against the configured node, without starting a server.
int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: stamp_lookup <batch_id>" << std::endl;
        std::cerr << "       Upstream is read from SGW_BEE_API_URL." << std::endl;
        return 1;
    }

    auto settings = sgw::config::Settings::from_environment();
    try {
        settings.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 1;
    }

    ix::initNetSystem();

    sgw::infrastructure::BeeApiClient upstream(settings.upstream);
    sgw::services::StampLookupService stamps(upstream);

    int exit_code = 0;
    try {
        auto record = stamps.lookup(argv[1]);
        std::cout << stamps.mapper().to_json(record).dump(2) << std::endl;
    } catch (const sgw::domain::GatewayError& e) {
        std::cout << nlohmann::json{{"detail", e.what()}}
                         .dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "[lookup] unexpected error: " << e.what() << std::endl;
        exit_code = 1;
    }

    ix::uninitNetSystem();
    return exit_code;
}
