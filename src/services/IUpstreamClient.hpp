#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace sgw::services {

// Read-only view of the storage node's HTTP API. Each call is a single
// request; failures are thrown as domain::GatewayError subclasses.
class IUpstreamClient {
public:
    virtual nlohmann::json fetch_all_stamps() const = 0;
    virtual nlohmann::json fetch_wallet() const = 0;
    virtual nlohmann::json fetch_chequebook_address() const = 0;
    virtual nlohmann::json fetch_chequebook_balance() const = 0;

    // Base URL requests are sent to, for diagnostics.
    virtual const std::string& base_url() const = 0;

    virtual ~IUpstreamClient() = default;
};

} // namespace sgw::services
