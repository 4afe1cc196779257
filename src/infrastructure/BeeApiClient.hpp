#pragma once

#include "config/Settings.hpp"
#include "services/IUpstreamClient.hpp"

#include <ixwebsocket/IXHttp.h>

#include <chrono>
#include <string>

namespace sgw::infrastructure {

class BeeApiClient : public sgw::services::IUpstreamClient {
public:
    explicit BeeApiClient(const sgw::config::UpstreamSettings& settings);
    ~BeeApiClient() override = default;

    nlohmann::json fetch_all_stamps() const override;
    nlohmann::json fetch_wallet() const override;
    nlohmann::json fetch_chequebook_address() const override;
    nlohmann::json fetch_chequebook_balance() const override;

    const std::string& base_url() const override { return settings_.bee_api_base_url; }

    static constexpr const char* kBatchesPath = "/batches";
    static constexpr const char* kWalletPath = "/wallet";
    static constexpr const char* kChequebookAddressPath = "/chequebook/address";
    static constexpr const char* kChequebookBalancePath = "/chequebook/balance";

protected:
    // Performs the HTTP GET. Overridden in tests to avoid real network calls.
    virtual ix::HttpResponsePtr send_get(const std::string& url) const;

private:
    // Single attempt. Classifies the outcome and parses the body.
    nlohmann::json get_json(const char* path) const;
    bool timed_out(ix::HttpErrorCode code, std::chrono::steady_clock::duration elapsed) const;

    sgw::config::UpstreamSettings settings_;
};

} // namespace sgw::infrastructure
