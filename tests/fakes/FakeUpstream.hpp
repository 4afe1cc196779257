#pragma once

#include "infrastructure/BeeApiClient.hpp"
#include "services/IUpstreamClient.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace sgw::fakes {

// In-memory IUpstreamClient. Answers every fetch with the configured body,
// or throws the configured failure.
class FakeUpstreamClient : public sgw::services::IUpstreamClient {
public:
    nlohmann::json stamps = nlohmann::json::array();
    nlohmann::json wallet = nlohmann::json::object();
    nlohmann::json chequebook_address = nlohmann::json::object();
    nlohmann::json chequebook_balance = nlohmann::json::object();

    template <typename E>
    void fail_with(E error) { failure_ = std::make_exception_ptr(error); }

    int calls() const { return calls_; }

    nlohmann::json fetch_all_stamps() const override { return answer(stamps); }
    nlohmann::json fetch_wallet() const override { return answer(wallet); }
    nlohmann::json fetch_chequebook_address() const override { return answer(chequebook_address); }
    nlohmann::json fetch_chequebook_balance() const override { return answer(chequebook_balance); }

    const std::string& base_url() const override { return base_url_; }

private:
    nlohmann::json answer(const nlohmann::json& body) const {
        ++calls_;
        if (failure_) std::rethrow_exception(failure_);
        return body;
    }

    std::exception_ptr failure_;
    mutable int calls_ = 0;
    std::string base_url_ = "http://fake-bee:1633";
};

// Real BeeApiClient with the network swapped for a canned ix::HttpResponse,
// so classification and parsing run exactly as in production.
class CannedBeeApiClient : public sgw::infrastructure::BeeApiClient {
public:
    CannedBeeApiClient() : BeeApiClient(default_settings()) {}
    explicit CannedBeeApiClient(const sgw::config::UpstreamSettings& settings)
        : BeeApiClient(settings) {}

    static sgw::config::UpstreamSettings default_settings() {
        sgw::config::UpstreamSettings s;
        s.bee_api_base_url = "http://canned-bee:1633";
        return s;
    }

    void respond(int status, std::string body,
                 ix::HttpErrorCode error = ix::HttpErrorCode::Ok,
                 std::string error_msg = "") {
        response_ = std::make_shared<ix::HttpResponse>(
            status, "", error, ix::WebSocketHttpHeaders(), std::move(body));
        response_->errorMsg = std::move(error_msg);
    }

    void respond_with_nothing() { response_ = nullptr; }

    // Holds each request this long before answering, like a stalled node.
    void stall_for(std::chrono::milliseconds delay) { delay_ = delay; }

    mutable std::vector<std::string> requested_urls;

protected:
    ix::HttpResponsePtr send_get(const std::string& url) const override {
        requested_urls.push_back(url);
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        return response_;
    }

private:
    ix::HttpResponsePtr response_;
    std::chrono::milliseconds delay_{0};
};

} // namespace sgw::fakes
