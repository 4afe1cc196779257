#include "infrastructure/BeeApiClient.hpp"

#include "domain/Errors.hpp"

#include <ixwebsocket/IXHttpClient.h>

#include <chrono>
#include <iostream>

using json = nlohmann::json;
using namespace sgw::domain;

namespace sgw::infrastructure {

namespace {

void log_failure(ErrorKind kind, const std::string& url, const std::string& detail) {
    std::cerr << "[upstream] " << to_string(kind) << " url=" << url
              << " detail=" << detail << std::endl;
}

} // namespace

BeeApiClient::BeeApiClient(const sgw::config::UpstreamSettings& settings)
    : settings_(settings) {}

json BeeApiClient::fetch_all_stamps() const {
    return get_json(kBatchesPath);
}

json BeeApiClient::fetch_wallet() const {
    return get_json(kWalletPath);
}

json BeeApiClient::fetch_chequebook_address() const {
    return get_json(kChequebookAddressPath);
}

json BeeApiClient::fetch_chequebook_balance() const {
    return get_json(kChequebookBalancePath);
}

ix::HttpResponsePtr BeeApiClient::send_get(const std::string& url) const {
    ix::HttpClient client;
    auto args = client.createRequest(url);
    args->connectTimeout = settings_.connect_timeout_seconds;
    args->transferTimeout = settings_.request_timeout_seconds;
    args->followRedirects = false;
    args->extraHeaders["Accept"] = "application/json";

    return client.get(url, args);
}

// ix::HttpClient reports an expired deadline as the socket error it cut
// short, so a failure that took the full budget counts as a timeout.
bool BeeApiClient::timed_out(ix::HttpErrorCode code,
                             std::chrono::steady_clock::duration elapsed) const {
    using ix::HttpErrorCode;
    switch (code) {
        case HttpErrorCode::Timeout:
            return true;
        case HttpErrorCode::CannotConnect:
            return elapsed >= std::chrono::seconds(settings_.connect_timeout_seconds);
        case HttpErrorCode::CannotReadStatusLine:
        case HttpErrorCode::HeaderParsingError:
        case HttpErrorCode::CannotReadBody:
        case HttpErrorCode::ChunkReadError:
        case HttpErrorCode::SendError:
        case HttpErrorCode::ReadError:
            return elapsed >= std::chrono::seconds(settings_.request_timeout_seconds);
        default:
            return false;
    }
}

json BeeApiClient::get_json(const char* path) const {
    const std::string url = settings_.bee_api_base_url + path;
    const auto started = std::chrono::steady_clock::now();
    auto response = send_get(url);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (!response) {
        log_failure(ErrorKind::UpstreamUnreachable, url, "no response");
        throw UpstreamUnreachable("upstream unreachable: " + url);
    }

    if (timed_out(response->errorCode, elapsed)) {
        log_failure(ErrorKind::UpstreamTimeout, url, response->errorMsg);
        throw UpstreamTimeout("upstream timed out after " +
                              std::to_string(settings_.request_timeout_seconds) + "s: " + url);
    }

    if (response->errorCode != ix::HttpErrorCode::Ok) {
        log_failure(ErrorKind::UpstreamUnreachable, url, response->errorMsg);
        throw UpstreamUnreachable("upstream unreachable: " + url + " (" + response->errorMsg + ")");
    }

    if (response->statusCode < 200 || response->statusCode >= 300) {
        log_failure(ErrorKind::UpstreamHttpError, url,
                    "status=" + std::to_string(response->statusCode));
        throw UpstreamHttpError(response->statusCode,
                                "upstream returned HTTP " + std::to_string(response->statusCode));
    }

    auto body = json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        log_failure(ErrorKind::NormalizationError, url, "body is not valid JSON");
        throw MalformedUpstreamBody("upstream body is not valid JSON: " + url);
    }
    return body;
}

} // namespace sgw::infrastructure
