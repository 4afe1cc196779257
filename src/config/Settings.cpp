#include "config/Settings.hpp"

#include <ixwebsocket/IXUrlParser.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace sgw::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        size_t consumed = 0;
        int parsed = std::stoi(val, &consumed);
        return consumed == std::string(val).size() ? parsed : fallback;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

bool TlsSettings::enabled() const {
    if (cert_file.empty() || key_file.empty()) return false;
    std::error_code ec;
    return std::filesystem::exists(cert_file, ec) && std::filesystem::exists(key_file, ec);
}

Settings Settings::from_environment() {
    std::string env = env_or("SGW_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.upstream.bee_api_base_url = strip_trailing_slashes(
        env_or("SGW_BEE_API_URL", s.upstream.bee_api_base_url));
    s.upstream.request_timeout_seconds = env_int_or("SGW_REQUEST_TIMEOUT", s.upstream.request_timeout_seconds);
    s.upstream.connect_timeout_seconds = env_int_or("SGW_CONNECT_TIMEOUT", s.upstream.connect_timeout_seconds);
    s.server.host = env_or("SGW_HOST", s.server.host);
    s.server.port = env_int_or("SGW_PORT", s.server.port);
    s.server.max_connections = env_int_or("SGW_MAX_CONNECTIONS", s.server.max_connections);
    s.tls.cert_file = env_or("SGW_SSL_CERTFILE", s.tls.cert_file);
    s.tls.key_file = env_or("SGW_SSL_KEYFILE", s.tls.key_file);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.server.host = "127.0.0.1";
    s.server.max_connections = 32;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.server.host = "0.0.0.0";
    s.server.max_connections = 512;
    s.upstream.connect_timeout_seconds = 3;
    return s;
}

void Settings::validate() const {
    std::string protocol, host, path, query;
    int port = 0;
    if (!ix::UrlParser::parse(upstream.bee_api_base_url, protocol, host, path, query, port)) {
        throw std::invalid_argument(
            "Upstream URL is not a valid URL: '" + upstream.bee_api_base_url + "'");
    }
    if (protocol != "http" && protocol != "https") {
        throw std::invalid_argument(
            "Upstream URL must use http or https, got: '" + protocol + "'");
    }
    if (host.empty()) {
        throw std::invalid_argument("Upstream URL has no host");
    }
    if (upstream.request_timeout_seconds <= 0) {
        throw std::invalid_argument(
            "Request timeout must be positive, got: " + std::to_string(upstream.request_timeout_seconds));
    }
    if (upstream.connect_timeout_seconds <= 0) {
        throw std::invalid_argument(
            "Connect timeout must be positive, got: " + std::to_string(upstream.connect_timeout_seconds));
    }
    if (server.port < 1 || server.port > 65535) {
        throw std::invalid_argument(
            "Server port must be between 1 and 65535, got: " + std::to_string(server.port));
    }
    if (server.max_connections < 1) {
        throw std::invalid_argument(
            "Max connections must be at least 1, got: " + std::to_string(server.max_connections));
    }
}

} // namespace sgw::config
