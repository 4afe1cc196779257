#pragma once

#include <string>

namespace sgw::config {

struct UpstreamSettings {
    std::string bee_api_base_url = "http://localhost:1633";
    int request_timeout_seconds = 10;
    int connect_timeout_seconds = 5;
};

struct ServerSettings {
    std::string host = "127.0.0.1";
    int port = 8000;
    int max_connections = 128;
};

struct TlsSettings {
    std::string cert_file;
    std::string key_file;

    // Both files configured and present on disk.
    bool enabled() const;
};

struct Settings {
    UpstreamSettings upstream;
    ServerSettings server;
    TlsSettings tls;

    static Settings from_environment();
    static Settings development();
    static Settings production();

    // Throws std::invalid_argument describing the first bad setting.
    void validate() const;
};

} // namespace sgw::config
