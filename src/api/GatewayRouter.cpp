#include "api/GatewayRouter.hpp"

#include <cstdint>
#include <iostream>
#include <optional>

using json = nlohmann::json;
using namespace sgw::domain;

namespace sgw::api {

namespace {

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

HttpReply reply(int status, json body) {
    return HttpReply{status, reason_phrase(status), std::move(body)};
}

HttpReply error_reply(int status, const std::string& detail) {
    return reply(status, json{{"detail", detail}});
}

std::string detail_for(const GatewayError& e) {
    switch (e.kind()) {
        case ErrorKind::UpstreamUnreachable:
            return "failed to reach upstream node";
        case ErrorKind::UpstreamTimeout:
            return "upstream node timed out";
        case ErrorKind::UpstreamHttpError:
            return "upstream node returned HTTP " +
                   std::to_string(static_cast<const UpstreamHttpError&>(e).status());
        case ErrorKind::NotFound:
            return e.what();
        case ErrorKind::NormalizationError:
        case ErrorKind::ValidationError:
            return "invalid response from upstream node";
    }
    return "An unexpected error occurred";
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percent_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return std::nullopt;
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string HttpReply::payload() const {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

GatewayRouter::GatewayRouter(const sgw::services::StampLookupService& stamps,
                             const sgw::services::AccountService& accounts)
    : stamps_(stamps)
    , accounts_(accounts) {}

int GatewayRouter::status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UpstreamUnreachable: return 502;
        case ErrorKind::UpstreamTimeout:     return 504;
        case ErrorKind::UpstreamHttpError:   return 502;
        case ErrorKind::NormalizationError:  return 500;
        case ErrorKind::NotFound:            return 404;
        case ErrorKind::ValidationError:     return 500;
    }
    return 500;
}

HttpReply GatewayRouter::handle(const std::string& method, const std::string& uri) const {
    std::string path = uri.substr(0, uri.find_first_of("?#"));

    std::optional<std::string> batch_id;
    if (starts_with(path, kStampsPrefix)) {
        std::string rest = path.substr(std::string(kStampsPrefix).size());
        if (!rest.empty() && rest.back() == '/') rest.pop_back();
        if (rest.empty() || rest.find('/') != std::string::npos) {
            return error_reply(404, "not found");
        }
        batch_id = percent_decode(rest);
        if (!batch_id || batch_id->empty() || !is_valid_utf8(*batch_id)) {
            return error_reply(404, "not found");
        }
    } else if (path != "/" && path != kWalletPath && path != kChequebookPath) {
        return error_reply(404, "not found");
    }

    if (method != "GET") {
        return error_reply(405, "method not allowed");
    }

    if (batch_id) return get_stamp(*batch_id);
    if (path == kWalletPath) return get_wallet();
    if (path == kChequebookPath) return get_chequebook();
    return reply(200, json{{"status", "ok"}, {"service", "stamp-gateway"}});
}

template <typename Fn>
HttpReply GatewayRouter::guarded(const std::string& what, Fn&& fn) const {
    try {
        return reply(200, fn());
    } catch (const GatewayError& e) {
        // Already logged with full context by the service.
        return error_reply(status_for(e.kind()), detail_for(e));
    } catch (const std::exception& e) {
        std::cerr << "[http] unexpected error serving " << what << ": " << e.what() << std::endl;
        return error_reply(500, "An unexpected error occurred");
    }
}

HttpReply GatewayRouter::get_stamp(const std::string& batch_id) const {
    return guarded("stamp " + batch_id, [&] {
        return stamps_.mapper().to_json(stamps_.lookup(batch_id));
    });
}

HttpReply GatewayRouter::get_wallet() const {
    return guarded("wallet", [&] {
        return accounts_.mapper().to_json(accounts_.wallet());
    });
}

HttpReply GatewayRouter::get_chequebook() const {
    return guarded("chequebook", [&] {
        return accounts_.mapper().to_json(accounts_.chequebook());
    });
}

} // namespace sgw::api
