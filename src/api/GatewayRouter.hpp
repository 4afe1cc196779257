#pragma once

#include "domain/Errors.hpp"
#include "services/AccountService.hpp"
#include "services/StampLookupService.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sgw::api {

struct HttpReply {
    int status;
    std::string description;
    nlohmann::json body;

    // Wire form of body. Invalid UTF-8 is replaced rather than thrown.
    std::string payload() const;
};

// Maps inbound requests onto the services. Every failure ends here as a
// status code and a {"detail": ...} body; nothing propagates further.
class GatewayRouter {
public:
    static constexpr const char* kStampsPrefix = "/api/v1/stamps/";
    static constexpr const char* kWalletPath = "/api/v1/wallet";
    static constexpr const char* kChequebookPath = "/api/v1/chequebook/address";

    GatewayRouter(const sgw::services::StampLookupService& stamps,
                  const sgw::services::AccountService& accounts);

    HttpReply handle(const std::string& method, const std::string& uri) const;

    static int status_for(sgw::domain::ErrorKind kind);

private:
    HttpReply get_stamp(const std::string& batch_id) const;
    HttpReply get_wallet() const;
    HttpReply get_chequebook() const;

    template <typename Fn>
    HttpReply guarded(const std::string& what, Fn&& fn) const;

    const sgw::services::StampLookupService& stamps_;
    const sgw::services::AccountService& accounts_;
};

} // namespace sgw::api
