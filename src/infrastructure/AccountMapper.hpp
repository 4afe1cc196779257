#pragma once

#include "domain/Account.hpp"

#include <nlohmann/json.hpp>

namespace sgw::infrastructure {

class AccountMapper {
public:
    // Throws ValidationError when walletAddress is missing.
    sgw::domain::WalletInfo wallet_from_json(const nlohmann::json& wallet) const;

    // Combines /chequebook/address and /chequebook/balance responses.
    // Throws ValidationError when chequebookAddress is missing.
    sgw::domain::ChequebookInfo chequebook_from_json(const nlohmann::json& address,
                                                     const nlohmann::json& balance) const;

    nlohmann::json to_json(const sgw::domain::WalletInfo& wallet) const;
    nlohmann::json to_json(const sgw::domain::ChequebookInfo& chequebook) const;
};

} // namespace sgw::infrastructure
