#pragma once

#include <optional>
#include <string>

namespace sgw::domain {

struct WalletInfo {
    std::string wallet_address;
    std::optional<std::string> bzz_balance;  // wei, as text
};

struct ChequebookInfo {
    std::string chequebook_address;
    std::optional<std::string> available_balance;
    std::optional<std::string> total_balance;
};

} // namespace sgw::domain
